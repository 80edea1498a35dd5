#include "errorhandler.h"

#include <QDebug>

#include "models/transferitem.h"

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleStorageError(const QString &operation, const StorageError &error)
{
    handleError(categoryForKind(error.kind),
                severityForKind(error.kind),
                tr("%1 failed").arg(operation),
                error.message);
}

void ErrorHandler::handleTransferFailed(const TransferItem &item)
{
    const QString operation = item.direction == TransferDirection::Upload
        ? tr("Upload of %1").arg(item.key)
        : tr("Download of %1").arg(item.key);
    handleStorageError(operation, StorageError{item.errorKind, item.errorMessage});
}

void ErrorHandler::handleValidationError(const QString &message)
{
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Warning,
                tr("Invalid input"),
                message);
}

ErrorCategory ErrorHandler::categoryForKind(StorageError::Kind kind)
{
    switch (kind) {
    case StorageError::Kind::Transport:
    case StorageError::Kind::Authorization:
        return ErrorCategory::Connection;
    case StorageError::Kind::NotFound:
    case StorageError::Kind::LocalFilesystem:
        return ErrorCategory::FileOperation;
    case StorageError::Kind::Unknown:
        return ErrorCategory::System;
    }
    return ErrorCategory::System;
}

ErrorSeverity ErrorHandler::severityForKind(StorageError::Kind kind)
{
    switch (kind) {
    case StorageError::Kind::Transport:
    case StorageError::Kind::Authorization:
        return ErrorSeverity::Critical;
    case StorageError::Kind::NotFound:
    case StorageError::Kind::LocalFilesystem:
    case StorageError::Kind::Unknown:
        return ErrorSeverity::Warning;
    }
    return ErrorSeverity::Warning;
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
