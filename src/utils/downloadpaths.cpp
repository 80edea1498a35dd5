#include "downloadpaths.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QRegularExpression>
#include <QStandardPaths>

#include "logging.h"

QString DownloadPaths::resolveDownloadDirectory(const QString &preferred, QString *errorMessage)
{
    if (!preferred.isEmpty()) {
        if (ensureWritableDirectory(preferred)) {
            return QDir(preferred).absolutePath();
        }
        if (errorMessage) {
            *errorMessage = QObject::tr("Cannot create download directory '%1'").arg(preferred);
        }
        return QString();
    }

    const QStringList candidates = {
        QStandardPaths::writableLocation(QStandardPaths::DownloadLocation),
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
    };

    for (const QString &candidate : candidates) {
        if (candidate.isEmpty()) {
            continue;
        }
        if (ensureWritableDirectory(candidate)) {
            LOG_VERBOSE() << "DownloadPaths: using" << candidate;
            return QDir(candidate).absolutePath();
        }
        qWarning() << "DownloadPaths: cannot use" << candidate;
    }

    if (errorMessage) {
        *errorMessage = QObject::tr("No writable download directory available");
    }
    return QString();
}

bool DownloadPaths::ensureWritableDirectory(const QString &path)
{
    if (!QDir().mkpath(path)) {
        return false;
    }
    QFileInfo info(path);
    return info.isDir() && info.isWritable();
}

QString DownloadPaths::sanitizeFileName(const QString &name)
{
    static const QRegularExpression disallowed(QStringLiteral("[^A-Za-z0-9_\\s.-]"));

    QString sanitized = name;
    sanitized.replace(disallowed, QStringLiteral("_"));
    if (sanitized.trimmed().isEmpty() || sanitized == "." || sanitized == "..") {
        return QString::fromLatin1(FallbackFileName);
    }
    return sanitized;
}

QString DownloadPaths::uniqueFilePath(const QString &directory, const QString &fileName)
{
    QDir dir(directory);
    QString candidate = dir.filePath(fileName);
    if (!QFileInfo::exists(candidate)) {
        return candidate;
    }

    int dot = static_cast<int>(fileName.lastIndexOf('.'));
    QString base = dot > 0 ? fileName.left(dot) : fileName;
    QString extension = dot > 0 ? fileName.mid(dot) : QString();

    for (int n = 1;; ++n) {
        candidate = dir.filePath(QString("%1 (%2)%3").arg(base, QString::number(n), extension));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}
