#include "storageerror.h"

#include <QXmlStreamReader>

StorageError StorageError::fromHttp(int httpStatus, const QString &s3Code,
                                    const QString &message)
{
    static const QStringList authCodes = {
        QStringLiteral("AccessDenied"),
        QStringLiteral("InvalidAccessKeyId"),
        QStringLiteral("SignatureDoesNotMatch"),
        QStringLiteral("ExpiredToken"),
        QStringLiteral("InvalidToken"),
        QStringLiteral("AllAccessDisabled")
    };
    static const QStringList notFoundCodes = {
        QStringLiteral("NoSuchKey"),
        QStringLiteral("NoSuchBucket"),
        QStringLiteral("NotFound")
    };

    if (authCodes.contains(s3Code) || httpStatus == 401 || httpStatus == 403) {
        return authorization(message);
    }
    if (notFoundCodes.contains(s3Code) || httpStatus == 404) {
        return notFound(message);
    }
    return unknown(message);
}

bool StorageError::parseS3ErrorBody(const QByteArray &body, QString *code, QString *message)
{
    if (body.isEmpty()) {
        return false;
    }

    QXmlStreamReader xml(body);
    bool inError = false;
    bool found = false;

    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }
        const auto name = xml.name();
        if (name == QLatin1String("Error")) {
            inError = true;
            found = true;
        } else if (inError && name == QLatin1String("Code")) {
            QString text = xml.readElementText();
            if (code) {
                *code = text;
            }
        } else if (inError && name == QLatin1String("Message")) {
            QString text = xml.readElementText();
            if (message) {
                *message = text;
            }
        }
    }

    return found && !xml.hasError();
}

QString StorageError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Transport:
        return QStringLiteral("transport");
    case Kind::Authorization:
        return QStringLiteral("authorization");
    case Kind::NotFound:
        return QStringLiteral("not-found");
    case Kind::LocalFilesystem:
        return QStringLiteral("local-filesystem");
    case Kind::Unknown:
        return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

QString StorageError::toString() const
{
    return QString("%1: %2").arg(kindName(kind), message);
}
