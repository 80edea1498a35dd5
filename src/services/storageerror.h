/**
 * @file storageerror.h
 * @brief Error taxonomy for storage and local file operations.
 */

#ifndef STORAGEERROR_H
#define STORAGEERROR_H

#include <QByteArray>
#include <QMetaType>
#include <QString>

/**
 * @brief A failed storage or filesystem operation.
 *
 * Every failure surfaced to a transfer item is one of these. The kind drives
 * how the failure is logged and presented; the message is what the user sees.
 */
struct StorageError {
    enum class Kind {
        Transport,        ///< Network unreachable, DNS, TLS, timeout
        Authorization,    ///< Invalid or insufficient credentials
        NotFound,         ///< Bucket or key does not exist
        LocalFilesystem,  ///< Local directory/file could not be created, opened or written
        Unknown           ///< Anything else, raw description kept
    };

    Kind kind = Kind::Unknown;
    QString message;

    [[nodiscard]] static StorageError transport(const QString &message)
    {
        return {Kind::Transport, message};
    }
    [[nodiscard]] static StorageError authorization(const QString &message)
    {
        return {Kind::Authorization, message};
    }
    [[nodiscard]] static StorageError notFound(const QString &message)
    {
        return {Kind::NotFound, message};
    }
    [[nodiscard]] static StorageError localFilesystem(const QString &message)
    {
        return {Kind::LocalFilesystem, message};
    }
    [[nodiscard]] static StorageError unknown(const QString &message)
    {
        return {Kind::Unknown, message};
    }

    /**
     * @brief Classifies an HTTP failure from an S3-compatible endpoint.
     * @param httpStatus HTTP status code (0 if no response was received).
     * @param s3Code The `<Code>` element of the S3 error body, if any.
     * @param message Human-readable description.
     */
    [[nodiscard]] static StorageError fromHttp(int httpStatus,
                                               const QString &s3Code,
                                               const QString &message);

    /**
     * @brief Extracts `<Code>` and `<Message>` from an S3 XML error body.
     * @return True if the body was an S3 error document.
     */
    static bool parseS3ErrorBody(const QByteArray &body, QString *code, QString *message);

    /// Short name of the kind, for logs ("transport", "authorization", ...)
    [[nodiscard]] static QString kindName(Kind kind);

    /// "<kind>: <message>" for log lines
    [[nodiscard]] QString toString() const;
};

Q_DECLARE_METATYPE(StorageError)

#endif // STORAGEERROR_H
