/**
 * @file awssigv4.h
 * @brief AWS Signature Version 4 request signing.
 */

#ifndef AWSSIGV4_H
#define AWSSIGV4_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>

/**
 * @brief Computes SigV4 signatures for S3-compatible requests.
 *
 * All inputs are expected in their canonical form: the path already
 * URI-encoded, header names lower-case. Helpers for producing those forms are
 * provided. Header maps are ordered by name, which is the order SigV4 needs.
 */
class AwsSigV4
{
public:
    /// Payload hash used for streamed bodies that are not hashed up front
    static constexpr const char *UnsignedPayload = "UNSIGNED-PAYLOAD";

    struct Credentials {
        QString accessKeyId;
        QString secretAccessKey;
        QString region = QStringLiteral("us-east-1");
        QString service = QStringLiteral("s3");
    };

    /// Lower-case header name -> trimmed value
    using HeaderMap = QMap<QByteArray, QByteArray>;

    /// Hex-encoded SHA-256 of @p data
    [[nodiscard]] static QByteArray sha256Hex(const QByteArray &data);

    /// Hex-encoded SHA-256 of the empty string
    [[nodiscard]] static QByteArray emptyPayloadHash();

    /// "yyyyMMddTHHmmssZ" for the x-amz-date header
    [[nodiscard]] static QByteArray amzDate(const QDateTime &timestamp);

    /// URI-encodes an object path, leaving '/' separators intact
    [[nodiscard]] static QByteArray encodePath(const QString &path);

    /// Sorted, URI-encoded query string
    [[nodiscard]] static QByteArray canonicalQuery(const QList<QPair<QString, QString>> &query);

    /// "host;range;x-amz-date" style list of signed header names
    [[nodiscard]] static QByteArray signedHeaders(const HeaderMap &headers);

    [[nodiscard]] static QByteArray canonicalRequest(const QByteArray &method,
                                                     const QByteArray &encodedPath,
                                                     const QByteArray &canonicalQueryString,
                                                     const HeaderMap &headers,
                                                     const QByteArray &payloadHash);

    [[nodiscard]] static QByteArray stringToSign(const QDateTime &timestamp,
                                                 const Credentials &credentials,
                                                 const QByteArray &canonicalRequest);

    /// Raw (binary) signing key for the date, region and service
    [[nodiscard]] static QByteArray signingKey(const QString &secretAccessKey,
                                               const QDate &date,
                                               const QString &region,
                                               const QString &service);

    /**
     * @brief Builds the Authorization header value for a request.
     * @param headers Every header to sign, including host, x-amz-date and
     *        x-amz-content-sha256.
     */
    [[nodiscard]] static QByteArray authorization(const Credentials &credentials,
                                                  const QByteArray &method,
                                                  const QByteArray &encodedPath,
                                                  const QByteArray &canonicalQueryString,
                                                  const HeaderMap &headers,
                                                  const QByteArray &payloadHash,
                                                  const QDateTime &timestamp);

private:
    [[nodiscard]] static QByteArray credentialScope(const QDateTime &timestamp,
                                                    const Credentials &credentials);
};

#endif // AWSSIGV4_H
