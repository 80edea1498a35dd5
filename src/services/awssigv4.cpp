#include "awssigv4.h"

#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <QUrl>
#include <algorithm>

namespace {

QByteArray hmacSha256(const QByteArray &key, const QByteArray &message)
{
    return QMessageAuthenticationCode::hash(message, key, QCryptographicHash::Sha256);
}

} // namespace

QByteArray AwsSigV4::sha256Hex(const QByteArray &data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex();
}

QByteArray AwsSigV4::emptyPayloadHash()
{
    static const QByteArray hash = sha256Hex(QByteArray());
    return hash;
}

QByteArray AwsSigV4::amzDate(const QDateTime &timestamp)
{
    return timestamp.toUTC().toString("yyyyMMdd'T'HHmmss'Z'").toLatin1();
}

QByteArray AwsSigV4::encodePath(const QString &path)
{
    QString absolute = path.startsWith('/') ? path : '/' + path;
    return QUrl::toPercentEncoding(absolute, "/");
}

QByteArray AwsSigV4::canonicalQuery(const QList<QPair<QString, QString>> &query)
{
    QList<QPair<QByteArray, QByteArray>> encoded;
    encoded.reserve(query.size());
    for (const auto &param : query) {
        encoded.append({QUrl::toPercentEncoding(param.first),
                        QUrl::toPercentEncoding(param.second)});
    }
    std::sort(encoded.begin(), encoded.end());

    QByteArray result;
    for (const auto &param : encoded) {
        if (!result.isEmpty()) {
            result += '&';
        }
        result += param.first + '=' + param.second;
    }
    return result;
}

QByteArray AwsSigV4::signedHeaders(const HeaderMap &headers)
{
    QByteArray result;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        if (!result.isEmpty()) {
            result += ';';
        }
        result += it.key();
    }
    return result;
}

QByteArray AwsSigV4::canonicalRequest(const QByteArray &method,
                                      const QByteArray &encodedPath,
                                      const QByteArray &canonicalQueryString,
                                      const HeaderMap &headers,
                                      const QByteArray &payloadHash)
{
    QByteArray canonicalHeaders;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        canonicalHeaders += it.key() + ':' + it.value().trimmed() + '\n';
    }

    return method + '\n' +
           encodedPath + '\n' +
           canonicalQueryString + '\n' +
           canonicalHeaders + '\n' +
           signedHeaders(headers) + '\n' +
           payloadHash;
}

QByteArray AwsSigV4::credentialScope(const QDateTime &timestamp, const Credentials &credentials)
{
    return timestamp.toUTC().toString("yyyyMMdd").toLatin1() + '/' +
           credentials.region.toLatin1() + '/' +
           credentials.service.toLatin1() + "/aws4_request";
}

QByteArray AwsSigV4::stringToSign(const QDateTime &timestamp,
                                  const Credentials &credentials,
                                  const QByteArray &canonicalRequest)
{
    return QByteArray("AWS4-HMAC-SHA256\n") +
           amzDate(timestamp) + '\n' +
           credentialScope(timestamp, credentials) + '\n' +
           sha256Hex(canonicalRequest);
}

QByteArray AwsSigV4::signingKey(const QString &secretAccessKey,
                                const QDate &date,
                                const QString &region,
                                const QString &service)
{
    QByteArray key = hmacSha256("AWS4" + secretAccessKey.toUtf8(),
                                date.toString("yyyyMMdd").toLatin1());
    key = hmacSha256(key, region.toLatin1());
    key = hmacSha256(key, service.toLatin1());
    return hmacSha256(key, "aws4_request");
}

QByteArray AwsSigV4::authorization(const Credentials &credentials,
                                   const QByteArray &method,
                                   const QByteArray &encodedPath,
                                   const QByteArray &canonicalQueryString,
                                   const HeaderMap &headers,
                                   const QByteArray &payloadHash,
                                   const QDateTime &timestamp)
{
    QByteArray request = canonicalRequest(method, encodedPath, canonicalQueryString,
                                          headers, payloadHash);
    QByteArray toSign = stringToSign(timestamp, credentials, request);
    QByteArray key = signingKey(credentials.secretAccessKey, timestamp.toUTC().date(),
                                credentials.region, credentials.service);
    QByteArray signature = hmacSha256(key, toSign).toHex();

    return "AWS4-HMAC-SHA256 Credential=" + credentials.accessKeyId.toLatin1() + '/' +
           credentialScope(timestamp, credentials) +
           ", SignedHeaders=" + signedHeaders(headers) +
           ", Signature=" + signature;
}
