#include "s3storageclient.h"

#include <QDateTime>
#include <QIODevice>
#include <QNetworkRequest>
#include <QXmlStreamReader>
#include <algorithm>

#include "utils/logging.h"

namespace {

QByteArray hostHeader(const QUrl &url)
{
    QByteArray host = url.host().toLatin1();
    int port = url.port();
    int defaultPort = url.scheme() == "https" ? 443 : 80;
    if (port != -1 && port != defaultPort) {
        host += ':' + QByteArray::number(port);
    }
    return host;
}

} // namespace

S3StorageClient::S3StorageClient(const ServerConfig &config, QObject *parent)
    : S3StorageClient(config,
                      !QUrl(config.address).host().endsWith("amazonaws.com"),
                      config.region.isEmpty() ? QString(DefaultRegion) : config.region,
                      parent)
{
}

S3StorageClient::S3StorageClient(const ServerConfig &config, bool pathStyle,
                                 const QString &region, QObject *parent)
    : IStorageClient(parent)
    , networkManager_(new QNetworkAccessManager(this))
    , config_(config)
    , endpoint_(config.address)
    , pathStyle_(pathStyle)
{
    credentials_.accessKeyId = config.accessKeyId;
    credentials_.secretAccessKey = config.secretAccessKey;
    credentials_.region = region;

    LOG_VERBOSE() << "S3StorageClient: endpoint" << endpoint_.toString()
                  << "bucket" << config_.bucket
                  << "region" << region
                  << (pathStyle_ ? "path-style" : "virtual-host");
}

S3StorageClient::~S3StorageClient() = default;

// Addressing

QString S3StorageClient::resourcePath(const QString &key) const
{
    if (pathStyle_) {
        return key.isEmpty() ? '/' + config_.bucket : '/' + config_.bucket + '/' + key;
    }
    return '/' + key;
}

QByteArray S3StorageClient::origin() const
{
    QByteArray result = endpoint_.scheme().toLatin1() + "://";
    if (!pathStyle_) {
        result += config_.bucket.toLatin1() + '.';
    }
    result += endpoint_.host().toLatin1();
    if (endpoint_.port() != -1) {
        result += ':' + QByteArray::number(endpoint_.port());
    }
    return result;
}

QUrl S3StorageClient::objectUrl(const QString &key,
                                const QList<QPair<QString, QString>> &query) const
{
    QByteArray encoded = origin() + AwsSigV4::encodePath(resourcePath(key));
    QByteArray queryString = AwsSigV4::canonicalQuery(query);
    if (!queryString.isEmpty()) {
        encoded += '?' + queryString;
    }
    return QUrl::fromEncoded(encoded);
}

QString S3StorageClient::getFileUrl(const QString &key) const
{
    if (config_.cdnUrl.isEmpty()) {
        return objectUrl(key).toString(QUrl::FullyEncoded);
    }

    // A CDN serves the bucket at its root
    QString base = config_.cdnUrl;
    while (base.endsWith('/')) {
        base.chop(1);
    }
    return base + QString::fromLatin1(AwsSigV4::encodePath(key));
}

// Request plumbing

QNetworkReply *S3StorageClient::sendRequest(const QByteArray &method,
                                            const QString &key,
                                            const QList<QPair<QString, QString>> &query,
                                            const QByteArray &payloadHash,
                                            const QList<QPair<QByteArray, QByteArray>> &extraHeaders,
                                            QIODevice *bodyDevice,
                                            const QByteArray &bodyData)
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const QByteArray encodedPath = AwsSigV4::encodePath(resourcePath(key));
    const QByteArray queryString = AwsSigV4::canonicalQuery(query);
    const QUrl url = objectUrl(key, query);

    AwsSigV4::HeaderMap headers;
    headers["host"] = hostHeader(url);
    headers["x-amz-content-sha256"] = payloadHash;
    headers["x-amz-date"] = AwsSigV4::amzDate(now);
    for (const auto &header : extraHeaders) {
        headers[header.first.toLower()] = header.second;
    }

    QNetworkRequest request(url);
    request.setTransferTimeout(RequestTimeoutMs);
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        if (it.key() != "host") {
            request.setRawHeader(it.key(), it.value());
        }
    }
    request.setRawHeader("Authorization",
                         AwsSigV4::authorization(credentials_, method, encodedPath,
                                                 queryString, headers, payloadHash, now));

    LOG_VERBOSE() << "S3StorageClient:" << method << url.toString();

    if (method == "GET") {
        return networkManager_->get(request);
    }
    if (method == "DELETE") {
        return networkManager_->deleteResource(request);
    }
    if (method == "PUT") {
        if (bodyDevice) {
            return networkManager_->put(request, bodyDevice);
        }
        return networkManager_->put(request, bodyData);
    }
    return networkManager_->sendCustomRequest(request, method, bodyData);
}

void S3StorageClient::track(QNetworkReply *networkReply, StorageReply *reply,
                            BodyHandler onSuccess, bool streamBody)
{
    PendingTransfer transfer;
    transfer.reply = reply;
    transfer.onSuccess = std::move(onSuccess);
    transfer.streamBody = streamBody;
    pending_.insert(networkReply, transfer);

    connect(networkReply, &QNetworkReply::finished,
            this, [this, networkReply]() { onReplyFinished(networkReply); });

    if (streamBody) {
        connect(networkReply, &QNetworkReply::readyRead,
                this, [this, networkReply]() { onReadyRead(networkReply); });
        connect(networkReply, &QNetworkReply::downloadProgress,
                reply, [reply, networkReply](qint64 received, qint64 total) {
                    if (isSuccessStatus(networkReply)) {
                        reply->reportProgress(received, total);
                    }
                });
    } else {
        connect(networkReply, &QNetworkReply::uploadProgress,
                reply, [reply](qint64 sent, qint64 total) {
                    if (total > 0) {
                        reply->reportProgress(sent, total);
                    }
                });
    }
}

bool S3StorageClient::isSuccessStatus(QNetworkReply *networkReply)
{
    int status = networkReply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    return status >= 200 && status < 300;
}

void S3StorageClient::onReadyRead(QNetworkReply *networkReply)
{
    // Error bodies stay buffered so onReplyFinished() can parse them
    if (!isSuccessStatus(networkReply)) {
        return;
    }

    auto it = pending_.find(networkReply);
    if (it == pending_.end() || !it->reply) {
        return;
    }
    it->reply->deliverChunk(networkReply->readAll());
}

void S3StorageClient::onReplyFinished(QNetworkReply *networkReply)
{
    networkReply->deleteLater();

    PendingTransfer transfer = pending_.take(networkReply);
    if (!transfer.reply) {
        return;
    }

    const int status = networkReply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    QByteArray body = networkReply->readAll();

    if (networkReply->error() != QNetworkReply::NoError) {
        StorageError error = classifyReply(networkReply->error(), status, body,
                                           networkReply->errorString());
        qWarning() << "S3StorageClient:" << transfer.reply->operation()
                   << transfer.reply->key() << "failed -" << error.toString();
        transfer.reply->finishWithError(error);
        return;
    }

    if (transfer.streamBody) {
        transfer.reply->deliverChunk(body);
        body.clear();
    }

    if (transfer.onSuccess) {
        transfer.onSuccess(transfer.reply, body);
    } else {
        transfer.reply->finishWithSuccess();
    }
}

StorageError S3StorageClient::classifyReply(QNetworkReply::NetworkError networkError,
                                            int httpStatus,
                                            const QByteArray &body,
                                            const QString &errorString)
{
    if (httpStatus == 0) {
        switch (networkError) {
        case QNetworkReply::AuthenticationRequiredError:
        case QNetworkReply::ContentAccessDenied:
            return StorageError::authorization(errorString);
        case QNetworkReply::ContentNotFoundError:
            return StorageError::notFound(errorString);
        case QNetworkReply::ConnectionRefusedError:
        case QNetworkReply::RemoteHostClosedError:
        case QNetworkReply::HostNotFoundError:
        case QNetworkReply::TimeoutError:
        case QNetworkReply::OperationCanceledError:
        case QNetworkReply::SslHandshakeFailedError:
        case QNetworkReply::TemporaryNetworkFailureError:
        case QNetworkReply::NetworkSessionFailedError:
        case QNetworkReply::BackgroundRequestNotAllowedError:
        case QNetworkReply::TooManyRedirectsError:
        case QNetworkReply::InsecureRedirectError:
        case QNetworkReply::UnknownNetworkError:
        case QNetworkReply::ProxyConnectionRefusedError:
        case QNetworkReply::ProxyConnectionClosedError:
        case QNetworkReply::ProxyNotFoundError:
        case QNetworkReply::ProxyTimeoutError:
        case QNetworkReply::ProxyAuthenticationRequiredError:
        case QNetworkReply::UnknownProxyError:
            return StorageError::transport(errorString);
        default:
            break;
        }
    }

    QString code;
    QString message;
    QString text;
    if (StorageError::parseS3ErrorBody(body, &code, &message)) {
        if (code.isEmpty()) {
            text = message;
        } else if (message.isEmpty()) {
            text = code;
        } else {
            text = QString("%1: %2").arg(code, message);
        }
    } else if (!body.isEmpty()) {
        text = errorString + " - Response: " +
               QString::fromUtf8(body).left(ErrorResponsePreviewLength);
    } else {
        text = errorString;
    }

    if (httpStatus > 0) {
        text = QString("%1 (HTTP %2)").arg(text).arg(httpStatus);
    }

    return StorageError::fromHttp(httpStatus, code, text);
}

// Listing

bool S3StorageClient::parseListObjectsResponse(const QByteArray &xml,
                                               QList<StorageEntry> *entries,
                                               QString *nextToken)
{
    QXmlStreamReader reader(xml);
    QList<StorageEntry> folders;
    QList<StorageEntry> objects;
    StorageEntry current;
    bool inContents = false;
    bool inCommonPrefixes = false;
    bool sawRoot = false;
    bool truncated = false;
    QString token;

    while (!reader.atEnd()) {
        reader.readNext();

        if (reader.isStartElement()) {
            const auto name = reader.name();
            if (name == QLatin1String("ListBucketResult")) {
                sawRoot = true;
            } else if (name == QLatin1String("Contents")) {
                inContents = true;
                current = StorageEntry();
            } else if (name == QLatin1String("CommonPrefixes")) {
                inCommonPrefixes = true;
                current = StorageEntry();
                current.isDirectory = true;
            } else if (inContents && name == QLatin1String("Key")) {
                current.key = reader.readElementText();
            } else if (inContents && name == QLatin1String("Size")) {
                current.size = reader.readElementText().toLongLong();
            } else if (inContents && name == QLatin1String("LastModified")) {
                current.lastModified = QDateTime::fromString(reader.readElementText(),
                                                             Qt::ISODateWithMs);
            } else if (inContents && name == QLatin1String("ETag")) {
                QString eTag = reader.readElementText();
                eTag.remove('"');
                current.eTag = eTag;
            } else if (inCommonPrefixes && name == QLatin1String("Prefix")) {
                current.key = reader.readElementText();
            } else if (!inContents && !inCommonPrefixes &&
                       name == QLatin1String("IsTruncated")) {
                truncated = reader.readElementText() == QLatin1String("true");
            } else if (name == QLatin1String("NextContinuationToken")) {
                token = reader.readElementText();
            }
        } else if (reader.isEndElement()) {
            const auto name = reader.name();
            if (name == QLatin1String("Contents")) {
                inContents = false;
                objects.append(current);
            } else if (name == QLatin1String("CommonPrefixes")) {
                inCommonPrefixes = false;
                folders.append(current);
            }
        }
    }

    if (reader.hasError() || !sawRoot) {
        return false;
    }

    if (entries) {
        *entries = folders + objects;
    }
    if (nextToken) {
        *nextToken = truncated ? token : QString();
    }
    return true;
}

void S3StorageClient::listPages(StorageReply *reply, const QString &prefix, bool delimited,
                                const QString &continuationToken,
                                const QList<StorageEntry> &collected,
                                int maxKeys, const ListHandler &onComplete)
{
    QList<QPair<QString, QString>> query;
    query.append({QStringLiteral("list-type"), QStringLiteral("2")});
    if (delimited) {
        query.append({QStringLiteral("delimiter"), QStringLiteral("/")});
    }
    if (!prefix.isEmpty()) {
        query.append({QStringLiteral("prefix"), prefix});
    }
    if (maxKeys > 0) {
        query.append({QStringLiteral("max-keys"), QString::number(maxKeys)});
    }
    if (!continuationToken.isEmpty()) {
        query.append({QStringLiteral("continuation-token"), continuationToken});
    }

    QNetworkReply *networkReply = sendRequest("GET", QString(), query,
                                              AwsSigV4::emptyPayloadHash(), {});
    track(networkReply, reply,
          [this, prefix, delimited, collected, maxKeys, onComplete](StorageReply *r,
                                                                     const QByteArray &body) {
              QList<StorageEntry> page;
              QString next;
              if (!parseListObjectsResponse(body, &page, &next)) {
                  r->finishWithError(StorageError::unknown(
                      tr("Malformed listing response for '%1'").arg(prefix)));
                  return;
              }

              QList<StorageEntry> all = collected + page;
              if (!next.isEmpty() && maxKeys == 0) {
                  listPages(r, prefix, delimited, next, all, maxKeys, onComplete);
                  return;
              }

              // Pages each list folders first; keep that order across pages
              std::stable_partition(all.begin(), all.end(),
                                    [](const StorageEntry &e) { return e.isDirectory; });
              onComplete(r, all);
          });
}

StorageReply *S3StorageClient::listObjects(const QString &prefix)
{
    auto *reply = new StorageReply("list", prefix, this);
    listPages(reply, prefix, true, QString(), {}, 0,
              [prefix](StorageReply *r, const QList<StorageEntry> &entries) {
                  QList<StorageEntry> visible;
                  for (const StorageEntry &entry : entries) {
                      // The folder marker object of the listed prefix itself
                      if (!prefix.isEmpty() && entry.key == prefix) {
                          continue;
                      }
                      visible.append(entry);
                  }
                  r->setEntries(visible);
                  r->finishWithSuccess();
              });
    return reply;
}

StorageReply *S3StorageClient::testConnection()
{
    auto *reply = new StorageReply("test", QString(), this);
    listPages(reply, QString(), true, QString(), {}, 1,
              [](StorageReply *r, const QList<StorageEntry> &) {
                  r->finishWithSuccess();
              });
    return reply;
}

// Transfers

StorageReply *S3StorageClient::uploadStream(const QString &key, QIODevice *source,
                                            qint64 size, const QString &contentType)
{
    auto *reply = new StorageReply("upload", key, this);

    if (!source || !source->isReadable()) {
        // Deferred so the caller has connected to finished() by then
        StorageError error = StorageError::localFilesystem(
            tr("Upload source for '%1' is not readable").arg(key));
        QMetaObject::invokeMethod(reply, [reply, error]() {
            reply->finishWithError(error);
        }, Qt::QueuedConnection);
        return reply;
    }

    QList<QPair<QByteArray, QByteArray>> headers;
    headers.append({"content-length", QByteArray::number(size)});
    if (!contentType.isEmpty()) {
        headers.append({"content-type", contentType.toLatin1()});
    }

    QNetworkReply *networkReply = sendRequest("PUT", key, {}, AwsSigV4::UnsignedPayload,
                                              headers, source);
    track(networkReply, reply);
    return reply;
}

StorageReply *S3StorageClient::downloadStream(const QString &key)
{
    auto *reply = new StorageReply("download", key, this);
    QNetworkReply *networkReply = sendRequest("GET", key, {}, AwsSigV4::emptyPayloadHash(), {});
    track(networkReply, reply, nullptr, true);
    return reply;
}

// Object operations

StorageReply *S3StorageClient::deleteObject(const QString &key)
{
    auto *reply = new StorageReply("delete", key, this);
    QNetworkReply *networkReply = sendRequest("DELETE", key, {},
                                              AwsSigV4::emptyPayloadHash(), {});
    track(networkReply, reply);
    return reply;
}

void S3StorageClient::deleteNext(StorageReply *reply, QList<StorageEntry> remaining)
{
    if (remaining.isEmpty()) {
        reply->finishWithSuccess();
        return;
    }

    const StorageEntry entry = remaining.takeFirst();
    QNetworkReply *networkReply = sendRequest("DELETE", entry.key, {},
                                              AwsSigV4::emptyPayloadHash(), {});
    track(networkReply, reply,
          [this, remaining](StorageReply *r, const QByteArray &) {
              deleteNext(r, remaining);
          });
}

StorageReply *S3StorageClient::deleteFolder(const QString &folderPath)
{
    const QString folder = folderPath.endsWith('/') ? folderPath : folderPath + '/';
    auto *reply = new StorageReply("deleteFolder", folder, this);

    listPages(reply, folder, false, QString(), {}, 0,
              [this](StorageReply *r, const QList<StorageEntry> &entries) {
                  LOG_VERBOSE() << "S3StorageClient: deleting" << entries.size()
                                << "objects under" << r->key();
                  deleteNext(r, entries);
              });
    return reply;
}

StorageReply *S3StorageClient::renameObject(const QString &oldKey, const QString &newKey)
{
    auto *reply = new StorageReply("rename", oldKey, this);

    QList<QPair<QByteArray, QByteArray>> headers;
    headers.append({"x-amz-copy-source", AwsSigV4::encodePath(config_.bucket + '/' + oldKey)});

    QNetworkReply *networkReply = sendRequest("PUT", newKey, {},
                                              AwsSigV4::emptyPayloadHash(), headers);
    track(networkReply, reply,
          [this, oldKey](StorageReply *r, const QByteArray &body) {
              // CopyObject can report failure inside a 200 response
              QString code;
              QString message;
              if (StorageError::parseS3ErrorBody(body, &code, &message)) {
                  r->finishWithError(StorageError::fromHttp(
                      0, code, code.isEmpty() ? message : QString("%1: %2").arg(code, message)));
                  return;
              }

              QNetworkReply *deleteReply = sendRequest("DELETE", oldKey, {},
                                                       AwsSigV4::emptyPayloadHash(), {});
              track(deleteReply, r);
          });
    return reply;
}

StorageReply *S3StorageClient::createFolder(const QString &folderPath)
{
    const QString folder = folderPath.endsWith('/') ? folderPath : folderPath + '/';
    auto *reply = new StorageReply("createFolder", folder, this);
    QNetworkReply *networkReply = sendRequest("PUT", folder, {},
                                              AwsSigV4::emptyPayloadHash(), {});
    track(networkReply, reply);
    return reply;
}
