/**
 * @file s3storageclient.h
 * @brief IStorageClient implementation speaking the S3 REST API.
 *
 * Requests are signed with AWS Signature Version 4 and sent through a
 * QNetworkAccessManager, so every operation is asynchronous.
 */

#ifndef S3STORAGECLIENT_H
#define S3STORAGECLIENT_H

#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPair>
#include <QPointer>
#include <QUrl>
#include <functional>

#include "awssigv4.h"
#include "istorageclient.h"
#include "models/serverconfig.h"

/**
 * @brief Generic S3-compatible backend (AWS S3, MinIO, ...).
 *
 * Addressing style is chosen per endpoint: AWS hosts use virtual-hosted
 * style (bucket.host/key), everything else path style (host/bucket/key),
 * which is what MinIO and most self-hosted servers expect.
 *
 * @par Example usage:
 * @code
 * S3StorageClient *s3 = new S3StorageClient(config, this);
 * StorageReply *reply = s3->downloadStream("docs/report.pdf");
 * connect(reply, &StorageReply::chunkReceived, file, [file](const QByteArray &chunk) {
 *     file->write(chunk);
 * });
 * @endcode
 */
class S3StorageClient : public IStorageClient
{
    Q_OBJECT

public:
    /// Inactivity timeout applied to every request
    static constexpr int RequestTimeoutMs = 60000;
    /// Maximum characters of an unparsed error body kept in messages
    static constexpr int ErrorResponsePreviewLength = 200;
    /// Default signing region when the profile does not name one
    static constexpr const char *DefaultRegion = "us-east-1";

    explicit S3StorageClient(const ServerConfig &config, QObject *parent = nullptr);
    ~S3StorageClient() override;

    /// @name IStorageClient Implementation
    /// @{
    [[nodiscard]] QString id() const override { return config_.id; }
    [[nodiscard]] QString bucketName() const override { return config_.bucket; }

    StorageReply *listObjects(const QString &prefix) override;
    StorageReply *uploadStream(const QString &key, QIODevice *source, qint64 size,
                               const QString &contentType = QString()) override;
    StorageReply *downloadStream(const QString &key) override;
    StorageReply *deleteObject(const QString &key) override;
    StorageReply *deleteFolder(const QString &folderPath) override;
    StorageReply *renameObject(const QString &oldKey, const QString &newKey) override;
    StorageReply *createFolder(const QString &folderPath) override;
    StorageReply *testConnection() override;

    [[nodiscard]] QString getFileUrl(const QString &key) const override;
    /// @}

    /// @name Addressing
    /// @{
    [[nodiscard]] bool usesPathStyle() const { return pathStyle_; }
    [[nodiscard]] QString region() const { return credentials_.region; }

    /**
     * @brief Full request URL for a key (or the bucket root for an empty key).
     */
    [[nodiscard]] QUrl objectUrl(const QString &key,
                                 const QList<QPair<QString, QString>> &query = {}) const;
    /// @}

    /**
     * @brief Parses one page of a ListObjectsV2 response.
     * @param xml Response body.
     * @param entries Receives folders (common prefixes) then objects.
     * @param nextToken Receives the continuation token, empty on the last page.
     * @return False if the body is not a well-formed ListBucketResult.
     */
    static bool parseListObjectsResponse(const QByteArray &xml,
                                         QList<StorageEntry> *entries,
                                         QString *nextToken);

    /**
     * @brief Converts a failed network reply into a StorageError.
     * @param networkError The reply's error code.
     * @param httpStatus HTTP status, 0 if no response arrived.
     * @param body Response body, possibly an S3 XML error document.
     * @param errorString The reply's own description.
     */
    [[nodiscard]] static StorageError classifyReply(QNetworkReply::NetworkError networkError,
                                                    int httpStatus,
                                                    const QByteArray &body,
                                                    const QString &errorString);

protected:
    /**
     * @brief Constructor for backends that override addressing and region.
     */
    S3StorageClient(const ServerConfig &config, bool pathStyle,
                    const QString &region, QObject *parent);

private:
    using BodyHandler = std::function<void(StorageReply *reply, const QByteArray &body)>;
    using ListHandler = std::function<void(StorageReply *reply, const QList<StorageEntry> &entries)>;

    struct PendingTransfer {
        QPointer<StorageReply> reply;
        BodyHandler onSuccess;
        bool streamBody = false;
    };

    QNetworkReply *sendRequest(const QByteArray &method,
                               const QString &key,
                               const QList<QPair<QString, QString>> &query,
                               const QByteArray &payloadHash,
                               const QList<QPair<QByteArray, QByteArray>> &extraHeaders,
                               QIODevice *bodyDevice = nullptr,
                               const QByteArray &bodyData = QByteArray());

    /**
     * @brief Routes a network reply's outcome into a StorageReply.
     * @param onSuccess Called with the response body on a 2xx reply; if null,
     *        the StorageReply is finished successfully at once.
     * @param streamBody Forward the body as chunks instead of buffering it.
     */
    void track(QNetworkReply *networkReply, StorageReply *reply,
               BodyHandler onSuccess = nullptr, bool streamBody = false);

    /**
     * @brief Lists a prefix page by page, following continuation tokens.
     * @param maxKeys If non-zero, fetch a single page of at most this many keys.
     */
    void listPages(StorageReply *reply, const QString &prefix, bool delimited,
                   const QString &continuationToken, const QList<StorageEntry> &collected,
                   int maxKeys, const ListHandler &onComplete);
    void deleteNext(StorageReply *reply, QList<StorageEntry> remaining);

    [[nodiscard]] QString resourcePath(const QString &key) const;
    [[nodiscard]] QByteArray origin() const;

    void onReplyFinished(QNetworkReply *networkReply);
    void onReadyRead(QNetworkReply *networkReply);

    [[nodiscard]] static bool isSuccessStatus(QNetworkReply *networkReply);

    QNetworkAccessManager *networkManager_ = nullptr;
    ServerConfig config_;
    QUrl endpoint_;
    bool pathStyle_ = true;
    AwsSigV4::Credentials credentials_;

    QHash<QNetworkReply *, PendingTransfer> pending_;
};

#endif // S3STORAGECLIENT_H
