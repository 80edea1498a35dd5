/**
 * @file istorageclient.h
 * @brief Interface for object storage backends.
 *
 * This interface allows dependency injection of storage clients, enabling
 * runtime swapping between backends (generic S3, Cloudflare R2) and mock
 * implementations for testing.
 */

#ifndef ISTORAGECLIENT_H
#define ISTORAGECLIENT_H

#include <QObject>
#include <QString>

#include "storagereply.h"

class QIODevice;

/**
 * @brief Abstract interface over an S3-compatible bucket.
 *
 * A client is bound to one endpoint, one set of credentials and one bucket.
 * Every operation is asynchronous: it returns a StorageReply at once and
 * reports the outcome through it. A client may fail any call with a transport,
 * authorization or not-found error.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IStorageClient *storage = StorageClientFactory::create(config, this);
 *
 * // Test code
 * IStorageClient *storage = new MockStorageClient(this);
 *
 * StorageReply *reply = storage->listObjects("photos/");
 * connect(reply, &StorageReply::finished, this, [reply]() {
 *     reply->deleteLater();
 *     ...
 * });
 * @endcode
 */
class IStorageClient : public QObject
{
    Q_OBJECT

public:
    explicit IStorageClient(QObject *parent = nullptr) : QObject(parent) {}
    ~IStorageClient() override = default;

    /// @name Identity
    /// @{

    /**
     * @brief Identifier of the profile this client was built from.
     */
    [[nodiscard]] virtual QString id() const = 0;

    /**
     * @brief Name of the bucket all keys are relative to.
     */
    [[nodiscard]] virtual QString bucketName() const = 0;
    /// @}

    /// @name Listing
    /// @{

    /**
     * @brief Lists objects and folders directly under a prefix.
     * @param prefix Key prefix, normally empty or ending with '/'.
     *
     * The reply's entries() hold the common prefixes (folders) followed by
     * the objects.
     */
    virtual StorageReply *listObjects(const QString &prefix) = 0;
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Uploads an object from a sequential byte stream.
     * @param key Destination key.
     * @param source Open, readable device. Not owned; it must outlive the reply.
     * @param size Number of bytes to read from @p source.
     * @param contentType Optional MIME type.
     */
    virtual StorageReply *uploadStream(const QString &key, QIODevice *source, qint64 size,
                                       const QString &contentType = QString()) = 0;

    /**
     * @brief Downloads an object as a stream of chunks.
     * @param key The object key.
     *
     * Data arrives through StorageReply::chunkReceived() in order.
     */
    virtual StorageReply *downloadStream(const QString &key) = 0;
    /// @}

    /// @name Object Operations
    /// @{

    virtual StorageReply *deleteObject(const QString &key) = 0;

    /**
     * @brief Deletes every object whose key starts with @p folderPath.
     * @param folderPath Folder key; a trailing '/' is added if missing.
     */
    virtual StorageReply *deleteFolder(const QString &folderPath) = 0;

    /**
     * @brief Renames an object (server-side copy, then delete of the source).
     */
    virtual StorageReply *renameObject(const QString &oldKey, const QString &newKey) = 0;

    /**
     * @brief Creates a folder marker (zero-byte object whose key ends in '/').
     */
    virtual StorageReply *createFolder(const QString &folderPath) = 0;

    /**
     * @brief Checks that the endpoint, credentials and bucket are usable.
     */
    virtual StorageReply *testConnection() = 0;
    /// @}

    /**
     * @brief Externally reachable URL for a key.
     *
     * Built from the configured CDN URL if there is one, otherwise the
     * object's own URL on the endpoint. The key is percent-encoded.
     */
    [[nodiscard]] virtual QString getFileUrl(const QString &key) const = 0;
};

#endif // ISTORAGECLIENT_H
