/**
 * @file storagesession.h
 * @brief One connected bucket: its client, transfer queues and listing cache.
 */

#ifndef STORAGESESSION_H
#define STORAGESESSION_H

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#include "models/serverconfig.h"
#include "storageentry.h"
#include "storageerror.h"

class DownloadQueue;
class IStorageClient;
class StorageReply;
class UploadQueue;

/**
 * @brief Wires a storage client to an upload queue, a download queue and a
 *        cache of directory listings.
 *
 * Successful uploads invalidate the cached listing of the uploaded key's
 * prefix and emit directoryInvalidated(), so a browser showing that prefix
 * can refresh. Mutating operations invalidate the prefixes they touch.
 *
 * @par Example usage:
 * @code
 * StorageSession *session = new StorageSession(config, this);
 * connect(session, &StorageSession::directoryListed,
 *         this, &Browser::showEntries);
 * session->listDirectory("photos/");
 * session->uploads()->addToQueue({"/tmp/cat.jpg"}, "photos/");
 * @endcode
 */
class StorageSession : public QObject
{
    Q_OBJECT

public:
    /// Listings younger than this are served from the cache
    static constexpr int DefaultCacheTtlSeconds = 30;

    /**
     * @brief Creates a session with a client built for @p config.
     */
    explicit StorageSession(const ServerConfig &config, QObject *parent = nullptr);

    /**
     * @brief Creates a session over an existing client.
     * @param client The storage client (not owned).
     */
    explicit StorageSession(IStorageClient *client, QObject *parent = nullptr);

    ~StorageSession() override;

    [[nodiscard]] IStorageClient *client() const { return client_; }
    [[nodiscard]] UploadQueue *uploads() const { return uploads_; }
    [[nodiscard]] DownloadQueue *downloads() const { return downloads_; }

    /// Forwards to the download queue
    void setDownloadDirectory(const QString &directory);

    /// @name Listing
    /// @{

    /**
     * @brief Lists a prefix, from the cache when fresh.
     * @param prefix Folder prefix, empty for the bucket root.
     * @param forceRefresh Bypass the cache.
     *
     * Emits directoryListed() or operationFailed("list", ...), always from
     * the event loop.
     */
    void listDirectory(const QString &prefix, bool forceRefresh = false);

    /// TTL in seconds; 0 keeps listings until invalidated
    void setCacheTtl(int seconds) { cacheTtlSeconds_ = seconds; }
    /// @}

    /// @name Object operations
    /// Each reports through operationSucceeded() or operationFailed().
    /// @{
    void deleteObject(const QString &key);
    void deleteFolder(const QString &folderPath);
    void renameObject(const QString &oldKey, const QString &newKey);
    void createFolder(const QString &folderPath);
    void testConnection();
    /// @}

    [[nodiscard]] QString fileUrl(const QString &key) const;

    /**
     * @brief Folder prefix containing a key ("a/b/c.txt" and "a/b/c/" give "a/b/").
     */
    [[nodiscard]] static QString parentPrefix(const QString &key);

signals:
    void directoryListed(const QString &prefix, const QList<StorageEntry> &entries);
    void directoryInvalidated(const QString &prefix);
    void operationSucceeded(const QString &operation, const QString &key);
    void operationFailed(const QString &operation, const QString &key, const StorageError &error);

private:
    struct CachedListing {
        QList<StorageEntry> entries;
        QDateTime fetchedAt;
    };

    void createQueues();
    void invalidatePath(const QString &prefix);
    void onUploadCompleted(const QString &key);

    /// Connects a reply's outcome to the operation signals
    void watch(StorageReply *reply, const QString &operation, const QString &key,
               const QStringList &touchedPrefixes);

    /// Reports a deferred failure if the client is gone
    bool ensureClient(const QString &operation, const QString &key);

    [[nodiscard]] bool isFresh(const CachedListing &listing) const;

    QPointer<IStorageClient> client_;
    UploadQueue *uploads_ = nullptr;
    DownloadQueue *downloads_ = nullptr;

    QHash<QString, CachedListing> cache_;
    int cacheTtlSeconds_ = DefaultCacheTtlSeconds;
};

#endif // STORAGESESSION_H
