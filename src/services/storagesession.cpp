#include "storagesession.h"

#include <QTimer>

#include "istorageclient.h"
#include "models/downloadqueue.h"
#include "models/uploadqueue.h"
#include "storageclientfactory.h"
#include "storagereply.h"
#include "utils/logging.h"

StorageSession::StorageSession(const ServerConfig &config, QObject *parent)
    : QObject(parent)
    , client_(StorageClientFactory::create(config, this))
{
    createQueues();
}

StorageSession::StorageSession(IStorageClient *client, QObject *parent)
    : QObject(parent)
    , client_(client)
{
    createQueues();
}

StorageSession::~StorageSession() = default;

void StorageSession::createQueues()
{
    uploads_ = new UploadQueue(client_, [this](const TransferItem &item) {
        onUploadCompleted(item.key);
    }, this);
    downloads_ = new DownloadQueue(client_, nullptr, this);
}

void StorageSession::setDownloadDirectory(const QString &directory)
{
    downloads_->setDownloadDirectory(directory);
}

QString StorageSession::parentPrefix(const QString &key)
{
    QString trimmed = key;
    if (trimmed.endsWith('/')) {
        trimmed.chop(1);
    }
    int slash = static_cast<int>(trimmed.lastIndexOf('/'));
    return slash < 0 ? QString() : trimmed.left(slash + 1);
}

void StorageSession::onUploadCompleted(const QString &key)
{
    const QString prefix = parentPrefix(key);
    invalidatePath(prefix);
    emit directoryInvalidated(prefix);
}

// ---------------------------------------------------------------------------
// Listing cache
// ---------------------------------------------------------------------------

bool StorageSession::isFresh(const CachedListing &listing) const
{
    if (cacheTtlSeconds_ <= 0) {
        return true;
    }
    return listing.fetchedAt.secsTo(QDateTime::currentDateTimeUtc()) < cacheTtlSeconds_;
}

void StorageSession::listDirectory(const QString &prefix, bool forceRefresh)
{
    auto cached = cache_.constFind(prefix);
    if (!forceRefresh && cached != cache_.constEnd() && isFresh(*cached)) {
        LOG_VERBOSE() << "StorageSession: listing" << prefix << "served from cache";
        QList<StorageEntry> entries = cached->entries;
        QTimer::singleShot(0, this, [this, prefix, entries]() {
            emit directoryListed(prefix, entries);
        });
        return;
    }

    if (!ensureClient(QStringLiteral("list"), prefix)) {
        return;
    }

    StorageReply *reply = client_->listObjects(prefix);
    connect(reply, &StorageReply::finished, this, [this, reply, prefix]() {
        reply->deleteLater();
        if (reply->hasError()) {
            emit operationFailed(QStringLiteral("list"), prefix, reply->error());
            return;
        }
        cache_.insert(prefix, CachedListing{reply->entries(), QDateTime::currentDateTimeUtc()});
        emit directoryListed(prefix, reply->entries());
    });
}

void StorageSession::invalidatePath(const QString &prefix)
{
    cache_.remove(prefix);
}

// ---------------------------------------------------------------------------
// Object operations
// ---------------------------------------------------------------------------

bool StorageSession::ensureClient(const QString &operation, const QString &key)
{
    if (client_) {
        return true;
    }
    StorageError error = StorageError::unknown(tr("No storage client available"));
    QTimer::singleShot(0, this, [this, operation, key, error]() {
        emit operationFailed(operation, key, error);
    });
    return false;
}

void StorageSession::watch(StorageReply *reply, const QString &operation, const QString &key,
                           const QStringList &touchedPrefixes)
{
    connect(reply, &StorageReply::finished, this,
            [this, reply, operation, key, touchedPrefixes]() {
        reply->deleteLater();
        if (reply->hasError()) {
            emit operationFailed(operation, key, reply->error());
            return;
        }
        for (const QString &prefix : touchedPrefixes) {
            invalidatePath(prefix);
            emit directoryInvalidated(prefix);
        }
        emit operationSucceeded(operation, key);
    });
}

void StorageSession::deleteObject(const QString &key)
{
    if (!ensureClient(QStringLiteral("delete"), key)) return;
    watch(client_->deleteObject(key), QStringLiteral("delete"), key, {parentPrefix(key)});
}

void StorageSession::deleteFolder(const QString &folderPath)
{
    QString folder = folderPath.endsWith('/') ? folderPath : folderPath + '/';
    if (!ensureClient(QStringLiteral("rmdir"), folder)) return;
    // Everything cached under the folder is gone too
    const QList<QString> cachedPrefixes = cache_.keys();
    for (const QString &prefix : cachedPrefixes) {
        if (prefix.startsWith(folder)) {
            cache_.remove(prefix);
        }
    }
    watch(client_->deleteFolder(folder), QStringLiteral("rmdir"), folder, {parentPrefix(folder)});
}

void StorageSession::renameObject(const QString &oldKey, const QString &newKey)
{
    if (!ensureClient(QStringLiteral("rename"), oldKey)) return;
    QStringList touched = {parentPrefix(oldKey)};
    if (parentPrefix(newKey) != touched.first()) {
        touched.append(parentPrefix(newKey));
    }
    watch(client_->renameObject(oldKey, newKey), QStringLiteral("rename"), oldKey, touched);
}

void StorageSession::createFolder(const QString &folderPath)
{
    QString folder = folderPath.endsWith('/') ? folderPath : folderPath + '/';
    if (!ensureClient(QStringLiteral("mkdir"), folder)) return;
    watch(client_->createFolder(folder), QStringLiteral("mkdir"), folder, {parentPrefix(folder)});
}

void StorageSession::testConnection()
{
    if (!ensureClient(QStringLiteral("test"), QString())) return;
    watch(client_->testConnection(), QStringLiteral("test"), client_->bucketName(), {});
}

QString StorageSession::fileUrl(const QString &key) const
{
    return client_ ? client_->getFileUrl(key) : QString();
}
