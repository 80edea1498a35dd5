#include "uploadqueue.h"

#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>

#include "services/storagereply.h"
#include "utils/logging.h"

UploadQueue::UploadQueue(IStorageClient *storage, CompletionCallback onComplete,
                         QObject *parent)
    : TransferQueueBase(storage, std::move(onComplete), parent)
{
}

QString UploadQueue::objectKey(const QString &prefix, const QString &fileName)
{
    return prefix.isEmpty() ? fileName : prefix + fileName;
}

QStringList UploadQueue::addToQueue(const QStringList &localPaths, const QString &targetPrefix)
{
    QList<TransferItem> newItems;
    QStringList ids;

    for (const QString &path : localPaths) {
        QFileInfo info(path);
        TransferItem item = TransferItem::create(TransferDirection::Upload,
                                                 objectKey(targetPrefix, info.fileName()));
        item.localPath = path;
        if (info.isFile()) {
            item.size = info.size();
        }
        ids.append(item.id);
        newItems.append(item);
    }

    enqueue(newItems);
    return ids;
}

void UploadQueue::startTransfer(const std::shared_ptr<TransferItem> &item)
{
    auto *file = new QFile(item->localPath);
    if (!file->open(QIODevice::ReadOnly)) {
        StorageError error = StorageError::localFilesystem(
            tr("Cannot open '%1': %2").arg(item->localPath, file->errorString()));
        delete file;
        failTransfer(item, error);
        return;
    }

    // Size is taken from the open file, not from when the item was queued
    const qint64 size = file->size();
    if (!item->size || *item->size != size) {
        item->size = size;
        notifyItemChanged(item);
    }

    static const QMimeDatabase mimeDatabase;
    const QString contentType = mimeDatabase.mimeTypeForFile(item->localPath).name();

    StorageReply *reply = storage()->uploadStream(item->key, file, size, contentType);
    file->setParent(reply);
    failIfReplyLost(item, reply);

    LOG_VERBOSE() << "UploadQueue: uploading" << item->localPath << "as" << item->key
                  << "bytes:" << size << "type:" << contentType;

    connect(reply, &StorageReply::progress, this, [this, item](qint64 sent, qint64 total) {
        if (total > 0) {
            updateProgress(item, static_cast<double>(sent) / static_cast<double>(total));
        }
    });

    connect(reply, &StorageReply::finished, this, [this, item, reply]() {
        reply->deleteLater();
        if (reply->hasError()) {
            failTransfer(item, reply->error());
            return;
        }
        item->resultUrl = storage() ? storage()->getFileUrl(item->key) : item->key;
        completeTransfer(item);
    });
}
