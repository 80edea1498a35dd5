#include "downloadqueue.h"

#include <QFile>

#include "services/storagereply.h"
#include "utils/downloadpaths.h"
#include "utils/logging.h"

DownloadQueue::DownloadQueue(IStorageClient *storage, CompletionCallback onComplete,
                             QObject *parent)
    : TransferQueueBase(storage, std::move(onComplete), parent)
{
}

QString DownloadQueue::addToQueue(const QString &key, std::optional<qint64> size)
{
    TransferItem item = TransferItem::create(TransferDirection::Download, key);
    if (size && *size >= 0) {
        item.size = size;
    }
    enqueue({item});
    return item.id;
}

void DownloadQueue::startTransfer(const std::shared_ptr<TransferItem> &item)
{
    QString error;
    const QString directory = DownloadPaths::resolveDownloadDirectory(downloadDirectory_, &error);
    if (directory.isEmpty()) {
        failTransfer(item, StorageError::localFilesystem(error));
        return;
    }

    const QString path = DownloadPaths::uniqueFilePath(
        directory, DownloadPaths::sanitizeFileName(item->fileName));

    auto *sink = new QFile(path);
    // NewOnly: a file appearing between the existence check and here is not clobbered
    if (!sink->open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        StorageError fsError = StorageError::localFilesystem(
            tr("Cannot create '%1': %2").arg(path, sink->errorString()));
        delete sink;
        failTransfer(item, fsError);
        return;
    }

    item->localPath = path;
    notifyItemChanged(item);

    StorageReply *reply = storage()->downloadStream(item->key);
    sink->setParent(reply);
    failIfReplyLost(item, reply);

    LOG_VERBOSE() << "DownloadQueue: downloading" << item->key << "to" << path;

    auto received = std::make_shared<qint64>(0);
    auto writeError = std::make_shared<QString>();

    connect(reply, &StorageReply::chunkReceived, this,
            [this, item, sink, received, writeError](const QByteArray &chunk) {
        if (!writeError->isEmpty()) {
            return;
        }
        if (sink->write(chunk) != chunk.size()) {
            *writeError = tr("Cannot write '%1': %2").arg(sink->fileName(), sink->errorString());
            qWarning().noquote() << "DownloadQueue:" << *writeError;
            return;
        }
        *received += chunk.size();
        if (item->size && *item->size > 0) {
            updateProgress(item, static_cast<double>(*received) / static_cast<double>(*item->size));
        }
    });

    // Without a size from the caller, take the transport's Content-Length
    connect(reply, &StorageReply::progress, this,
            [this, item, received](qint64, qint64 total) {
        if (item->size || total <= 0) {
            return;
        }
        item->size = total;
        notifyItemChanged(item);
        updateProgress(item, static_cast<double>(*received) / static_cast<double>(total));
    });

    connect(reply, &StorageReply::finished, this, [this, item, reply, sink, writeError]() {
        reply->deleteLater();
        if (writeError->isEmpty() && !sink->flush()) {
            *writeError = tr("Cannot write '%1': %2").arg(sink->fileName(), sink->errorString());
        }
        sink->close();

        if (reply->hasError()) {
            failTransfer(item, reply->error());
            return;
        }
        if (!writeError->isEmpty()) {
            failTransfer(item, StorageError::localFilesystem(*writeError));
            return;
        }
        item->savePath = sink->fileName();
        completeTransfer(item);
    });
}
