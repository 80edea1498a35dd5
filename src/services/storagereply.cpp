#include "storagereply.h"

#include "utils/logging.h"

StorageReply::StorageReply(const QString &operation, const QString &key, QObject *parent)
    : QObject(parent)
    , operation_(operation)
    , key_(key)
{
}

void StorageReply::reportProgress(qint64 done, qint64 total)
{
    if (finished_) {
        return;
    }
    emit progress(done, total);
}

void StorageReply::deliverChunk(const QByteArray &chunk)
{
    if (finished_ || chunk.isEmpty()) {
        return;
    }
    emit chunkReceived(chunk);
}

void StorageReply::setEntries(const QList<StorageEntry> &entries)
{
    entries_ = entries;
}

void StorageReply::finishWithSuccess()
{
    if (finished_) {
        return;
    }
    finished_ = true;
    LOG_VERBOSE() << "StorageReply:" << operation_ << key_ << "finished";
    emit finished();
}

void StorageReply::finishWithError(const StorageError &error)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    hasError_ = true;
    error_ = error;
    LOG_VERBOSE() << "StorageReply:" << operation_ << key_ << "failed:" << error.toString();
    emit finished();
}
