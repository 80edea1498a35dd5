/**
 * @file storagereply.h
 * @brief Handle for one asynchronous storage operation.
 */

#ifndef STORAGEREPLY_H
#define STORAGEREPLY_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include "storageentry.h"
#include "storageerror.h"

/**
 * @brief Tracks a single in-flight call against an IStorageClient.
 *
 * Every IStorageClient operation returns a StorageReply immediately. The
 * client implementation feeds it progress, streamed data and the final
 * outcome; the caller listens to its signals. As with QNetworkReply, the
 * caller owns the reply once finished() has fired and should release it with
 * deleteLater().
 *
 * finished() is emitted exactly once. Calls to the finish methods after the
 * first one are ignored.
 */
class StorageReply : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a reply.
     * @param operation Short operation name for logs ("upload", "list", ...).
     * @param key The object key or prefix the operation targets.
     * @param parent Optional parent QObject.
     */
    explicit StorageReply(const QString &operation, const QString &key,
                          QObject *parent = nullptr);
    ~StorageReply() override = default;

    [[nodiscard]] QString operation() const { return operation_; }
    [[nodiscard]] QString key() const { return key_; }

    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] bool hasError() const { return hasError_; }
    [[nodiscard]] StorageError error() const { return error_; }

    /// Listing result, valid after a successful listObjects()
    [[nodiscard]] QList<StorageEntry> entries() const { return entries_; }

    /// @name Client implementation side
    /// @{
    void reportProgress(qint64 done, qint64 total);
    void deliverChunk(const QByteArray &chunk);
    void setEntries(const QList<StorageEntry> &entries);
    void finishWithSuccess();
    void finishWithError(const StorageError &error);
    /// @}

signals:
    /**
     * @brief Transfer progress.
     * @param done Bytes transferred so far.
     * @param total Total bytes, or -1 when unknown.
     */
    void progress(qint64 done, qint64 total);

    /**
     * @brief A chunk of downloaded object data, in stream order.
     */
    void chunkReceived(const QByteArray &chunk);

    /**
     * @brief The operation completed, successfully or not.
     */
    void finished();

private:
    QString operation_;
    QString key_;
    QList<StorageEntry> entries_;
    StorageError error_;
    bool finished_ = false;
    bool hasError_ = false;
};

#endif // STORAGEREPLY_H
