/**
 * @file uploadqueue.h
 * @brief Queue that uploads local files to the bucket one at a time.
 */

#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QStringList>

#include "transferqueuebase.h"

/**
 * @brief Uploads local files under a target prefix.
 *
 * Each file becomes one Pending item keyed `prefix + fileName`. On success
 * the item's resultUrl is the storage client's public URL for the key and the
 * completion callback fires, which is how callers refresh their listings.
 *
 * @par Example usage:
 * @code
 * auto *uploads = new UploadQueue(client, [](const TransferItem &item) {
 *     qInfo() << "uploaded" << item.resultUrl;
 * }, this);
 * uploads->addToQueue({"/tmp/a.txt", "/tmp/b.png"}, "docs/");
 * @endcode
 */
class UploadQueue : public TransferQueueBase
{
    Q_OBJECT

public:
    explicit UploadQueue(IStorageClient *storage,
                         CompletionCallback onComplete = nullptr,
                         QObject *parent = nullptr);

    /**
     * @brief Appends one Pending item per local file.
     * @param localPaths Files to upload. Their size is read when the upload starts.
     * @param targetPrefix Key prefix; empty or ending with '/'.
     * @return Ids of the new items, in order.
     */
    QStringList addToQueue(const QStringList &localPaths, const QString &targetPrefix);

    /// Key an upload of @p fileName under @p prefix is stored at
    [[nodiscard]] static QString objectKey(const QString &prefix, const QString &fileName);

protected:
    [[nodiscard]] QString logName() const override { return QStringLiteral("UploadQueue"); }
    void startTransfer(const std::shared_ptr<TransferItem> &item) override;
};

#endif // UPLOADQUEUE_H
