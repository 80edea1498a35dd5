/**
 * @file downloadqueue.h
 * @brief Queue that saves bucket objects to local files one at a time.
 */

#ifndef DOWNLOADQUEUE_H
#define DOWNLOADQUEUE_H

#include "transferqueuebase.h"

/**
 * @brief Downloads objects into the download directory.
 *
 * When an item starts, the target directory is resolved, the file name is
 * sanitized and made unique, and the file is created exclusively so that an
 * existing file is never overwritten. Data is written as it streams in.
 * A failed transfer leaves whatever was written on disk; a retry writes to a
 * new, non-colliding name.
 */
class DownloadQueue : public TransferQueueBase
{
    Q_OBJECT

public:
    explicit DownloadQueue(IStorageClient *storage,
                           CompletionCallback onComplete = nullptr,
                           QObject *parent = nullptr);

    /**
     * @brief Appends a Pending item for an object.
     * @param key Object key; the file name is its last segment.
     * @param size Object size if known. Otherwise the size reported by the
     *             transport is adopted once the download starts.
     * @return Id of the new item.
     */
    QString addToQueue(const QString &key, std::optional<qint64> size = std::nullopt);

    /// Directory override; empty selects the platform default
    void setDownloadDirectory(const QString &directory) { downloadDirectory_ = directory; }
    [[nodiscard]] QString downloadDirectory() const { return downloadDirectory_; }

protected:
    [[nodiscard]] QString logName() const override { return QStringLiteral("DownloadQueue"); }
    void startTransfer(const std::shared_ptr<TransferItem> &item) override;

private:
    QString downloadDirectory_;
};

#endif // DOWNLOADQUEUE_H
