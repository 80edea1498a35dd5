/**
 * @file transferqueuebase.h
 * @brief Ordered, single-flight transfer queue shared by uploads and downloads.
 */

#ifndef TRANSFERQUEUEBASE_H
#define TRANSFERQUEUEBASE_H

#include <QAbstractListModel>
#include <QList>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <functional>
#include <memory>
#include <optional>

#include "services/istorageclient.h"
#include "transferitem.h"

class StorageReply;

/**
 * @brief Holds transfer items in insertion order and runs them one at a time.
 *
 * Items start Pending. The drain loop picks the first Pending item, marks it
 * Active and hands it to startTransfer(). When the subclass reports the
 * outcome through completeTransfer() or failTransfer() the loop moves on to
 * the next Pending item. At most one item is Active at any time, and
 * processNext() is always invoked through the deferred event queue so that
 * signal handlers never re-enter the loop.
 *
 * Every change to the list or to an item's fields emits queueChanged(), plus
 * the usual model signals for attached views.
 */
class TransferQueueBase : public QAbstractListModel
{
    Q_OBJECT

public:
    /// Invoked once per item reaching Success
    using CompletionCallback = std::function<void(const TransferItem &item)>;

    enum Roles {
        IdRole = Qt::UserRole + 1,
        KeyRole,
        LocalPathRole,
        FileNameRole,
        SizeRole,
        StatusRole,
        ProgressRole,
        ErrorMessageRole,
        ErrorKindRole,
        ResultUrlRole,
        SavePathRole
    };

    ~TransferQueueBase() override;

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    /// @name Queue inspection
    /// @{
    /// Snapshot of all items in insertion order
    [[nodiscard]] QList<TransferItem> items() const;
    [[nodiscard]] std::optional<TransferItem> item(const QString &id) const;
    [[nodiscard]] int count() const { return static_cast<int>(items_.size()); }
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] int failedCount() const;
    /// True while any item is Pending or Active
    [[nodiscard]] bool hasActiveTransfers() const;
    /// True while a transfer is in flight (including one whose item was removed)
    [[nodiscard]] bool isProcessing() const { return processing_; }
    /// @}

    /// @name Queue manipulation
    /// @{
    /**
     * @brief Resets a Failed item to Pending and restarts the loop if idle.
     *
     * The item keeps its position in the list.
     * @return False if no Failed item has this id.
     */
    bool retry(const QString &id);

    /**
     * @brief Removes an item regardless of status.
     *
     * Removing the Active item does not cancel its network operation; the
     * outcome is applied to the detached item and the loop resumes after it.
     * @return False if no item has this id.
     */
    bool remove(const QString &id);

    /// Removes all Success items
    void clearCompleted();

    /**
     * @brief Removes every item, unless a transfer is pending or active.
     * @return True if the queue was cleared.
     */
    bool clearAll();
    /// @}

    /**
     * @brief Processes all pending deferred events synchronously.
     *
     * Intended for tests that need deterministic ordering without spinning
     * the event loop.
     */
    void flushEventQueue();

    [[nodiscard]] IStorageClient *storage() const { return storage_; }

signals:
    void queueChanged();
    void transferStarted(const QString &id);
    void transferCompleted(const QString &id);
    void transferFailed(const QString &id, const QString &message);
    /// Emitted when the loop goes idle after running at least one transfer
    void allTransfersFinished();

protected:
    TransferQueueBase(IStorageClient *storage, CompletionCallback onComplete,
                      QObject *parent);

    /// Short name used as a log prefix ("UploadQueue", "DownloadQueue")
    [[nodiscard]] virtual QString logName() const = 0;

    /**
     * @brief Starts the network operation for an item that was just made Active.
     *
     * Must eventually call completeTransfer() or failTransfer() for the item,
     * possibly synchronously.
     */
    virtual void startTransfer(const std::shared_ptr<TransferItem> &item) = 0;

    /// Appends Pending items and kicks the loop
    void enqueue(const QList<TransferItem> &newItems);

    /// Raises the progress of the Active item; lower values are ignored
    void updateProgress(const std::shared_ptr<TransferItem> &item, double progress);

    void completeTransfer(const std::shared_ptr<TransferItem> &item);
    void failTransfer(const std::shared_ptr<TransferItem> &item, const StorageError &error);

    /**
     * @brief Fails the item if @p reply is destroyed before it finishes,
     *        e.g. when its client is deleted mid-transfer.
     */
    void failIfReplyLost(const std::shared_ptr<TransferItem> &item, StorageReply *reply);

    /// Emits dataChanged for the item's row (if still listed) and queueChanged
    void notifyItemChanged(const std::shared_ptr<TransferItem> &item);

private:
    void scheduleProcessNext();
    void processEventQueue();
    void processNext();
    void finishCurrent();

    [[nodiscard]] int indexOfId(const QString &id) const;
    [[nodiscard]] int indexOfItem(const TransferItem *item) const;

    QPointer<IStorageClient> storage_;
    CompletionCallback onComplete_;

    QList<std::shared_ptr<TransferItem>> items_;
    std::shared_ptr<TransferItem> current_;
    bool processing_ = false;
    bool ranSinceIdle_ = false;

    // Deferred event processing
    QQueue<std::function<void()>> eventQueue_;
    bool eventProcessingScheduled_ = false;
    bool processingEvents_ = false;
};

#endif // TRANSFERQUEUEBASE_H
