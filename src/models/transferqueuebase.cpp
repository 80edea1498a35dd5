#include "transferqueuebase.h"

#include <QTimer>
#include <algorithm>

#include "services/storagereply.h"
#include "utils/logging.h"

TransferQueueBase::TransferQueueBase(IStorageClient *storage, CompletionCallback onComplete,
                                     QObject *parent)
    : QAbstractListModel(parent)
    , storage_(storage)
    , onComplete_(std::move(onComplete))
{
}

TransferQueueBase::~TransferQueueBase() = default;

// ---------------------------------------------------------------------------
// Deferred event processing
// ---------------------------------------------------------------------------

void TransferQueueBase::scheduleProcessNext()
{
    // processNext() never runs from inside a signal handler; it is queued and
    // executed from the event loop (or flushEventQueue() in tests).
    eventQueue_.enqueue([this]() { processNext(); });

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferQueueBase::processEventQueue);
    }
}

void TransferQueueBase::processEventQueue()
{
    eventProcessingScheduled_ = false;

    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferQueueBase::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferQueueBase::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

// ---------------------------------------------------------------------------
// Model interface
// ---------------------------------------------------------------------------

int TransferQueueBase::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return static_cast<int>(items_.size());
}

QVariant TransferQueueBase::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const TransferItem &item = *items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return item.fileName;
    case IdRole:
        return item.id;
    case KeyRole:
        return item.key;
    case LocalPathRole:
        return item.localPath;
    case SizeRole:
        return item.size ? QVariant(*item.size) : QVariant();
    case StatusRole:
        return static_cast<int>(item.status);
    case ProgressRole:
        return item.progress;
    case ErrorMessageRole:
        return item.errorMessage;
    case ErrorKindRole:
        return item.status == TransferItem::Status::Failed
            ? StorageError::kindName(item.errorKind) : QString();
    case ResultUrlRole:
        return item.resultUrl;
    case SavePathRole:
        return item.savePath;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> TransferQueueBase::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "id";
    roles[KeyRole] = "key";
    roles[LocalPathRole] = "localPath";
    roles[FileNameRole] = "fileName";
    roles[SizeRole] = "size";
    roles[StatusRole] = "status";
    roles[ProgressRole] = "progress";
    roles[ErrorMessageRole] = "errorMessage";
    roles[ErrorKindRole] = "errorKind";
    roles[ResultUrlRole] = "resultUrl";
    roles[SavePathRole] = "savePath";
    return roles;
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

QList<TransferItem> TransferQueueBase::items() const
{
    QList<TransferItem> snapshot;
    snapshot.reserve(items_.size());
    for (const auto &item : items_) {
        snapshot.append(*item);
    }
    return snapshot;
}

std::optional<TransferItem> TransferQueueBase::item(const QString &id) const
{
    int row = indexOfId(id);
    if (row < 0) {
        return std::nullopt;
    }
    return *items_[row];
}

int TransferQueueBase::pendingCount() const
{
    return static_cast<int>(std::count_if(items_.begin(), items_.end(), [](const auto &item) {
        return item->status == TransferItem::Status::Pending;
    }));
}

int TransferQueueBase::activeCount() const
{
    return static_cast<int>(std::count_if(items_.begin(), items_.end(), [](const auto &item) {
        return item->status == TransferItem::Status::Active;
    }));
}

int TransferQueueBase::failedCount() const
{
    return static_cast<int>(std::count_if(items_.begin(), items_.end(), [](const auto &item) {
        return item->status == TransferItem::Status::Failed;
    }));
}

bool TransferQueueBase::hasActiveTransfers() const
{
    return std::any_of(items_.begin(), items_.end(), [](const auto &item) {
        return item->status == TransferItem::Status::Pending
            || item->status == TransferItem::Status::Active;
    });
}

int TransferQueueBase::indexOfId(const QString &id) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i]->id == id) {
            return i;
        }
    }
    return -1;
}

int TransferQueueBase::indexOfItem(const TransferItem *item) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].get() == item) {
            return i;
        }
    }
    return -1;
}

// ---------------------------------------------------------------------------
// Manipulation
// ---------------------------------------------------------------------------

void TransferQueueBase::enqueue(const QList<TransferItem> &newItems)
{
    if (newItems.isEmpty()) {
        return;
    }

    int first = static_cast<int>(items_.size());
    beginInsertRows(QModelIndex(), first, first + static_cast<int>(newItems.size()) - 1);
    for (const TransferItem &item : newItems) {
        auto stored = std::make_shared<TransferItem>(item);
        stored->status = TransferItem::Status::Pending;
        stored->progress = 0.0;
        items_.append(stored);
        LOG_VERBOSE() << logName() + ":" << "queued" << stored->id << "key:" << stored->key;
    }
    endInsertRows();

    emit queueChanged();
    scheduleProcessNext();
}

bool TransferQueueBase::retry(const QString &id)
{
    int row = indexOfId(id);
    if (row < 0 || items_[row]->status != TransferItem::Status::Failed) {
        return false;
    }

    auto &item = items_[row];
    item->status = TransferItem::Status::Pending;
    item->progress = 0.0;
    item->errorMessage.clear();
    item->errorKind = StorageError::Kind::Unknown;
    item->resultUrl.clear();
    item->savePath.clear();

    qDebug().noquote() << logName() + ": retrying" << item->fileName;
    notifyItemChanged(item);
    scheduleProcessNext();
    return true;
}

bool TransferQueueBase::remove(const QString &id)
{
    int row = indexOfId(id);
    if (row < 0) {
        return false;
    }

    beginRemoveRows(QModelIndex(), row, row);
    items_.removeAt(row);
    endRemoveRows();

    emit queueChanged();
    return true;
}

void TransferQueueBase::clearCompleted()
{
    bool changed = false;
    for (int row = static_cast<int>(items_.size()) - 1; row >= 0; --row) {
        if (items_[row]->status == TransferItem::Status::Success) {
            beginRemoveRows(QModelIndex(), row, row);
            items_.removeAt(row);
            endRemoveRows();
            changed = true;
        }
    }

    if (changed) {
        emit queueChanged();
    }
}

bool TransferQueueBase::clearAll()
{
    if (hasActiveTransfers()) {
        LOG_VERBOSE() << logName() + ": clearAll ignored, transfers still running";
        return false;
    }
    if (items_.isEmpty()) {
        return true;
    }

    beginResetModel();
    items_.clear();
    endResetModel();

    emit queueChanged();
    return true;
}

// ---------------------------------------------------------------------------
// Drain loop
// ---------------------------------------------------------------------------

void TransferQueueBase::processNext()
{
    if (processing_) {
        return;
    }

    auto it = std::find_if(items_.begin(), items_.end(), [](const auto &item) {
        return item->status == TransferItem::Status::Pending;
    });

    if (it == items_.end()) {
        if (ranSinceIdle_) {
            ranSinceIdle_ = false;
            qDebug().noquote() << logName() + ": all transfers finished";
            emit allTransfersFinished();
        }
        return;
    }

    std::shared_ptr<TransferItem> item = *it;
    current_ = item;
    processing_ = true;
    ranSinceIdle_ = true;

    item->status = TransferItem::Status::Active;
    item->progress = 0.0;
    notifyItemChanged(item);

    qDebug().noquote() << logName() + ": starting" << item->key;
    emit transferStarted(item->id);

    if (!storage_) {
        failTransfer(item, StorageError::unknown(tr("No storage client available")));
        return;
    }
    startTransfer(item);
}

void TransferQueueBase::updateProgress(const std::shared_ptr<TransferItem> &item, double progress)
{
    if (item != current_ || item->status != TransferItem::Status::Active) {
        return;
    }

    progress = std::clamp(progress, 0.0, 1.0);
    if (progress <= item->progress) {
        return;
    }

    item->progress = progress;
    notifyItemChanged(item);
}

void TransferQueueBase::completeTransfer(const std::shared_ptr<TransferItem> &item)
{
    if (item != current_) {
        qWarning().noquote() << logName() + ": ignoring completion for inactive item" << item->id;
        return;
    }

    item->status = TransferItem::Status::Success;
    item->progress = 1.0;
    item->errorMessage.clear();
    notifyItemChanged(item);

    qDebug().noquote() << logName() + ": completed" << item->key;
    emit transferCompleted(item->id);

    if (onComplete_) {
        onComplete_(*item);
    }

    finishCurrent();
}

void TransferQueueBase::failTransfer(const std::shared_ptr<TransferItem> &item,
                                     const StorageError &error)
{
    if (item != current_) {
        qWarning().noquote() << logName() + ": ignoring failure for inactive item" << item->id;
        return;
    }

    item->status = TransferItem::Status::Failed;
    item->errorMessage = error.message;
    item->errorKind = error.kind;
    notifyItemChanged(item);

    qWarning().noquote() << logName() + ": failed" << item->key << "-" << error.toString();
    emit transferFailed(item->id, error.message);

    finishCurrent();
}

void TransferQueueBase::failIfReplyLost(const std::shared_ptr<TransferItem> &item,
                                        StorageReply *reply)
{
    auto settled = std::make_shared<bool>(false);
    connect(reply, &StorageReply::finished, this, [settled]() { *settled = true; });
    connect(reply, &QObject::destroyed, this, [this, item, settled]() {
        if (*settled || item != current_) {
            return;
        }
        failTransfer(item, StorageError::unknown(tr("Transfer aborted: the storage client went away")));
    });
}

void TransferQueueBase::finishCurrent()
{
    current_.reset();
    processing_ = false;
    scheduleProcessNext();
}

void TransferQueueBase::notifyItemChanged(const std::shared_ptr<TransferItem> &item)
{
    int row = indexOfItem(item.get());
    if (row >= 0) {
        QModelIndex idx = index(row);
        emit dataChanged(idx, idx);
    }
    emit queueChanged();
}
