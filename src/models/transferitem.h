/**
 * @file transferitem.h
 * @brief State of one upload or download tracked by a transfer queue.
 */

#ifndef TRANSFERITEM_H
#define TRANSFERITEM_H

#include <QString>
#include <optional>

#include "services/storageerror.h"

enum class TransferDirection { Upload, Download };

struct TransferItem {
    enum class Status { Pending, Active, Success, Failed };

    QString id;                      // Fixed at creation, used to address the item
    TransferDirection direction = TransferDirection::Upload;
    QString key;                     // Remote object key
    QString localPath;               // Upload source; download target once resolved
    QString fileName;                // Last segment of key
    std::optional<qint64> size;      // Unknown size means indeterminate progress
    Status status = Status::Pending;
    double progress = 0.0;           // 0.0 .. 1.0
    QString errorMessage;            // Only while Failed
    StorageError::Kind errorKind = StorageError::Kind::Unknown;
    QString resultUrl;               // Uploads, on Success
    QString savePath;                // Downloads, on Success

    [[nodiscard]] bool isFinished() const
    {
        return status == Status::Success || status == Status::Failed;
    }

    /**
     * @brief Creates a pending item with a fresh id.
     */
    [[nodiscard]] static TransferItem create(TransferDirection direction, const QString &key);

    /**
     * @brief Generates an id from the current time, a per-process sequence
     *        number and the file name.
     */
    [[nodiscard]] static QString makeId(const QString &fileName);

    /**
     * @brief Last path segment of an object key ("docs/a.txt" -> "a.txt").
     */
    [[nodiscard]] static QString fileNameOfKey(const QString &key);
};

/// @brief Convert TransferItem::Status to string for logs and display
[[nodiscard]] inline const char *transferStatusToString(TransferItem::Status status)
{
    switch (status) {
        case TransferItem::Status::Pending: return "pending";
        case TransferItem::Status::Active: return "active";
        case TransferItem::Status::Success: return "success";
        case TransferItem::Status::Failed: return "failed";
    }
    return "unknown";
}

#endif // TRANSFERITEM_H
