#ifndef STORAGEENTRY_H
#define STORAGEENTRY_H

#include <QDateTime>
#include <QString>

/**
 * @brief Represents a single entry in an object listing.
 *
 * Folders are common prefixes returned by a delimited listing; their key ends
 * with '/' and they carry no size.
 */
struct StorageEntry {
    QString key;               ///< Full object key or common prefix
    bool isDirectory = false;  ///< True for common prefixes
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QDateTime lastModified;    ///< Last modification timestamp (objects only)
    QString eTag;              ///< Entity tag without quotes (objects only)

    /// Last path segment of the key, without the trailing '/' of folders
    [[nodiscard]] QString name() const
    {
        QString trimmed = key;
        if (trimmed.endsWith('/')) {
            trimmed.chop(1);
        }
        return trimmed.mid(trimmed.lastIndexOf('/') + 1);
    }
};

#endif // STORAGEENTRY_H
