#include "transferitem.h"

#include <QDateTime>
#include <atomic>

TransferItem TransferItem::create(TransferDirection direction, const QString &key)
{
    TransferItem item;
    item.direction = direction;
    item.key = key;
    item.fileName = fileNameOfKey(key);
    item.id = makeId(item.fileName);
    return item;
}

QString TransferItem::makeId(const QString &fileName)
{
    static std::atomic<quint64> sequence{0};
    return QString("%1_%2_%3")
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(++sequence)
        .arg(fileName);
}

QString TransferItem::fileNameOfKey(const QString &key)
{
    QString trimmed = key;
    while (trimmed.endsWith('/')) {
        trimmed.chop(1);
    }
    return trimmed.mid(trimmed.lastIndexOf('/') + 1);
}
