/**
 * @file serverconfigstore.cpp
 * @brief Implementation of the ServerConfigStore service.
 */

#include "serverconfigstore.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QSettings>
#include <QStringList>

namespace {
constexpr const char *ConfigsKey = "servers/configs";
}

ServerConfigStore::ServerConfigStore(QObject *parent)
    : QObject(parent)
{
    load();
}

int ServerConfigStore::indexOf(const QString &idOrName) const
{
    for (int i = 0; i < configs_.size(); ++i) {
        if (configs_[i].id == idOrName) {
            return i;
        }
    }
    for (int i = 0; i < configs_.size(); ++i) {
        if (configs_[i].name == idOrName) {
            return i;
        }
    }
    return -1;
}

std::optional<ServerConfig> ServerConfigStore::find(const QString &idOrName) const
{
    int i = indexOf(idOrName);
    if (i < 0) {
        return std::nullopt;
    }
    return configs_[i];
}

QString ServerConfigStore::upsert(const ServerConfig &config)
{
    ServerConfig stored = config;
    if (stored.id.isEmpty()) {
        stored.id = ServerConfig::generateId();
    }

    bool replaced = false;
    for (ServerConfig &existing : configs_) {
        if (existing.id == stored.id) {
            existing = stored;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        configs_.append(stored);
    }

    save();
    emit configsChanged();
    return stored.id;
}

bool ServerConfigStore::remove(const QString &idOrName)
{
    int i = indexOf(idOrName);
    if (i < 0) {
        return false;
    }

    configs_.removeAt(i);
    save();
    emit configsChanged();
    return true;
}

void ServerConfigStore::load()
{
    QSettings settings;
    const QStringList entries = settings.value(ConfigsKey).toStringList();

    configs_.clear();
    for (const QString &entry : entries) {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(entry.toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "ServerConfigStore: skipping unreadable profile:"
                       << parseError.errorString();
            continue;
        }
        configs_.append(ServerConfig::fromJson(doc.object()));
    }
}

void ServerConfigStore::save()
{
    QStringList entries;
    for (const ServerConfig &config : configs_) {
        entries.append(QString::fromUtf8(
            QJsonDocument(config.toJson()).toJson(QJsonDocument::Compact)));
    }

    QSettings settings;
    settings.setValue(ConfigsKey, entries);
}
