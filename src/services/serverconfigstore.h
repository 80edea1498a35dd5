/**
 * @file serverconfigstore.h
 * @brief Persistent list of server profiles.
 */

#ifndef SERVERCONFIGSTORE_H
#define SERVERCONFIGSTORE_H

#include <QList>
#include <QObject>
#include <QString>
#include <optional>

#include "models/serverconfig.h"

/**
 * @brief Manages the saved ServerConfig profiles.
 *
 * Profiles are persisted with QSettings under `servers/configs` as a list of
 * JSON strings and loaded at construction.
 */
class ServerConfigStore : public QObject
{
    Q_OBJECT

public:
    explicit ServerConfigStore(QObject *parent = nullptr);
    ~ServerConfigStore() override = default;

    /**
     * @brief Returns all profiles.
     * @return Profiles in the order they were added.
     */
    [[nodiscard]] QList<ServerConfig> configs() const { return configs_; }

    /**
     * @brief Returns the number of profiles.
     */
    [[nodiscard]] int count() const { return static_cast<int>(configs_.size()); }

    /**
     * @brief Looks a profile up by id, then by name.
     * @param idOrName Profile id or display name.
     * @return The profile, or nullopt if none matches.
     */
    [[nodiscard]] std::optional<ServerConfig> find(const QString &idOrName) const;

public slots:
    /**
     * @brief Adds a profile or replaces the one with the same id.
     * @param config The profile. An empty id is replaced by a generated one.
     * @return The stored profile's id.
     */
    QString upsert(const ServerConfig &config);

    /**
     * @brief Removes a profile.
     * @param idOrName Profile id or display name.
     * @return True if a profile was removed.
     */
    bool remove(const QString &idOrName);

    /**
     * @brief Loads profiles from persistent storage.
     *
     * Entries that are not valid JSON objects are skipped with a warning.
     */
    void load();

    /**
     * @brief Saves profiles to persistent storage.
     */
    void save();

signals:
    /**
     * @brief Emitted when the profile list changes.
     */
    void configsChanged();

private:
    [[nodiscard]] int indexOf(const QString &idOrName) const;

    QList<ServerConfig> configs_;
};

#endif // SERVERCONFIGSTORE_H
