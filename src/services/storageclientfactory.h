/**
 * @file storageclientfactory.h
 * @brief Picks the storage backend for a server profile.
 */

#ifndef STORAGECLIENTFACTORY_H
#define STORAGECLIENTFACTORY_H

#include <QObject>

#include "models/serverconfig.h"

class IStorageClient;

class StorageClientFactory
{
public:
    enum class Backend { S3, R2 };

    /**
     * @brief Chooses a backend from the profile's endpoint address.
     */
    [[nodiscard]] static Backend backendFor(const ServerConfig &config);

    /**
     * @brief Creates the storage client for a profile.
     * @param config The server profile; should satisfy ServerConfig::isValid().
     * @param parent Parent QObject taking ownership of the client.
     */
    [[nodiscard]] static IStorageClient *create(const ServerConfig &config,
                                                QObject *parent = nullptr);

private:
    StorageClientFactory() = default;
};

#endif // STORAGECLIENTFACTORY_H
