#include "storageclientfactory.h"

#include "r2storageclient.h"
#include "s3storageclient.h"
#include "utils/logging.h"

StorageClientFactory::Backend StorageClientFactory::backendFor(const ServerConfig &config)
{
    return R2StorageClient::isR2Endpoint(config.address) ? Backend::R2 : Backend::S3;
}

IStorageClient *StorageClientFactory::create(const ServerConfig &config, QObject *parent)
{
    switch (backendFor(config)) {
    case Backend::R2:
        LOG_VERBOSE() << "StorageClientFactory: using R2 backend for" << config.address;
        return new R2StorageClient(config, parent);
    case Backend::S3:
        break;
    }
    LOG_VERBOSE() << "StorageClientFactory: using S3 backend for" << config.address;
    return new S3StorageClient(config, parent);
}
