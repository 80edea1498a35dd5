#include "r2storageclient.h"

#include <QUrl>

namespace {
const QString R2HostSuffix = QStringLiteral(".r2.cloudflarestorage.com");
}

R2StorageClient::R2StorageClient(const ServerConfig &config, QObject *parent)
    : S3StorageClient(config, true, QString(R2Region), parent)
{
}

bool R2StorageClient::isR2Endpoint(const QString &address)
{
    QString host = QUrl(address).host().toLower();
    return host.endsWith(R2HostSuffix) || host == R2HostSuffix.mid(1);
}
