#include "serverconfig.h"

#include <QUrl>
#include <QUuid>

bool ServerConfig::isValid() const
{
    if (address.isEmpty() || accessKeyId.isEmpty() ||
        secretAccessKey.isEmpty() || bucket.isEmpty()) {
        return false;
    }

    QUrl url(address);
    return url.isValid() && !url.host().isEmpty() &&
           (url.scheme() == "http" || url.scheme() == "https");
}

QJsonObject ServerConfig::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["name"] = name;
    json["address"] = address;
    json["accessKeyId"] = accessKeyId;
    json["secretAccessKey"] = secretAccessKey;
    json["bucket"] = bucket;
    if (!region.isEmpty()) {
        json["region"] = region;
    }
    if (!cdnUrl.isEmpty()) {
        json["cdnUrl"] = cdnUrl;
    }
    return json;
}

ServerConfig ServerConfig::fromJson(const QJsonObject &json)
{
    ServerConfig config;
    config.id = json["id"].toString();
    config.name = json["name"].toString();
    config.address = json["address"].toString();
    config.accessKeyId = json["accessKeyId"].toString();
    config.secretAccessKey = json["secretAccessKey"].toString();
    config.bucket = json["bucket"].toString();
    config.region = json["region"].toString();
    config.cdnUrl = json["cdnUrl"].toString();
    return config;
}

QString ServerConfig::generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
