/**
 * @file serverconfig.h
 * @brief Connection profile for one S3-compatible bucket.
 */

#ifndef SERVERCONFIG_H
#define SERVERCONFIG_H

#include <QJsonObject>
#include <QString>

/**
 * @brief A saved server profile.
 *
 * Holds everything needed to build a storage client: the endpoint address
 * (scheme, host and optional port), credentials, bucket, and the optional
 * region and CDN URL.
 */
struct ServerConfig {
    QString id;               ///< Stable identifier, generated on creation
    QString name;             ///< Display name
    QString address;          ///< Endpoint URL, e.g. "https://s3.us-east-1.amazonaws.com"
    QString accessKeyId;
    QString secretAccessKey;
    QString bucket;
    QString region;           ///< Empty means the backend default
    QString cdnUrl;           ///< Public base URL for uploaded objects, may be empty

    /// True when the fields required to connect are present and the address parses
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static ServerConfig fromJson(const QJsonObject &json);

    /// Generates a new unique profile id
    [[nodiscard]] static QString generateId();
};

#endif // SERVERCONFIG_H
