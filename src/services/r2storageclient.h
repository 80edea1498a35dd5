/**
 * @file r2storageclient.h
 * @brief Cloudflare R2 flavour of the S3 backend.
 */

#ifndef R2STORAGECLIENT_H
#define R2STORAGECLIENT_H

#include "s3storageclient.h"

/**
 * @brief S3 backend preconfigured for Cloudflare R2 endpoints.
 *
 * R2 is addressed path style at
 * `https://<account>.r2.cloudflarestorage.com/<bucket>/<key>` and signs
 * every request for the pseudo-region "auto", whatever the profile says.
 */
class R2StorageClient : public S3StorageClient
{
    Q_OBJECT

public:
    /// Signing region R2 requires
    static constexpr const char *R2Region = "auto";

    explicit R2StorageClient(const ServerConfig &config, QObject *parent = nullptr);
    ~R2StorageClient() override = default;

    /**
     * @brief Checks whether an endpoint address points at Cloudflare R2.
     */
    [[nodiscard]] static bool isR2Endpoint(const QString &address);
};

#endif // R2STORAGECLIENT_H
