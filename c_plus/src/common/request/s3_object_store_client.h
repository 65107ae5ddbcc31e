#pragma once

#include <memory>
#include <string>

#include "object_store_client.h"
#include "s3_client_manager.h"

/**
 * Maps a failed S3 response to a StoreError kind.
 * @param http_status_code HTTP status of the response, 0 or negative when no response was received
 * @param exception_name AWS exception name (e.g. "SlowDown", "NoSuchBucket")
 * @param message AWS error message
 * @param network_failure True when the SDK reported a connection-level failure
 */
StoreError classifyS3Failure(int http_status_code,
                             const std::string& exception_name,
                             const std::string& message,
                             bool network_failure);

/**
 * ObjectStoreClient backed by Aws::S3::S3Client::PutObject.
 */
class S3ObjectStoreClient : public ObjectStoreClient {
public:
    explicit S3ObjectStoreClient(std::shared_ptr<S3ClientManager> manager);

    PutObjectOutcome putObject(const std::string& bucket,
                               const std::string& key,
                               const std::shared_ptr<Aws::IOStream>& content,
                               long long size) override;

private:
    static PutObjectOutcome toStoreOutcome(const Aws::S3::Model::PutObjectOutcome& outcome,
                                           const std::string& bucket,
                                           const std::string& key);

    std::shared_ptr<S3ClientManager> manager_;  ///< Owns the cached client and its credentials
};
