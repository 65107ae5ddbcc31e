#pragma once

#include <aws/core/NoResult.h>
#include <aws/core/utils/Outcome.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <memory>
#include <string>

#include "../UploadCommon.h"

/**
 * Result of a single putObject call: Aws::NoResult on success, StoreError on failure.
 */
using PutObjectOutcome = Aws::Utils::Outcome<Aws::NoResult, StoreError>;

/**
 * Capability consumed by UploadWorker: store one object.
 * Implementations must be safe to call from several worker threads at once and
 * must tolerate re-uploading the same key (PUT is idempotent).
 * Failures are returned, not thrown.
 */
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    /**
     * Uploads content as bucket/key.
     * @param bucket Target bucket name
     * @param key Target object key
     * @param content Readable stream positioned at the first byte
     * @param size Number of bytes to send
     * @return Success, or a StoreError with a machine-checkable kind
     */
    virtual PutObjectOutcome putObject(const std::string& bucket,
                                       const std::string& key,
                                       const std::shared_ptr<Aws::IOStream>& content,
                                       long long size) = 0;
};
