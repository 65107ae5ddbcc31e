#include "s3_object_store_client.h"
#include <aws/core/utils/logging/LogMacros.h>
#include <aws/s3/model/PutObjectRequest.h>

static bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

StoreError classifyS3Failure(int http_status_code,
                             const std::string& exception_name,
                             const std::string& message,
                             bool network_failure) {
    // Authentication problems first: S3 reports some of them as 403
    if (http_status_code == 401 ||
        containsAny(exception_name, {"InvalidAccessKeyId", "SignatureDoesNotMatch", "ExpiredToken",
                                     "InvalidToken", "RequestExpired"})) {
        return StoreError(STORE_AUTHENTICATION_FAILED, message, http_status_code);
    }
    if (http_status_code == 429 ||
        containsAny(exception_name, {"SlowDown", "Throttling", "RequestLimitExceeded"})) {
        return StoreError(STORE_THROTTLED, message, http_status_code);
    }
    if (http_status_code == 408 || containsAny(exception_name, {"RequestTimeout"})) {
        return StoreError(STORE_TIMEOUT, message, http_status_code);
    }
    if (http_status_code == 403 || containsAny(exception_name, {"AccessDenied"})) {
        return StoreError(STORE_ACCESS_DENIED, message, http_status_code);
    }
    if (http_status_code == 404 || containsAny(exception_name, {"NoSuchBucket", "NoSuchKey"})) {
        return StoreError(STORE_NOT_FOUND, message, http_status_code);
    }
    if (http_status_code == 400 ||
        containsAny(exception_name, {"InvalidBucketName", "KeyTooLong", "InvalidArgument"})) {
        return StoreError(STORE_INVALID_REQUEST, message, http_status_code);
    }
    if (http_status_code >= 500 && http_status_code < 600) {
        return StoreError(STORE_SERVER_ERROR, message, http_status_code);
    }
    if (network_failure || http_status_code <= 0) {
        if (containsAny(message, {"timeout", "Timeout", "timed out"})) {
            return StoreError(STORE_TIMEOUT, message, 0);
        }
        return StoreError(STORE_CONNECTION_RESET, message, 0);
    }
    return StoreError(STORE_UNKNOWN, message, http_status_code);
}

S3ObjectStoreClient::S3ObjectStoreClient(std::shared_ptr<S3ClientManager> manager)
    : manager_(std::move(manager)) {}

PutObjectOutcome S3ObjectStoreClient::putObject(const std::string& bucket,
                                                const std::string& key,
                                                const std::shared_ptr<Aws::IOStream>& content,
                                                long long size) {
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetBody(content);
    request.SetContentLength(size);
    request.SetContentType("application/octet-stream");

    AWS_LOGSTREAM_DEBUG("S3ObjectStoreClient", "PutObject - Bucket: " << bucket
                        << ", Key: " << key << ", Size: " << size << " bytes");

    try {
        auto outcome = manager_->with_auto_refresh([&](std::shared_ptr<Aws::S3::S3Client> client) {
            // The SDK may have consumed the stream on an expired-credential attempt
            content->clear();
            content->seekg(0, std::ios::beg);
            return client->PutObject(request);
        });
        return toStoreOutcome(outcome, bucket, key);
    } catch (const std::exception& e) {
        // Credential fetch or parse failure
        AWS_LOGSTREAM_ERROR("S3ObjectStoreClient", "Cannot obtain S3 client: " << e.what());
        return PutObjectOutcome(StoreError(STORE_AUTHENTICATION_FAILED, e.what()));
    }
}

PutObjectOutcome S3ObjectStoreClient::toStoreOutcome(const Aws::S3::Model::PutObjectOutcome& outcome,
                                                     const std::string& bucket,
                                                     const std::string& key) {
    if (outcome.IsSuccess()) {
        if (outcome.GetResult().GetETag().size() > 0) {
            AWS_LOGSTREAM_DEBUG("S3ObjectStoreClient", "Upload ETag: " << outcome.GetResult().GetETag());
        }
        return PutObjectOutcome(Aws::NoResult());
    }

    const auto& error = outcome.GetError();
    const std::string exception_name = error.GetExceptionName().c_str();
    const std::string message = error.GetMessage().c_str();
    const int http_status_code = static_cast<int>(error.GetResponseCode());
    const bool network_failure =
        error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION ||
        error.GetErrorType() == Aws::S3::S3Errors::REQUEST_TIMEOUT;

    StoreError store_error = classifyS3Failure(http_status_code, exception_name, message, network_failure);

    AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "PutObject failed for " << bucket << "/" << key);
    AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "  - Error Type: " << exception_name);
    AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "  - Error Message: " << message);
    AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "  - HTTP Response Code: " << http_status_code);
    if (error.GetRequestId().size() > 0) {
        AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "  - Request ID: " << error.GetRequestId());
    }
    AWS_LOGSTREAM_WARN("S3ObjectStoreClient", "  - Classified as: " << storeErrorKindName(store_error.kind));

    return PutObjectOutcome(store_error);
}
