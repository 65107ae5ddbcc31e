#include "s3_client_manager.h"
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/s3/S3Client.h>

using json = nlohmann::json;

bool isExpiredCredentialError(const std::string& exception_name, const std::string& message) {
    return (exception_name.find("ExpiredToken") != std::string::npos) ||
           (exception_name.find("RequestExpired") != std::string::npos) ||
           (message.find("ExpiredToken") != std::string::npos) ||
           (message.find("RequestExpired") != std::string::npos);
}

// ---------------- S3ClientManager Implementation ----------------

S3ClientManager::S3ClientManager(const S3ClientSettings& settings, CredentialFetcher fetcher,
                                 std::time_t refresh_margin)
    : settings_(settings),
      credential_fetcher_(fetcher),
      refresh_margin_(refresh_margin) {}

bool S3ClientManager::need_refresh() const {
    // Refresh if no client exists
    if (!current_client_) {
        return true;
    }

    // Static credentials never expire
    if (!current_credential_.expires()) {
        return false;
    }

    // Refresh if credentials are expiring soon (within refresh_margin_ seconds)
    // Use safe subtraction to avoid integer underflow/overflow
    if (refresh_margin_ >= current_credential_.expiration) {
        return true;
    }
    const auto current_time = std::time(nullptr);
    return current_time > current_credential_.expiration - refresh_margin_;
}

std::shared_ptr<Aws::S3::S3Client> S3ClientManager::get_client() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (need_refresh()) {
        return refresh_client();
    }

    return current_client_;
}

std::shared_ptr<Aws::S3::S3Client> S3ClientManager::refresh_client() {
    AWS_LOGSTREAM_INFO("S3ClientManager", "Refreshing S3 client for region: " << settings_.region);

    json credential_json;
    try {
        credential_json = credential_fetcher_();
    } catch (const std::exception& e) {
        AWS_LOGSTREAM_ERROR("S3ClientManager", "Failed to fetch credentials, error: " << e.what());
        throw;
    }

    S3Credential credential;
    try {
        credential = S3Credential::from_json(credential_json);
    } catch (const std::exception& e) {
        AWS_LOGSTREAM_ERROR("S3ClientManager", "Failed to parse credentials, error: " << e.what());
        throw;
    }

    // Disable IMDS: credentials always come from the fetcher
    Aws::Client::ClientConfiguration client_config;
    client_config.region = settings_.region;
    client_config.requestTimeoutMs = settings_.requestTimeoutMs;
    client_config.connectTimeoutMs = settings_.connectTimeoutMs;
    client_config.disableIMDS = true;
    // Retries are owned by the upload engine
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("S3ClientManager", 0);
    if (!settings_.endpointOverride.empty()) {
        client_config.endpointOverride = settings_.endpointOverride;
    }

    Aws::Auth::AWSCredentials aws_credentials;
    if (!credential.sessionToken.empty()) {
        AWS_LOGSTREAM_INFO("S3ClientManager", "Using temporary credentials with session token");
        aws_credentials = Aws::Auth::AWSCredentials(
            credential.accessKeyId,
            credential.secretAccessKey,
            credential.sessionToken);
    } else {
        AWS_LOGSTREAM_INFO("S3ClientManager", "Using permanent credentials");
        aws_credentials = Aws::Auth::AWSCredentials(
            credential.accessKeyId,
            credential.secretAccessKey);
    }

    auto credentials_provider = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
        "S3ClientManager", aws_credentials);

    // PayloadSigningPolicy::Never: the body is streamed from disk and not signed.
    // Path-style addressing when an endpoint override points at an S3-compatible store.
    auto s3_client = std::make_shared<Aws::S3::S3Client>(
        credentials_provider,
        client_config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        settings_.endpointOverride.empty());

    current_client_ = s3_client;
    current_credential_ = credential;

    AWS_LOGSTREAM_INFO("S3ClientManager", "Successfully refreshed S3 client");

    return s3_client;
}

std::shared_ptr<Aws::S3::S3Client> S3ClientManager::force_refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_client();
}
