#pragma once

#include <aws/s3/S3Client.h>
#include <aws/core/utils/logging/LogMacros.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <ctime>
#include <string>
#include <functional>
#include <stdexcept>
#include <limits>

/**
 * Function type for fetching AWS S3 credentials.
 * Returns a JSON object with accessKeyId, secretAccessKey and optionally
 * sessionToken and expirationTimestampSecondsInUTC.
 */
using CredentialFetcher = std::function<nlohmann::json()>;

/**
 * Structure representing AWS S3 credentials including access key, secret key,
 * session token, and expiration timestamp.
 */
struct S3Credential {
    std::string accessKeyId;      ///< AWS access key ID
    std::string secretAccessKey;  ///< AWS secret access key
    std::string sessionToken;     ///< AWS session token (for temporary credentials)
    std::time_t expiration;       ///< Expiration timestamp in seconds, 0 for credentials that never expire

    S3Credential() : expiration(0) {}

    /**
     * Creates an S3Credential object from a JSON object.
     * @param credential_json JSON object containing the credential fields
     * @return S3Credential object parsed from the JSON
     * @throws std::runtime_error if required JSON fields are missing or malformed
     */
    static S3Credential from_json(const nlohmann::json& credential_json) {
        try {
            S3Credential credential;
            credential.accessKeyId     = credential_json.at("accessKeyId").get<std::string>();
            credential.secretAccessKey = credential_json.at("secretAccessKey").get<std::string>();
            if (credential_json.contains("sessionToken")) {
                credential.sessionToken = credential_json.at("sessionToken").get<std::string>();
            }

            if (credential_json.contains("expirationTimestampSecondsInUTC")) {
                // Safe conversion with overflow/underflow checking
                const std::string expiration_str = credential_json.at("expirationTimestampSecondsInUTC").get<std::string>();
                const long long expiration_ll = std::stoll(expiration_str);

                // time_t may be 32-bit or 64-bit
                if (expiration_ll < 0 ||
                    expiration_ll > static_cast<long long>((std::numeric_limits<std::time_t>::max)())) {
                    throw std::out_of_range("Expiration timestamp out of range: " + expiration_str);
                }
                credential.expiration = static_cast<std::time_t>(expiration_ll);
            }

            return credential;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Invalid expiration timestamp format: " + std::string(e.what()));
        } catch (const std::out_of_range& e) {
            throw std::runtime_error(e.what());
        }
    }

    bool expires() const { return expiration != 0; }
};

/**
 * Client settings taken from the engine configuration.
 */
struct S3ClientSettings {
    std::string region;
    std::string endpointOverride;
    long requestTimeoutMs;
    long connectTimeoutMs;

    S3ClientSettings() : region("us-east-1"), requestTimeoutMs(30000), connectTimeoutMs(10000) {}
};

/**
 * Manages an AWS S3 client with automatic credential refresh.
 * The client is rebuilt when no client exists yet or when the cached
 * credentials expire within refresh_margin seconds.
 * Thread-safe implementation using mutex for concurrent access.
 */
class S3ClientManager {
public:
    /**
     * Constructs an S3ClientManager.
     * @param settings Region, endpoint and timeouts for the client
     * @param fetcher Function to fetch AWS credentials
     * @param refresh_margin Time margin in seconds before expiration to trigger refresh
     */
    S3ClientManager(const S3ClientSettings& settings, CredentialFetcher fetcher,
                    std::time_t refresh_margin = 300);

    /**
     * Gets the S3 client, refreshing credentials if needed.
     * @return Shared pointer to the S3 client
     * @throws std::runtime_error if credentials cannot be fetched or parsed
     */
    std::shared_ptr<Aws::S3::S3Client> get_client();

    /**
     * Force refresh the S3 client regardless of current cached state.
     * Thread-safe.
     */
    std::shared_ptr<Aws::S3::S3Client> force_refresh();

    /**
     * Execute an S3 operation with auto refresh and a retry on expired credentials.
     * The callable should accept a shared_ptr<Aws::S3::S3Client> and return an AWS Outcome type
     * that provides IsSuccess() and GetError().
     * @tparam Func Callable type
     * @param func  Callable receiving shared_ptr<S3Client> and returning Outcome
     * @return Outcome returned by the callable (possibly from the retry)
     */
    template <typename Func>
    auto with_auto_refresh(Func&& func)
        -> decltype(func(std::declval<std::shared_ptr<Aws::S3::S3Client>>()));

    const S3ClientSettings& settings() const { return settings_; }

private:
    /**
     * Checks if the S3 client needs to be refreshed.
     * @return true if refresh is needed (no client, or credentials expiring soon)
     */
    bool need_refresh() const;

    /**
     * Refreshes the S3 client by fetching new credentials and creating a new client.
     * Caller must hold mutex_.
     * @return Shared pointer to the newly created S3 client
     */
    std::shared_ptr<Aws::S3::S3Client> refresh_client();

    S3ClientSettings settings_;                           ///< Region, endpoint and timeouts
    CredentialFetcher credential_fetcher_;               ///< Function to fetch AWS credentials
    std::time_t refresh_margin_;                          ///< Seconds before expiration to trigger refresh

    std::shared_ptr<Aws::S3::S3Client> current_client_;  ///< Currently cached S3 client
    S3Credential current_credential_;                     ///< Currently cached credentials

    std::mutex mutex_;  ///< Mutex for thread-safe access
};

// True when an S3 error says the credentials have expired
bool isExpiredCredentialError(const std::string& exception_name, const std::string& message);

// ---- Template implementation ----
// Retry limit for expired-credential retries used by with_auto_refresh()
static const int kMaxExpiredRetries = 3;
template <typename Func>
auto S3ClientManager::with_auto_refresh(Func&& func)
    -> decltype(func(std::declval<std::shared_ptr<Aws::S3::S3Client>>())) {
    int attempt = 0;
    std::shared_ptr<Aws::S3::S3Client> client = get_client();

    while (true) {
        auto outcome = func(client);

        if (outcome.IsSuccess()) {
            return outcome;
        }

        const auto& error = outcome.GetError();
        const bool is_expired = isExpiredCredentialError(error.GetExceptionName().c_str(),
                                                         error.GetMessage().c_str());

        if (!is_expired || attempt >= kMaxExpiredRetries) {
            return outcome;
        }

        AWS_LOGSTREAM_INFO("S3ClientManager", "Detected expired credentials, refreshing and retrying (attempt "
                           << (attempt + 1) << "/" << kMaxExpiredRetries << ")");
        client = force_refresh();
        ++attempt;
    }
}
