#ifndef ENGINECONFIG_H
#define ENGINECONFIG_H

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "UploadCommon.h"

// Configuration for an UploadEngine and the S3 client it drives.
// Every field has a default; loading from JSON only overrides present keys.
struct UploadEngineConfig {
    size_t workerCount;
    size_t queueCapacity;
    std::chrono::milliseconds retryBaseDelay;
    std::chrono::milliseconds retryMaxDelay;
    int maxAttempts;
    bool retryJitter;

    // S3 client settings
    std::chrono::milliseconds attemptTimeout;
    std::chrono::milliseconds connectTimeout;
    String region;
    String endpointOverride;
    String logLevel;

    UploadEngineConfig();

    /**
     * Creates a config from a JSON object, starting from the defaults.
     * @param config_json JSON object with any subset of the config keys
     * @return Parsed and validated config
     * @throws std::invalid_argument on a wrong type or an out-of-range value
     */
    static UploadEngineConfig from_json(const nlohmann::json& config_json);

    /**
     * Reads and parses a JSON config file.
     * @throws std::invalid_argument if the file cannot be read or parsed
     */
    static UploadEngineConfig from_file(const String& path);

    nlohmann::json to_json() const;

    // Throws std::invalid_argument naming the first bad field
    void validate() const;
};

// ENGINECONFIG_H
#endif
