#include "EngineConfig.h"

#include <fstream>

using json = nlohmann::json;

namespace {

const char* const kLogLevels[] = {"off", "fatal", "error", "warn", "info", "debug", "trace"};

long long readPositiveInteger(const json& config_json, const char* key, long long current) {
    if (!config_json.contains(key)) {
        return current;
    }
    const auto& value = config_json.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(String("Config key '") + key + "' must be an integer");
    }
    long long parsed = value.get<long long>();
    if (parsed <= 0) {
        throw std::invalid_argument(String("Config key '") + key + "' must be positive, got " + std::to_string(parsed));
    }
    return parsed;
}

String readString(const json& config_json, const char* key, const String& current) {
    if (!config_json.contains(key)) {
        return current;
    }
    const auto& value = config_json.at(key);
    if (!value.is_string()) {
        throw std::invalid_argument(String("Config key '") + key + "' must be a string");
    }
    return value.get<String>();
}

} // namespace

UploadEngineConfig::UploadEngineConfig()
    : workerCount(DEFAULT_WORKER_COUNT),
      queueCapacity(DEFAULT_QUEUE_CAPACITY),
      retryBaseDelay(DEFAULT_RETRY_BASE_DELAY_MS),
      retryMaxDelay(DEFAULT_RETRY_MAX_DELAY_MS),
      maxAttempts(DEFAULT_MAX_ATTEMPTS),
      retryJitter(true),
      attemptTimeout(DEFAULT_ATTEMPT_TIMEOUT_MS),
      connectTimeout(DEFAULT_CONNECT_TIMEOUT_MS),
      region("us-east-1"),
      logLevel("warn") {}

UploadEngineConfig UploadEngineConfig::from_json(const json& config_json) {
    if (!config_json.is_object()) {
        throw std::invalid_argument("Engine config must be a JSON object");
    }

    UploadEngineConfig config;
    config.workerCount = static_cast<size_t>(
        readPositiveInteger(config_json, "workerCount", static_cast<long long>(config.workerCount)));
    config.queueCapacity = static_cast<size_t>(
        readPositiveInteger(config_json, "queueCapacity", static_cast<long long>(config.queueCapacity)));
    config.retryBaseDelay = std::chrono::milliseconds(
        readPositiveInteger(config_json, "retryBaseDelayMs", config.retryBaseDelay.count()));
    config.retryMaxDelay = std::chrono::milliseconds(
        readPositiveInteger(config_json, "retryMaxDelayMs", config.retryMaxDelay.count()));
    config.maxAttempts = static_cast<int>(
        readPositiveInteger(config_json, "maxAttempts", config.maxAttempts));
    config.attemptTimeout = std::chrono::milliseconds(
        readPositiveInteger(config_json, "attemptTimeoutMs", config.attemptTimeout.count()));
    config.connectTimeout = std::chrono::milliseconds(
        readPositiveInteger(config_json, "connectTimeoutMs", config.connectTimeout.count()));

    if (config_json.contains("retryJitter")) {
        const auto& jitter = config_json.at("retryJitter");
        if (!jitter.is_boolean()) {
            throw std::invalid_argument("Config key 'retryJitter' must be a boolean");
        }
        config.retryJitter = jitter.get<bool>();
    }

    config.region = readString(config_json, "region", config.region);
    config.endpointOverride = readString(config_json, "endpointOverride", config.endpointOverride);
    config.logLevel = readString(config_json, "logLevel", config.logLevel);

    config.validate();
    return config;
}

UploadEngineConfig UploadEngineConfig::from_file(const String& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }

    json config_json;
    try {
        input >> config_json;
    } catch (const json::exception& e) {
        throw std::invalid_argument("Invalid JSON in config file " + path + ": " + e.what());
    }
    return from_json(config_json);
}

json UploadEngineConfig::to_json() const {
    json config_json;
    config_json["workerCount"] = workerCount;
    config_json["queueCapacity"] = queueCapacity;
    config_json["retryBaseDelayMs"] = retryBaseDelay.count();
    config_json["retryMaxDelayMs"] = retryMaxDelay.count();
    config_json["maxAttempts"] = maxAttempts;
    config_json["retryJitter"] = retryJitter;
    config_json["attemptTimeoutMs"] = attemptTimeout.count();
    config_json["connectTimeoutMs"] = connectTimeout.count();
    config_json["region"] = region;
    config_json["endpointOverride"] = endpointOverride;
    config_json["logLevel"] = logLevel;
    return config_json;
}

void UploadEngineConfig::validate() const {
    if (workerCount == 0) {
        throw std::invalid_argument("Config key 'workerCount' must be at least 1");
    }
    if (queueCapacity == 0) {
        throw std::invalid_argument("Config key 'queueCapacity' must be at least 1");
    }
    if (maxAttempts < 1) {
        throw std::invalid_argument("Config key 'maxAttempts' must be at least 1");
    }
    if (retryBaseDelay.count() < 0 || retryMaxDelay < retryBaseDelay) {
        throw std::invalid_argument("Config key 'retryMaxDelayMs' must not be smaller than 'retryBaseDelayMs'");
    }
    if (region.empty()) {
        throw std::invalid_argument("Config key 'region' must not be empty");
    }

    bool knownLevel = false;
    for (const char* level : kLogLevels) {
        if (logLevel == level) {
            knownLevel = true;
            break;
        }
    }
    if (!knownLevel) {
        throw std::invalid_argument("Config key 'logLevel' has unknown value '" + logLevel + "'");
    }
}
