#include "S3UploadAsync.h"

#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/core/utils/logging/LogMacros.h>

#include "../common/EngineConfig.h"
#include "../common/request/s3_client_manager.h"
#include "../common/request/s3_object_store_client.h"
#include "ProgressSink.h"
#include "UploadEngine.h"

// Global engine state
// One engine per process; the AWS SDK is initialized with it and shut down with it
static std::mutex g_engineMutex;                  // Protects g_engine and the SDK lifecycle
static std::shared_ptr<UploadEngine> g_engine;    // The running engine, null before init and after shutdown
static bool g_isInitialized = false;              // True between Aws::InitAPI and Aws::ShutdownAPI
static Aws::SDKOptions g_options;
static int g_activeCalls = 0;                     // Facade calls currently using the engine
static std::condition_variable g_callsFinished;   // Signalled when g_activeCalls drops to zero

// Response buffer for the calling thread, valid until its next call
static thread_local std::string t_response;

namespace {

Aws::Utils::Logging::LogLevel toAwsLogLevel(const String& level) {
    using Aws::Utils::Logging::LogLevel;
    if (level == "off") return LogLevel::Off;
    if (level == "fatal") return LogLevel::Fatal;
    if (level == "error") return LogLevel::Error;
    if (level == "info") return LogLevel::Info;
    if (level == "debug") return LogLevel::Debug;
    if (level == "trace") return LogLevel::Trace;
    return LogLevel::Warn;
}

const char* respond(int code, const String& message) {
    t_response = create_response(code, message);
    return t_response.c_str();
}

const char* respond(const nlohmann::json& body) {
    t_response = body.dump();
    return t_response.c_str();
}

int toResponseCode(UploadErrorCode code) {
    switch (code) {
        case UPLOAD_INVALID_TASK: return RESPONSE_INVALID_TASK;
        case UPLOAD_QUEUE_FULL: return RESPONSE_QUEUE_FULL;
        case UPLOAD_ENGINE_STOPPED: return RESPONSE_ENGINE_STOPPED;
        case UPLOAD_UNKNOWN_TASK: return RESPONSE_UNKNOWN_TASK;
    }
    return RESPONSE_INTERNAL_ERROR;
}

// Holds the running engine for the duration of one facade call.
// ShutdownUploadEngine waits for all leases to end before cleaning up the SDK.
class EngineLease {
public:
    EngineLease() {
        std::lock_guard<std::mutex> lock(g_engineMutex);
        engine_ = g_engine;
        if (engine_) {
            ++g_activeCalls;
        }
    }

    ~EngineLease() {
        if (!engine_) {
            return;
        }
        engine_.reset();
        std::lock_guard<std::mutex> lock(g_engineMutex);
        if (--g_activeCalls == 0) {
            g_callsFinished.notify_all();
        }
    }

    EngineLease(const EngineLease&) = delete;
    EngineLease& operator=(const EngineLease&) = delete;

    UploadEngine* operator->() const { return engine_.get(); }
    explicit operator bool() const { return static_cast<bool>(engine_); }

private:
    std::shared_ptr<UploadEngine> engine_;
};

// Copies data into the caller's buffer, truncating if necessary
int copyToBuffer(const std::string& data, unsigned char* buffer, int bufferSize) {
    int dataSize = static_cast<int>(data.size());
    if (dataSize > bufferSize) {
        dataSize = bufferSize;
    }
    memcpy(buffer, data.c_str(), dataSize);
    return dataSize;
}

TransferTask parseTask(const nlohmann::json& entry, size_t index) {
    if (!entry.is_object()) {
        throw UploadError(UPLOAD_INVALID_TASK, "task #" + std::to_string(index) + " must be a JSON object");
    }
    String sourcePath = entry.value("sourcePath", String());
    String bucketName = entry.value("bucketName", String());
    String objectKey = entry.value("objectKey", String());
    return makeTransferTask(sourcePath, bucketName, objectKey);
}

} // namespace

// Initializes the AWS SDK and starts the upload engine.
// Calling it again while an engine is running returns RESPONSE_SDK_INIT_SUCCESS and keeps the running engine.
extern "C" S3BATCH_API const char* InitializeUploadEngine(const char* configJson) {
    if (!configJson) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage(ErrorMessage::INVALID_PARAMETERS));
    }

    std::lock_guard<std::mutex> lock(g_engineMutex);
    if (g_engine) {
        return respond(RESPONSE_SDK_INIT_SUCCESS, "Upload engine already initialized");
    }

    try {
        // Step 1: Parse configuration and credentials
        nlohmann::json config_json = nlohmann::json::parse(configJson);
        UploadEngineConfig config = UploadEngineConfig::from_json(config_json);
        if (!config_json.contains("credentials") || !config_json.at("credentials").is_object()) {
            return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid engine config", "missing 'credentials' object"));
        }
        // Parse now so bad credentials are reported here rather than on the first upload
        try {
            S3Credential::from_json(config_json.at("credentials"));
        } catch (const std::runtime_error& e) {
            return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid engine config", e.what()));
        }
        nlohmann::json credentials = config_json.at("credentials");

        // Step 2: Initialize the AWS SDK
        if (!g_isInitialized) {
            g_options.loggingOptions.logLevel = toAwsLogLevel(config.logLevel);
            Aws::InitAPI(g_options);
            g_isInitialized = true;
        }

        // Step 3: Build the S3 backed engine
        S3ClientSettings settings;
        settings.region = config.region;
        settings.endpointOverride = config.endpointOverride;
        settings.requestTimeoutMs = static_cast<long>(config.attemptTimeout.count());
        settings.connectTimeoutMs = static_cast<long>(config.connectTimeout.count());

        auto credentials_fetcher = [credentials]() -> nlohmann::json {
            return credentials;
        };
        auto s3_client_manager = std::make_shared<S3ClientManager>(settings, credentials_fetcher);
        auto store = std::make_shared<S3ObjectStoreClient>(s3_client_manager);

        g_engine = std::make_shared<UploadEngine>(config, store);
        g_engine->addProgressSink(std::make_shared<LoggingProgressSink>());

        AWS_LOGSTREAM_INFO("S3BatchUpload", "Upload engine initialized: " << config.to_json().dump());
        return respond(RESPONSE_SDK_INIT_SUCCESS, "Upload engine initialized successfully");
    } catch (const nlohmann::json::exception& e) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid engine config", e.what()));
    } catch (const std::invalid_argument& e) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid engine config", e.what()));
    } catch (const std::exception& e) {
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to initialize upload engine", e.what()));
    } catch (...) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Unknown exception while initializing upload engine");
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to initialize upload engine", "unknown error"));
    }
}

// Submits a batch of uploads; the response lists the assigned task ids in submission order
extern "C" S3BATCH_API const char* UploadFilesAsync(const char* tasksJson) {
    if (!tasksJson) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage(ErrorMessage::INVALID_PARAMETERS));
    }

    EngineLease engine;
    if (!engine) {
        return respond(RESPONSE_ENGINE_STOPPED, formatErrorMessage(ErrorMessage::ENGINE_NOT_INITIALIZED));
    }

    try {
        nlohmann::json tasks_json = nlohmann::json::parse(tasksJson);
        if (!tasks_json.is_array()) {
            return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid task list", "expected a JSON array"));
        }

        std::vector<TransferTask> tasks;
        tasks.reserve(tasks_json.size());
        for (size_t i = 0; i < tasks_json.size(); ++i) {
            tasks.push_back(parseTask(tasks_json[i], i));
        }

        std::vector<TaskId> taskIds = engine->submit(tasks);

        nlohmann::json response;
        response["code"] = RESPONSE_SUCCESS;
        response["message"] = "Enqueued " + std::to_string(taskIds.size()) + " task(s)";
        response["taskIds"] = taskIds;
        return respond(response);
    } catch (const UploadError& e) {
        return respond(toResponseCode(e.code()), e.what());
    } catch (const nlohmann::json::exception& e) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage("Invalid task list", e.what()));
    } catch (const std::exception& e) {
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to enqueue upload tasks", e.what()));
    } catch (...) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Unknown exception while enqueuing upload tasks");
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to enqueue upload tasks", "unknown error"));
    }
}

extern "C" S3BATCH_API const char* CancelUpload(const char* taskId) {
    if (!taskId) {
        return respond(RESPONSE_INVALID_TASK, formatErrorMessage(ErrorMessage::INVALID_PARAMETERS));
    }

    EngineLease engine;
    if (!engine) {
        return respond(RESPONSE_ENGINE_STOPPED, formatErrorMessage(ErrorMessage::ENGINE_NOT_INITIALIZED));
    }

    try {
        engine->cancel(taskId);
        return respond(RESPONSE_SUCCESS, taskId);
    } catch (const UploadError& e) {
        return respond(toResponseCode(e.code()), e.what());
    } catch (const std::exception& e) {
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to cancel upload", e.what()));
    } catch (...) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Unknown exception while cancelling upload " << taskId);
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to cancel upload", "unknown error"));
    }
}

// Get upload status as byte array - safer for foreign callers than a returned pointer
// Returns the size of data copied to buffer, 0 on error
extern "C" S3BATCH_API int GetUploadStatusBytes(unsigned char* buffer, int bufferSize) {
    if (!buffer || bufferSize <= 0) {
        return 0;
    }

    EngineLease engine;
    if (!engine) {
        return copyToBuffer(create_response(RESPONSE_ENGINE_STOPPED,
                                            formatErrorMessage(ErrorMessage::ENGINE_NOT_INITIALIZED)),
                            buffer, bufferSize);
    }

    try {
        EngineStats stats = engine->stats();

        nlohmann::json response;
        response["code"] = RESPONSE_SUCCESS;
        response["totalUploadCount"] = stats.total;
        response["queuedCount"] = stats.queued;
        response["inProgressCount"] = stats.inProgress + stats.retrying;
        response["succeededCount"] = stats.succeeded;
        response["failedCount"] = stats.failed;
        response["cancelledCount"] = stats.cancelled;
        response["uploads"] = snapshotToJson(engine->snapshot());
        return copyToBuffer(response.dump(), buffer, bufferSize);
    } catch (const std::exception& e) {
        return copyToBuffer(create_response(RESPONSE_INTERNAL_ERROR,
                                            formatErrorMessage("Failed to get upload status", e.what())),
                            buffer, bufferSize);
    } catch (...) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Unknown exception while reading upload status");
        return 0;
    }
}

// Stops the engine (draining up to drainTimeoutMs) and cleans up the AWS SDK
extern "C" S3BATCH_API const char* ShutdownUploadEngine(int drainTimeoutMs) {
    std::shared_ptr<UploadEngine> engine;
    {
        std::lock_guard<std::mutex> lock(g_engineMutex);
        if (!g_isInitialized) {
            return respond(RESPONSE_ENGINE_STOPPED, formatErrorMessage(ErrorMessage::ENGINE_NOT_INITIALIZED));
        }
        engine.swap(g_engine);
    }

    try {
        if (engine) {
            engine->shutdown(std::chrono::milliseconds(drainTimeoutMs < 0 ? 0 : drainTimeoutMs));
        }

        std::unique_lock<std::mutex> lock(g_engineMutex);
        // The S3 client must be released before the SDK goes away, including
        // copies held by facade calls that started before the swap
        engine.reset();
        g_callsFinished.wait(lock, [] { return g_activeCalls == 0; });
        if (g_isInitialized && !g_engine) {
            Aws::ShutdownAPI(g_options);
            g_isInitialized = false;
        }
        return respond(RESPONSE_SDK_CLEAN_SUCCESS, "Upload engine stopped and AWS SDK cleaned up");
    } catch (const std::exception& e) {
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to shut down upload engine", e.what()));
    } catch (...) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Unknown exception while shutting down upload engine");
        return respond(RESPONSE_INTERNAL_ERROR, formatErrorMessage("Failed to shut down upload engine", "unknown error"));
    }
}
