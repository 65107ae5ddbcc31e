#ifndef UPLOADCOMMON_H
#define UPLOADCOMMON_H

#include <memory>
#include <string>
#include <chrono>
#include <map>
#include <vector>
#include <stdexcept>

#include <nlohmann/json.hpp>

// Type aliases for cleaner code
using String = std::string;

// Shared library export macro definition
#if defined(_WIN32)
#ifdef S3BATCH_EXPORTS
#define S3BATCH_API __declspec(dllexport)
#else
#define S3BATCH_API __declspec(dllimport)
#endif
#else
#define S3BATCH_API __attribute__((visibility("default")))
#endif

// Default engine configuration
// Number of worker threads in the upload pool
static const size_t DEFAULT_WORKER_COUNT = 4;
// Maximum number of queued uploads allowed
static const size_t DEFAULT_QUEUE_CAPACITY = 100;
// Maximum number of putObject attempts per task
static const int DEFAULT_MAX_ATTEMPTS = 5;
static const long long DEFAULT_RETRY_BASE_DELAY_MS = 500;
static const long long DEFAULT_RETRY_MAX_DELAY_MS = 30000;
// 30 seconds request timeout, 10 seconds connect timeout
static const long long DEFAULT_ATTEMPT_TIMEOUT_MS = 30000;
static const long long DEFAULT_CONNECT_TIMEOUT_MS = 10000;

// Task ID separator constant (used in taskId = engineTag + "_" + sequence)
static const String TASK_ID_SEPARATOR = "_";

// Opaque unique token identifying one transfer
using TaskId = String;

// Error message constants
namespace ErrorMessage {
    const String INVALID_PARAMETERS = "Invalid parameters: one or more required parameters are null";
    const String ENGINE_NOT_INITIALIZED = "Upload engine not initialized. Call InitializeUploadEngine() first";
    const String EMPTY_SOURCE_PATH = "Source path is empty";
    const String EMPTY_BUCKET_NAME = "Bucket name is empty";
    const String NEGATIVE_SIZE = "Size in bytes is negative";
    const String QUEUE_FULL = "Upload queue is full";
    const String ENGINE_STOPPED = "Upload engine is not accepting new tasks";
    const String UNKNOWN_TASK = "No task with this id";
    const String CANNOT_OPEN_FILE = "Cannot open file for reading";
    const String UPLOAD_EXCEPTION = "Upload failed with exception";
    const String UNKNOWN_ERROR = "Unknown error";
}

// Format error message helper function
String formatErrorMessage(const String& baseMessage, const String& detail = "");

// Transfer state enumeration - defines possible states of a transfer task
enum TransferState {
    // Task is waiting in the queue
    TRANSFER_QUEUED = 0,
    // A worker is executing putObject for the task
    TRANSFER_IN_PROGRESS = 1,
    // Last attempt failed with a transient error, waiting for backoff
    TRANSFER_RETRYING = 2,
    // Upload completed successfully
    TRANSFER_SUCCEEDED = 3,
    // Upload failed with a permanent error or ran out of attempts
    TRANSFER_FAILED = 4,
    // Upload was cancelled by user or by shutdown
    TRANSFER_CANCELLED = 5
};

const char* transferStateName(TransferState state);

bool isTerminalState(TransferState state);

// Allowed edges: Queued -> InProgress -> {Retrying -> InProgress}* -> terminal.
// Queued and Retrying tasks may also be cancelled; nothing leaves a terminal state.
bool isValidTransition(TransferState from, TransferState to);

// Machine-checkable store error kinds
enum StoreErrorKind {
    STORE_TIMEOUT = 0,
    STORE_CONNECTION_RESET = 1,
    STORE_THROTTLED = 2,
    STORE_SERVER_ERROR = 3,
    STORE_NOT_FOUND = 4,
    STORE_ACCESS_DENIED = 5,
    STORE_AUTHENTICATION_FAILED = 6,
    STORE_INVALID_REQUEST = 7,
    STORE_SOURCE_MISSING = 8,
    STORE_UNKNOWN = 9
};

const char* storeErrorKindName(StoreErrorKind kind);

// Failure reported by an ObjectStoreClient or by the worker itself
struct StoreError {
    StoreErrorKind kind;
    String message;
    // 0 when the failure happened before an HTTP response was received
    int httpStatusCode;

    StoreError() : kind(STORE_UNKNOWN), httpStatusCode(0) {}
    StoreError(StoreErrorKind k, const String& msg, int httpCode = 0)
        : kind(k), message(msg), httpStatusCode(httpCode) {}
};

// Immutable description of one file-to-object transfer
struct TransferTask {
    // Assigned by UploadEngine::submit; ignored on input
    TaskId id;
    String sourcePath;
    String bucketName;
    String objectKey;
    long long sizeBytes;

    TransferTask() : sizeBytes(0) {}
    TransferTask(const String& source, const String& bucket, const String& key, long long size)
        : sourcePath(source), bucketName(bucket), objectKey(key), sizeBytes(size) {}
};

// Builds a task for a local file. sizeBytes is 0 when the file cannot be stat'ed;
// an empty objectKey is replaced with the file name.
TransferTask makeTransferTask(const String& sourcePath, const String& bucketName, const String& objectKey = "");

// Per-task status, owned by UploadEngine and copied out by snapshot()
struct TransferStatus {
    TransferState state;
    // Number of putObject calls made so far
    int attempts;
    bool hasError;
    StoreError lastError;
    long long totalSize;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;

    TransferStatus() : state(TRANSFER_QUEUED), attempts(0), hasError(false), totalSize(0) {}
};

// One record of the progress stream
struct ProgressEvent {
    TaskId taskId;
    TransferStatus status;
    std::chrono::system_clock::time_point timestamp;
};

// Point-in-time copy of every task the engine knows about
using StatusSnapshot = std::map<TaskId, TransferStatus>;

// Errors raised by the UploadEngine API
enum UploadErrorCode {
    UPLOAD_INVALID_TASK = 1,
    UPLOAD_QUEUE_FULL = 2,
    UPLOAD_ENGINE_STOPPED = 3,
    UPLOAD_UNKNOWN_TASK = 4
};

class UploadError : public std::runtime_error {
public:
    UploadError(UploadErrorCode code, const String& message)
        : std::runtime_error(message), code_(code) {}

    UploadErrorCode code() const { return code_; }

private:
    UploadErrorCode code_;
};

// Check if file exists
bool fileExists(const String& filePath);

// Get file size, -1 if the file cannot be opened
long long getLocalFileSize(const String& filePath);

// Extract file name from a path or object key
// Returns the last segment after the last slash
String extractFileName(const String& path);

// Build a task ID from the engine tag and a per-engine sequence number
String getTaskId(const String& engineTag, unsigned long long sequence);

// JSON rendering of statuses and events
nlohmann::json statusToJson(const TaskId& taskId, const TransferStatus& status);
nlohmann::json snapshotToJson(const StatusSnapshot& snapshot);
nlohmann::json eventToJson(const ProgressEvent& event);

// Common response document used by the C facade
String create_response(int code, const String& message);

// UPLOADCOMMON_H
#endif
