#include "UploadCommon.h"

#include <fstream>

String create_response(int code, const String& message) {
    nlohmann::json response;
    response["code"] = code;
    response["message"] = message;
    return response.dump();
}

// Format error message helper function
String formatErrorMessage(const String& baseMessage, const String& detail) {
    if (detail.empty()) {
        return baseMessage;
    }
    return baseMessage + ": " + detail;
}

const char* transferStateName(TransferState state) {
    switch (state) {
        case TRANSFER_QUEUED: return "Queued";
        case TRANSFER_IN_PROGRESS: return "InProgress";
        case TRANSFER_RETRYING: return "Retrying";
        case TRANSFER_SUCCEEDED: return "Succeeded";
        case TRANSFER_FAILED: return "Failed";
        case TRANSFER_CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

bool isTerminalState(TransferState state) {
    return state == TRANSFER_SUCCEEDED || state == TRANSFER_FAILED || state == TRANSFER_CANCELLED;
}

bool isValidTransition(TransferState from, TransferState to) {
    switch (from) {
        case TRANSFER_QUEUED:
            return to == TRANSFER_IN_PROGRESS || to == TRANSFER_CANCELLED;
        case TRANSFER_IN_PROGRESS:
            return to == TRANSFER_RETRYING || to == TRANSFER_SUCCEEDED ||
                   to == TRANSFER_FAILED || to == TRANSFER_CANCELLED;
        case TRANSFER_RETRYING:
            return to == TRANSFER_IN_PROGRESS || to == TRANSFER_CANCELLED;
        case TRANSFER_SUCCEEDED:
        case TRANSFER_FAILED:
        case TRANSFER_CANCELLED:
            return false;
    }
    return false;
}

const char* storeErrorKindName(StoreErrorKind kind) {
    switch (kind) {
        case STORE_TIMEOUT: return "Timeout";
        case STORE_CONNECTION_RESET: return "ConnectionReset";
        case STORE_THROTTLED: return "Throttled";
        case STORE_SERVER_ERROR: return "ServerError";
        case STORE_NOT_FOUND: return "NotFound";
        case STORE_ACCESS_DENIED: return "AccessDenied";
        case STORE_AUTHENTICATION_FAILED: return "AuthenticationFailed";
        case STORE_INVALID_REQUEST: return "InvalidRequest";
        case STORE_SOURCE_MISSING: return "SourceMissing";
        case STORE_UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

bool fileExists(const String& filePath) {
    if (filePath.empty()) return false;

    std::ifstream file(filePath);
    return file.good();
}

long long getLocalFileSize(const String& filePath) {
    if (filePath.empty()) return -1;

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return -1;
    }
    return static_cast<long long>(file.tellg());
}

String extractFileName(const String& path) {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash == String::npos) {
        return path;
    }
    if (lastSlash == path.length() - 1) {
        return "";
    }
    return path.substr(lastSlash + 1);
}

TransferTask makeTransferTask(const String& sourcePath, const String& bucketName, const String& objectKey) {
    long long size = getLocalFileSize(sourcePath);
    TransferTask task(sourcePath, bucketName, objectKey, size < 0 ? 0 : size);
    if (task.objectKey.empty()) {
        task.objectKey = extractFileName(sourcePath);
    }
    return task;
}

String getTaskId(const String& engineTag, unsigned long long sequence) {
    return engineTag + TASK_ID_SEPARATOR + std::to_string(sequence);
}

nlohmann::json statusToJson(const TaskId& taskId, const TransferStatus& status) {
    nlohmann::json entry;
    entry["taskId"] = taskId;
    entry["state"] = transferStateName(status.state);
    entry["status"] = static_cast<int>(status.state);
    entry["attempts"] = status.attempts;
    entry["totalSize"] = status.totalSize;
    if (status.hasError) {
        entry["errorKind"] = storeErrorKindName(status.lastError.kind);
        entry["errorMessage"] = status.lastError.message;
        if (status.lastError.httpStatusCode != 0) {
            entry["httpStatusCode"] = status.lastError.httpStatusCode;
        }
    }
    return entry;
}

nlohmann::json snapshotToJson(const StatusSnapshot& snapshot) {
    nlohmann::json uploads = nlohmann::json::array();
    for (const auto& pair : snapshot) {
        uploads.push_back(statusToJson(pair.first, pair.second));
    }
    return uploads;
}

nlohmann::json eventToJson(const ProgressEvent& event) {
    nlohmann::json entry = statusToJson(event.taskId, event.status);
    entry["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();
    return entry;
}
