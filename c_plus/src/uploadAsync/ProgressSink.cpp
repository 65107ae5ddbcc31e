#include "ProgressSink.h"

#include <aws/core/utils/logging/LogMacros.h>

void LoggingProgressSink::onProgressEvent(const ProgressEvent& event) {
    const TransferStatus& status = event.status;

    if (status.state == TRANSFER_FAILED) {
        AWS_LOGSTREAM_ERROR("S3BatchUpload", "Task " << event.taskId << " FAILED after " << status.attempts
                            << " attempt(s) - " << storeErrorKindName(status.lastError.kind)
                            << ": " << status.lastError.message);
    } else if (status.state == TRANSFER_RETRYING) {
        AWS_LOGSTREAM_WARN("S3BatchUpload", "Task " << event.taskId << " retrying after attempt " << status.attempts
                           << " - " << storeErrorKindName(status.lastError.kind)
                           << ": " << status.lastError.message);
    } else {
        AWS_LOGSTREAM_INFO("S3BatchUpload", "Task " << event.taskId << " " << transferStateName(status.state)
                           << " (attempts: " << status.attempts << ", size: " << status.totalSize << " bytes)");
    }
}
