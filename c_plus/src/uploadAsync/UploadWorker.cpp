#include "UploadWorker.h"

#include <aws/core/utils/logging/LogMacros.h>
#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>

UploadWorker::UploadWorker(ObjectStoreClient& client, const RetryPolicy& retryPolicy,
                           TransferControl& control, unsigned int seed)
    : client_(client),
      retryPolicy_(retryPolicy),
      control_(control),
      rng_(seed) {}

void UploadWorker::markCancelled(TransferRecord& record, TransferStatus status) {
    status.state = TRANSFER_CANCELLED;
    status.endTime = std::chrono::steady_clock::now();
    if (control_.transition(record, status)) {
        AWS_LOGSTREAM_INFO("UploadWorker", "Upload CANCELLED for ID: " << record.task.id
                           << " after " << status.attempts << " attempt(s)");
    }
}

PutObjectOutcome UploadWorker::attemptUpload(const TransferTask& task, long long& totalSize) {
    // Open file stream for reading
    auto inputData = Aws::MakeShared<Aws::FStream>("UploadWorker",
                                                   task.sourcePath.c_str(),
                                                   std::ios_base::in | std::ios_base::binary);
    if (!inputData->is_open()) {
        return PutObjectOutcome(StoreError(STORE_SOURCE_MISSING,
            formatErrorMessage(ErrorMessage::CANNOT_OPEN_FILE, task.sourcePath)));
    }

    // The file may have changed since submission; send what is on disk now
    inputData->seekg(0, std::ios::end);
    totalSize = static_cast<long long>(inputData->tellg());
    inputData->seekg(0, std::ios::beg);

    try {
        return client_.putObject(task.bucketName, task.objectKey, inputData, totalSize);
    } catch (const std::exception& e) {
        AWS_LOGSTREAM_ERROR("UploadWorker", "Exception from object store for ID: " << task.id << ": " << e.what());
        return PutObjectOutcome(StoreError(STORE_UNKNOWN,
            formatErrorMessage(ErrorMessage::UPLOAD_EXCEPTION, e.what())));
    } catch (...) {
        AWS_LOGSTREAM_ERROR("UploadWorker", "Unknown exception from object store for ID: " << task.id);
        return PutObjectOutcome(StoreError(STORE_UNKNOWN, ErrorMessage::UNKNOWN_ERROR));
    }
}

void UploadWorker::execute(TransferRecord& record) {
    const TransferTask& task = record.task;
    TransferStatus status = control_.currentStatus(record);

    // Cancelled between dequeue and start
    if (record.shouldCancel.load()) {
        markCancelled(record, status);
        return;
    }

    status.startTime = std::chrono::steady_clock::now();
    status.totalSize = task.sizeBytes;
    int unrecognizedRetries = 0;

    AWS_LOGSTREAM_INFO("UploadWorker", "=== Starting Upload ===");
    AWS_LOGSTREAM_INFO("UploadWorker", "Upload ID: " << task.id);
    AWS_LOGSTREAM_INFO("UploadWorker", "File: " << task.sourcePath << " -> " << task.bucketName << "/" << task.objectKey);

    while (true) {
        // Check for cancellation before each attempt
        if (record.shouldCancel.load()) {
            markCancelled(record, status);
            return;
        }

        status.state = TRANSFER_IN_PROGRESS;
        status.attempts++;
        if (!control_.transition(record, status)) {
            return;
        }

        AWS_LOGSTREAM_INFO("UploadWorker", "Executing PutObject (attempt " << status.attempts << "/"
                           << retryPolicy_.maxAttempts() << ") for upload ID: " << task.id);
        PutObjectOutcome outcome = attemptUpload(task, status.totalSize);

        // A result that arrives after cancellation was requested is discarded
        if (record.shouldCancel.load()) {
            markCancelled(record, status);
            return;
        }

        if (outcome.IsSuccess()) {
            status.state = TRANSFER_SUCCEEDED;
            status.hasError = false;
            status.endTime = std::chrono::steady_clock::now();
            if (control_.transition(record, status)) {
                AWS_LOGSTREAM_INFO("UploadWorker", "Upload SUCCESS for ID: " << task.id
                                   << " (attempt " << status.attempts << ")");
            }
            return;
        }

        const StoreError& error = outcome.GetError();
        status.hasError = true;
        status.lastError = error;

        RetryDecision decision = retryPolicy_.decide(status.attempts, error, unrecognizedRetries, rng_);
        if (!decision.retry) {
            status.state = TRANSFER_FAILED;
            status.endTime = std::chrono::steady_clock::now();
            if (control_.transition(record, status)) {
                AWS_LOGSTREAM_ERROR("UploadWorker", "Upload FAILED for ID: " << task.id << " after "
                                    << status.attempts << " attempt(s) - " << decision.reason
                                    << " - " << error.message);
            }
            return;
        }
        if (RetryPolicy::classify(error) == ERROR_UNRECOGNIZED) {
            unrecognizedRetries++;
        }

        status.state = TRANSFER_RETRYING;
        if (!control_.transition(record, status)) {
            return;
        }

        // Check for cancellation before sleeping
        if (record.shouldCancel.load()) {
            markCancelled(record, status);
            return;
        }

        AWS_LOGSTREAM_INFO("UploadWorker", "Retrying upload ID: " << task.id << " in "
                           << decision.delay.count() << " ms");
        if (!control_.waitBackoff(record, decision.delay)) {
            markCancelled(record, status);
            return;
        }
    }
}
