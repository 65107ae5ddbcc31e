#ifndef UPLOADWORKER_H
#define UPLOADWORKER_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>

#include "../common/UploadCommon.h"
#include "../common/RetryPolicy.h"
#include "../common/request/object_store_client.h"

// Tracking data for a single transfer, shared between the engine and the worker executing it
struct TransferRecord {
    // The id is assigned when the record is enqueued; read-only afterwards
    TransferTask task;
    // Guarded by the engine's status mutex
    TransferStatus status;
    // Set once the terminal event has reached every sink; guarded by the status mutex
    bool terminalDelivered;
    // Atomic flag for cancellation requests
    std::atomic<bool> shouldCancel;
    // Held while a transition is applied and its event delivered, so events
    // for this task never overtake each other
    std::mutex eventMutex;

    explicit TransferRecord(const TransferTask& transferTask)
        : task(transferTask), terminalDelivered(false), shouldCancel(false) {}
};

// Engine services used by a worker while it executes a task
class TransferControl {
public:
    virtual ~TransferControl() = default;

    // Applies the status and emits its event. Returns false if the transition is not allowed.
    virtual bool transition(TransferRecord& record, const TransferStatus& next) = 0;

    virtual TransferStatus currentStatus(TransferRecord& record) = 0;

    // Sleeps for delay, waking early on cancellation. Returns false if cancelled.
    virtual bool waitBackoff(TransferRecord& record, std::chrono::milliseconds delay) = 0;
};

// Executes one TransferTask at a time against an ObjectStoreClient, applying the RetryPolicy.
// Each worker thread owns one UploadWorker.
class UploadWorker {
public:
    UploadWorker(ObjectStoreClient& client, const RetryPolicy& retryPolicy,
                 TransferControl& control, unsigned int seed);

    // Runs the task to a terminal state (or until the engine rejects a transition)
    void execute(TransferRecord& record);

private:
    // One putObject call; local failures are returned as StoreError
    PutObjectOutcome attemptUpload(const TransferTask& task, long long& totalSize);

    void markCancelled(TransferRecord& record, TransferStatus status);

    ObjectStoreClient& client_;
    const RetryPolicy& retryPolicy_;
    TransferControl& control_;
    std::mt19937 rng_;
};

// UPLOADWORKER_H
#endif
