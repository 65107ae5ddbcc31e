#ifndef UPLOADENGINE_H
#define UPLOADENGINE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "../common/UploadCommon.h"
#include "../common/EngineConfig.h"
#include "../common/RetryPolicy.h"
#include "../common/request/object_store_client.h"
#include "ProgressSink.h"
#include "UploadWorker.h"

// Counters over every task the engine has seen
struct EngineStats {
    size_t total;
    size_t queued;
    size_t inProgress;
    size_t retrying;
    size_t succeeded;
    size_t failed;
    size_t cancelled;
    // Tasks waiting in the queue (not yet picked up by a worker)
    size_t queueDepth;

    EngineStats() : total(0), queued(0), inProgress(0), retrying(0), succeeded(0),
                    failed(0), cancelled(0), queueDepth(0) {}
};

// Batch upload engine - bounded FIFO queue drained by a fixed pool of worker threads.
//
// Thread-safety: every public method may be called from any thread. The status map and
// the queue have separate mutexes, so snapshot() and submit() never wait for a transfer.
// Workers are started on the first successful submit and stopped by shutdown().
class UploadEngine : private TransferControl {
public:
    UploadEngine(const UploadEngineConfig& config, std::shared_ptr<ObjectStoreClient> client);

    // Shuts down with a zero drain timeout if shutdown() was not called
    ~UploadEngine();

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    /**
     * Enqueues tasks in submission order. All or nothing: on error no task is enqueued.
     * @return Assigned task ids, in the order of tasks
     * @throws UploadError UPLOAD_INVALID_TASK, UPLOAD_QUEUE_FULL or UPLOAD_ENGINE_STOPPED
     */
    std::vector<TaskId> submit(const std::vector<TransferTask>& tasks);

    /**
     * Cancels a task. Queued tasks become Cancelled immediately and are never dispatched;
     * running tasks are signalled and stop at the next cancellation check.
     * No-op for terminal tasks.
     * @throws UploadError UPLOAD_UNKNOWN_TASK if the engine never issued taskId
     */
    void cancel(const TaskId& taskId);

    StatusSnapshot snapshot() const;

    // Returns false if the task is unknown
    bool getStatus(const TaskId& taskId, TransferStatus& status) const;

    EngineStats stats() const;

    /**
     * Stops accepting tasks, waits up to drainTimeout for all tasks to reach a terminal
     * state, then cancels the remainder and joins the workers. Idempotent.
     */
    void shutdown(std::chrono::milliseconds drainTimeout);

    // Blocks until every listed task is terminal and its terminal event has been
    // delivered to the sinks; false on timeout or unknown id
    bool waitForTasks(const std::vector<TaskId>& taskIds, std::chrono::milliseconds timeout) const;

    // Subscribes a sink to events emitted from now on
    void addProgressSink(std::shared_ptr<ProgressSink> sink);

    const UploadEngineConfig& config() const { return config_; }

private:
    // TransferControl
    bool transition(TransferRecord& record, const TransferStatus& next) override;
    TransferStatus currentStatus(TransferRecord& record) override;
    bool waitBackoff(TransferRecord& record, std::chrono::milliseconds delay) override;

    static void validateTask(const TransferTask& task, size_t index);

    void ensureWorkerThreadsRunning();
    void uploadWorkerThread(unsigned int workerIndex);
    void deliverEvent(const ProgressEvent& event);
    void requestCancel(TransferRecord& record);
    void failRecord(TransferRecord& record, const String& message);
    bool allTerminalLocked() const;

    UploadEngineConfig config_;
    std::shared_ptr<ObjectStoreClient> client_;
    RetryPolicy retryPolicy_;
    String engineTag_;

    // Status map: records of every task ever submitted
    mutable std::mutex statusMutex_;
    mutable std::condition_variable statusChanged_;
    std::unordered_map<TaskId, std::shared_ptr<TransferRecord>> records_;
    unsigned long long nextSequence_;

    // Pending task queue
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::deque<std::shared_ptr<TransferRecord>> pending_;
    bool accepting_;
    bool stopping_;

    // Wakes workers sleeping in backoff when a task is cancelled
    std::mutex backoffMutex_;
    std::condition_variable backoffCondition_;

    std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ProgressSink>> sinks_;

    // Protects worker thread creation and join
    std::mutex workerThreadMutex_;
    std::vector<std::thread> workerThreads_;
    std::atomic<bool> shutDown_;
};

// UPLOADENGINE_H
#endif
