#include "UploadEngine.h"

#include <algorithm>

#include <aws/core/utils/logging/LogMacros.h>

namespace {

String makeEngineTag() {
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    return std::to_string(timestamp);
}

} // namespace

UploadEngine::UploadEngine(const UploadEngineConfig& config, std::shared_ptr<ObjectStoreClient> client)
    : config_(config),
      client_(std::move(client)),
      retryPolicy_(config.retryBaseDelay, config.retryMaxDelay, config.maxAttempts, config.retryJitter),
      engineTag_(makeEngineTag()),
      nextSequence_(0),
      accepting_(true),
      stopping_(false),
      shutDown_(false) {
    config_.validate();
    if (!client_) {
        throw std::invalid_argument("UploadEngine requires an object store client");
    }
}

UploadEngine::~UploadEngine() {
    shutdown(std::chrono::milliseconds(0));
}

void UploadEngine::validateTask(const TransferTask& task, size_t index) {
    String position = "task #" + std::to_string(index);
    if (task.sourcePath.empty()) {
        throw UploadError(UPLOAD_INVALID_TASK, formatErrorMessage(ErrorMessage::EMPTY_SOURCE_PATH, position));
    }
    if (task.bucketName.empty()) {
        throw UploadError(UPLOAD_INVALID_TASK, formatErrorMessage(ErrorMessage::EMPTY_BUCKET_NAME, position));
    }
    if (task.sizeBytes < 0) {
        throw UploadError(UPLOAD_INVALID_TASK, formatErrorMessage(ErrorMessage::NEGATIVE_SIZE, position));
    }
}

std::vector<TaskId> UploadEngine::submit(const std::vector<TransferTask>& tasks) {
    // Step 1: Validate every task before touching the queue
    for (size_t i = 0; i < tasks.size(); ++i) {
        validateTask(tasks[i], i);
    }

    std::vector<std::shared_ptr<TransferRecord>> records;
    std::vector<std::unique_lock<std::mutex>> eventLocks;
    std::vector<TaskId> taskIds;
    records.reserve(tasks.size());
    eventLocks.reserve(tasks.size());
    taskIds.reserve(tasks.size());

    // Step 2: Build the records. Their event locks are held until the Queued events
    // are out, so no worker can report a task before its Queued event
    for (const TransferTask& input : tasks) {
        auto record = std::make_shared<TransferRecord>(input);
        record->status.totalSize = input.sizeBytes;
        eventLocks.emplace_back(record->eventMutex);
        records.push_back(record);
    }

    // Step 3: Check capacity and enqueue atomically
    {
        std::lock_guard<std::mutex> queueLock(queueMutex_);
        if (!accepting_) {
            throw UploadError(UPLOAD_ENGINE_STOPPED, ErrorMessage::ENGINE_STOPPED);
        }
        if (pending_.size() + tasks.size() > config_.queueCapacity) {
            String detail = std::to_string(pending_.size()) + " queued, capacity " +
                            std::to_string(config_.queueCapacity) + ", batch of " + std::to_string(tasks.size());
            AWS_LOGSTREAM_WARN("UploadEngine", "Submission rejected due to queue limit: " << detail);
            throw UploadError(UPLOAD_QUEUE_FULL, formatErrorMessage(ErrorMessage::QUEUE_FULL, detail));
        }

        std::lock_guard<std::mutex> statusLock(statusMutex_);
        for (auto& record : records) {
            record->task.id = getTaskId(engineTag_, ++nextSequence_);
            records_[record->task.id] = record;
            pending_.push_back(record);
            taskIds.push_back(record->task.id);
        }
    }

    if (tasks.empty()) {
        return taskIds;
    }

    // Step 4: Make sure workers exist, then wake them
    ensureWorkerThreadsRunning();
    queueCondition_.notify_all();

    AWS_LOGSTREAM_INFO("UploadEngine", "Enqueued " << tasks.size() << " task(s), first ID: " << taskIds.front());

    // Step 5: Emit Queued events, releasing each task to its worker afterwards
    for (size_t i = 0; i < records.size(); ++i) {
        ProgressEvent event;
        event.taskId = records[i]->task.id;
        event.status = currentStatus(*records[i]);
        event.timestamp = std::chrono::system_clock::now();
        deliverEvent(event);
        eventLocks[i].unlock();
    }

    return taskIds;
}

void UploadEngine::requestCancel(TransferRecord& record) {
    {
        std::lock_guard<std::mutex> lock(backoffMutex_);
        record.shouldCancel = true;
    }
    backoffCondition_.notify_all();
}

void UploadEngine::cancel(const TaskId& taskId) {
    std::shared_ptr<TransferRecord> record;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        auto it = records_.find(taskId);
        if (it == records_.end()) {
            throw UploadError(UPLOAD_UNKNOWN_TASK, formatErrorMessage(ErrorMessage::UNKNOWN_TASK, taskId));
        }
        record = it->second;
        if (isTerminalState(record->status.state)) {
            return;
        }
    }

    requestCancel(*record);

    // A task still in the queue is cancelled here and never reaches a worker
    bool removedFromQueue = false;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        auto it = std::find(pending_.begin(), pending_.end(), record);
        if (it != pending_.end()) {
            pending_.erase(it);
            removedFromQueue = true;
        }
    }

    if (removedFromQueue) {
        TransferStatus status = currentStatus(*record);
        status.state = TRANSFER_CANCELLED;
        status.endTime = std::chrono::steady_clock::now();
        transition(*record, status);
        AWS_LOGSTREAM_INFO("UploadEngine", "Cancelled queued task: " << taskId);
    } else {
        AWS_LOGSTREAM_INFO("UploadEngine", "Cancellation requested for running task: " << taskId);
    }
}

StatusSnapshot UploadEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    StatusSnapshot result;
    for (const auto& pair : records_) {
        result[pair.first] = pair.second->status;
    }
    return result;
}

bool UploadEngine::getStatus(const TaskId& taskId, TransferStatus& status) const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    auto it = records_.find(taskId);
    if (it == records_.end()) {
        return false;
    }
    status = it->second->status;
    return true;
}

EngineStats UploadEngine::stats() const {
    EngineStats result;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        result.total = records_.size();
        for (const auto& pair : records_) {
            switch (pair.second->status.state) {
                case TRANSFER_QUEUED: result.queued++; break;
                case TRANSFER_IN_PROGRESS: result.inProgress++; break;
                case TRANSFER_RETRYING: result.retrying++; break;
                case TRANSFER_SUCCEEDED: result.succeeded++; break;
                case TRANSFER_FAILED: result.failed++; break;
                case TRANSFER_CANCELLED: result.cancelled++; break;
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        result.queueDepth = pending_.size();
    }
    return result;
}

bool UploadEngine::allTerminalLocked() const {
    for (const auto& pair : records_) {
        if (!pair.second->terminalDelivered) {
            return false;
        }
    }
    return true;
}

bool UploadEngine::waitForTasks(const std::vector<TaskId>& taskIds, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(statusMutex_);
    return statusChanged_.wait_for(lock, timeout, [&] {
        for (const TaskId& taskId : taskIds) {
            auto it = records_.find(taskId);
            if (it == records_.end() || !it->second->terminalDelivered) {
                return false;
            }
        }
        return true;
    });
}

void UploadEngine::shutdown(std::chrono::milliseconds drainTimeout) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        accepting_ = false;
    }
    if (shutDown_.exchange(true)) {
        return;
    }

    AWS_LOGSTREAM_INFO("UploadEngine", "Shutting down, drain timeout " << drainTimeout.count() << " ms");

    // Step 1: Let workers finish what they have, up to the drain timeout
    {
        std::unique_lock<std::mutex> lock(statusMutex_);
        statusChanged_.wait_for(lock, drainTimeout, [this] { return allTerminalLocked(); });
    }

    // Step 2: Take everything still queued and stop the workers from pulling more
    std::deque<std::shared_ptr<TransferRecord>> leftover;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        leftover.swap(pending_);
        stopping_ = true;
    }
    queueCondition_.notify_all();

    // Step 3: Signal running tasks
    std::vector<std::shared_ptr<TransferRecord>> remaining;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        for (const auto& pair : records_) {
            if (!isTerminalState(pair.second->status.state)) {
                remaining.push_back(pair.second);
            }
        }
    }
    for (auto& record : remaining) {
        requestCancel(*record);
    }
    if (!remaining.empty()) {
        AWS_LOGSTREAM_WARN("UploadEngine", "Force-cancelling " << remaining.size() << " unfinished task(s)");
    }

    for (auto& record : leftover) {
        TransferStatus status = currentStatus(*record);
        status.state = TRANSFER_CANCELLED;
        status.endTime = std::chrono::steady_clock::now();
        transition(*record, status);
    }

    // Step 4: Join workers; in-flight store calls are allowed to return
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(workerThreadMutex_);
        threads.swap(workerThreads_);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    // Step 5: Anything a worker did not finish (dequeued but never started) ends Cancelled
    for (auto& record : remaining) {
        TransferStatus status = currentStatus(*record);
        if (!isTerminalState(status.state)) {
            status.state = TRANSFER_CANCELLED;
            status.endTime = std::chrono::steady_clock::now();
            transition(*record, status);
        }
    }

    AWS_LOGSTREAM_INFO("UploadEngine", "Upload engine stopped");
}

void UploadEngine::addProgressSink(std::shared_ptr<ProgressSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void UploadEngine::deliverEvent(const ProgressEvent& event) {
    std::vector<std::shared_ptr<ProgressSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        try {
            sink->onProgressEvent(event);
        } catch (const std::exception& e) {
            AWS_LOGSTREAM_WARN("UploadEngine", "Progress sink threw for task " << event.taskId << ": " << e.what());
        } catch (...) {
            AWS_LOGSTREAM_WARN("UploadEngine", "Progress sink threw an unknown exception for task " << event.taskId);
        }
    }
}

bool UploadEngine::transition(TransferRecord& record, const TransferStatus& next) {
    std::lock_guard<std::mutex> eventLock(record.eventMutex);

    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        TransferState from = record.status.state;
        if (!isValidTransition(from, next.state)) {
            AWS_LOGSTREAM_DEBUG("UploadEngine", "Rejected transition " << transferStateName(from) << " -> "
                                << transferStateName(next.state) << " for task " << record.task.id);
            return false;
        }
        record.status = next;
        event.taskId = record.task.id;
        event.status = next;
        event.timestamp = std::chrono::system_clock::now();
    }
    deliverEvent(event);

    // Waiters see a task as finished only after its terminal event is out
    if (isTerminalState(next.state)) {
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            record.terminalDelivered = true;
        }
        statusChanged_.notify_all();
    }
    return true;
}

TransferStatus UploadEngine::currentStatus(TransferRecord& record) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return record.status;
}

bool UploadEngine::waitBackoff(TransferRecord& record, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(backoffMutex_);
    bool cancelled = backoffCondition_.wait_for(lock, delay, [&record] {
        return record.shouldCancel.load();
    });
    return !cancelled;
}

void UploadEngine::ensureWorkerThreadsRunning() {
    std::lock_guard<std::mutex> lock(workerThreadMutex_);
    if (shutDown_.load() || !workerThreads_.empty()) {
        return;
    }

    for (unsigned int i = 0; i < config_.workerCount; ++i) {
        workerThreads_.emplace_back(&UploadEngine::uploadWorkerThread, this, i);
    }
    AWS_LOGSTREAM_INFO("UploadEngine", "Started " << config_.workerCount << " worker thread(s)");
}

void UploadEngine::failRecord(TransferRecord& record, const String& message) {
    TransferStatus status = currentStatus(record);
    status.state = TRANSFER_FAILED;
    status.hasError = true;
    status.lastError = StoreError(STORE_UNKNOWN, message);
    status.endTime = std::chrono::steady_clock::now();
    transition(record, status);
}

// Worker thread main function - processes tasks from the queue until shutdown.
// A failure in one task is caught and recorded; it never terminates the thread.
void UploadEngine::uploadWorkerThread(unsigned int workerIndex) {
    AWS_LOGSTREAM_INFO("UploadEngine", "Upload worker thread " << workerIndex << " started");

    std::random_device seedSource;
    UploadWorker worker(*client_, retryPolicy_, *this, seedSource() ^ workerIndex);

    while (true) {
        std::shared_ptr<TransferRecord> record;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (stopping_) {
                break;
            }
            record = pending_.front();
            pending_.pop_front();
        }
        // Lock is released here, allowing new tasks to be enqueued while we process this one

        try {
            worker.execute(*record);
        } catch (const std::exception& e) {
            AWS_LOGSTREAM_ERROR("UploadEngine", "Exception in worker thread for task " << record->task.id
                                << ": " << e.what());
            failRecord(*record, formatErrorMessage(ErrorMessage::UPLOAD_EXCEPTION, e.what()));
        } catch (...) {
            AWS_LOGSTREAM_ERROR("UploadEngine", "Unknown exception in worker thread for task " << record->task.id);
            failRecord(*record, formatErrorMessage(ErrorMessage::UPLOAD_EXCEPTION, "unknown error"));
        }
    }

    AWS_LOGSTREAM_INFO("UploadEngine", "Upload worker thread " << workerIndex << " stopped");
}
