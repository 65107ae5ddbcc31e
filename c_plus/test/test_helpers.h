#ifndef S3BATCH_TEST_HELPERS_H
#define S3BATCH_TEST_HELPERS_H

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "common/UploadCommon.h"
#include "common/request/object_store_client.h"
#include "uploadAsync/ProgressSink.h"

namespace s3batch_test {

inline PutObjectOutcome success() {
    return PutObjectOutcome(Aws::NoResult());
}

inline PutObjectOutcome failure(StoreErrorKind kind, int httpStatusCode = 0) {
    return PutObjectOutcome(StoreError(kind, std::string("scripted ") + storeErrorKindName(kind), httpStatusCode));
}

// Scratch file removed on destruction
class TempFile {
public:
    explicit TempFile(const std::string& content = "0123456789") {
        char pattern[] = "/tmp/s3batch_test_XXXXXX";
        int fd = mkstemp(pattern);
        if (fd < 0) {
            throw std::runtime_error("mkstemp failed");
        }
        path_ = pattern;
        ssize_t written = ::write(fd, content.data(), content.size());
        ::close(fd);
        if (written != static_cast<ssize_t>(content.size())) {
            std::remove(path_.c_str());
            throw std::runtime_error("cannot write " + path_);
        }
    }

    ~TempFile() {
        std::remove(path_.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ObjectStoreClient that plays back scripted outcomes per object key.
// Keys without a script succeed. Records every call and detects two
// concurrent calls for the same key.
class FakeObjectStoreClient : public ObjectStoreClient {
public:
    PutObjectOutcome putObject(const std::string& /*bucket*/,
                               const std::string& key,
                               const std::shared_ptr<Aws::IOStream>& content,
                               long long size) override {
        std::chrono::milliseconds delay;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!active_.insert(key).second) {
                overlap_ = true;
            }
            if (active_.size() > maxConcurrent_) {
                maxConcurrent_ = active_.size();
            }
            calls_.push_back(key);
            changed_.notify_all();
            changed_.wait(lock, [&] { return blocked_.count(key) == 0; });
            delay = callDelay_;
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        // Consume the body like a real transport would
        long long received = 0;
        char chunk[256];
        while (content && content->read(chunk, sizeof(chunk))) {
            received += content->gcount();
        }
        if (content) {
            received += content->gcount();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(key);
        bytesReceived_[key] = received;
        sizeArgument_[key] = size;
        changed_.notify_all();

        auto scripted = scripts_.find(key);
        if (scripted != scripts_.end() && !scripted->second.empty()) {
            PutObjectOutcome outcome = scripted->second.front();
            scripted->second.pop_front();
            return outcome;
        }
        auto always = failAlways_.find(key);
        if (always != failAlways_.end()) {
            return PutObjectOutcome(always->second);
        }
        return success();
    }

    // Outcomes returned by the next calls for key, in order
    void script(const std::string& key, const std::vector<PutObjectOutcome>& outcomes) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[key].insert(scripts_[key].end(), outcomes.begin(), outcomes.end());
    }

    // Every unscripted call for key fails with kind
    void failAlways(const std::string& key, StoreErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        failAlways_[key] = StoreError(kind, std::string("always ") + storeErrorKindName(kind), 503);
    }

    void setCallDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        callDelay_ = delay;
    }

    // Calls for key block until release(key)
    void block(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_.insert(key);
    }

    void release(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.erase(key);
        }
        changed_.notify_all();
    }

    // Waits until a call for key has started
    bool waitForCall(const std::string& key, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return countLocked(key) > 0; });
    }

    int callCount(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return countLocked(key);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    long long bytesReceived(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bytesReceived_.find(key);
        return it == bytesReceived_.end() ? -1 : it->second;
    }

    long long sizeArgument(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sizeArgument_.find(key);
        return it == sizeArgument_.end() ? -1 : it->second;
    }

    bool overlapDetected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overlap_;
    }

    size_t maxConcurrent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxConcurrent_;
    }

private:
    int countLocked(const std::string& key) const {
        int count = 0;
        for (const auto& call : calls_) {
            if (call == key) {
                ++count;
            }
        }
        return count;
    }

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::map<std::string, std::deque<PutObjectOutcome>> scripts_;
    std::map<std::string, StoreError> failAlways_;
    std::set<std::string> blocked_;
    std::set<std::string> active_;
    std::vector<std::string> calls_;
    std::map<std::string, long long> bytesReceived_;
    std::map<std::string, long long> sizeArgument_;
    std::chrono::milliseconds callDelay_{0};
    size_t maxConcurrent_ = 0;
    bool overlap_ = false;
};

// Collects every progress event, per task in delivery order
class RecordingSink : public ProgressSink {
public:
    void onProgressEvent(const ProgressEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_[event.taskId].push_back(event.status.state);
    }

    std::vector<TransferState> statesOf(const TaskId& taskId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = events_.find(taskId);
        return it == events_.end() ? std::vector<TransferState>() : it->second;
    }

    std::map<TaskId, std::vector<TransferState>> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::map<TaskId, std::vector<TransferState>> events_;
};

// Polls predicate every millisecond until it holds or timeout expires
inline bool eventually(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}

} // namespace s3batch_test

// S3BATCH_TEST_HELPERS_H
#endif
