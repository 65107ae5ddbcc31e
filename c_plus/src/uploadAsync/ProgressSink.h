#ifndef PROGRESSSINK_H
#define PROGRESSSINK_H

#include <functional>

#include "../common/UploadCommon.h"

// Receiver of progress events (e.g. the GUI).
// Called from worker threads and from the thread calling submit/cancel/shutdown;
// events for one task arrive in order, events for different tasks may interleave.
// A sink must not call UploadEngine::cancel() for the task it is being told about.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onProgressEvent(const ProgressEvent& event) = 0;
};

// Writes every event to the AWS SDK log
class LoggingProgressSink : public ProgressSink {
public:
    void onProgressEvent(const ProgressEvent& event) override;
};

// Forwards every event to a callback
class CallbackProgressSink : public ProgressSink {
public:
    using Callback = std::function<void(const ProgressEvent&)>;

    explicit CallbackProgressSink(Callback callback) : callback_(std::move(callback)) {}

    void onProgressEvent(const ProgressEvent& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    Callback callback_;
};

// PROGRESSSINK_H
#endif
