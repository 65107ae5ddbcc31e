#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <chrono>
#include <random>

#include "UploadCommon.h"

enum ErrorClass {
    ERROR_TRANSIENT = 0,
    ERROR_PERMANENT = 1,
    // Not recognised; retried at most once
    ERROR_UNRECOGNIZED = 2
};

// Outcome of consulting the policy after a failed attempt
struct RetryDecision {
    bool retry;
    std::chrono::milliseconds delay;
    String reason;

    static RetryDecision Retry(std::chrono::milliseconds delay) {
        RetryDecision decision;
        decision.retry = true;
        decision.delay = delay;
        return decision;
    }

    static RetryDecision GiveUp(const String& reason) {
        RetryDecision decision;
        decision.retry = false;
        decision.delay = std::chrono::milliseconds(0);
        decision.reason = reason;
        return decision;
    }

private:
    RetryDecision() : retry(false), delay(0) {}
};

/**
 * Stateless retry policy: exponential backoff with optional full jitter.
 * Delay before retry k (k = attempts already made) is
 * min(maxDelay, baseDelay * 2^(k-1)), then uniform in [0, delay] when jitter is on.
 */
class RetryPolicy {
public:
    RetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(DEFAULT_RETRY_BASE_DELAY_MS),
                std::chrono::milliseconds maxDelay = std::chrono::milliseconds(DEFAULT_RETRY_MAX_DELAY_MS),
                int maxAttempts = DEFAULT_MAX_ATTEMPTS,
                bool jitter = true);

    static ErrorClass classify(const StoreError& error);

    /**
     * Decides whether to retry after a failed attempt.
     * @param attemptsMade Number of putObject calls made so far, including the failed one
     * @param error Error returned by the failed attempt
     * @param unrecognizedRetries How many retries were already spent on unrecognised errors
     * @param rng Random source for jitter, owned by the calling worker
     */
    RetryDecision decide(int attemptsMade, const StoreError& error, int unrecognizedRetries, std::mt19937& rng) const;

    // Backoff before jitter for the retry following attempt number attemptsMade
    std::chrono::milliseconds backoffDelay(int attemptsMade) const;

    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
    bool jitter_;
};

// RETRYPOLICY_H
#endif
