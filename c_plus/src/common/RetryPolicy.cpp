#include "RetryPolicy.h"

// Unrecognised errors get one retry, then are treated as permanent
static const int MAX_UNRECOGNIZED_RETRIES = 1;

RetryPolicy::RetryPolicy(std::chrono::milliseconds baseDelay,
                         std::chrono::milliseconds maxDelay,
                         int maxAttempts,
                         bool jitter)
    : baseDelay_(baseDelay),
      maxDelay_(maxDelay),
      maxAttempts_(maxAttempts),
      jitter_(jitter) {}

ErrorClass RetryPolicy::classify(const StoreError& error) {
    switch (error.kind) {
        case STORE_TIMEOUT:
        case STORE_CONNECTION_RESET:
        case STORE_THROTTLED:
        case STORE_SERVER_ERROR:
            return ERROR_TRANSIENT;
        case STORE_NOT_FOUND:
        case STORE_ACCESS_DENIED:
        case STORE_AUTHENTICATION_FAILED:
        case STORE_INVALID_REQUEST:
        case STORE_SOURCE_MISSING:
            return ERROR_PERMANENT;
        case STORE_UNKNOWN:
            return ERROR_UNRECOGNIZED;
    }
    return ERROR_UNRECOGNIZED;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int attemptsMade) const {
    if (attemptsMade < 1) {
        return std::chrono::milliseconds(0);
    }

    // Double from the base delay, stopping at the cap before the shift can overflow
    long long delay = baseDelay_.count();
    for (int i = 1; i < attemptsMade && delay < maxDelay_.count(); ++i) {
        delay *= 2;
    }
    if (delay > maxDelay_.count()) {
        delay = maxDelay_.count();
    }
    return std::chrono::milliseconds(delay);
}

RetryDecision RetryPolicy::decide(int attemptsMade, const StoreError& error,
                                  int unrecognizedRetries, std::mt19937& rng) const {
    ErrorClass errorClass = classify(error);
    if (errorClass == ERROR_PERMANENT) {
        return RetryDecision::GiveUp(formatErrorMessage("Permanent error", storeErrorKindName(error.kind)));
    }
    if (errorClass == ERROR_UNRECOGNIZED && unrecognizedRetries >= MAX_UNRECOGNIZED_RETRIES) {
        return RetryDecision::GiveUp("Unrecognized error persisted after retry");
    }
    if (attemptsMade >= maxAttempts_) {
        return RetryDecision::GiveUp("All " + std::to_string(maxAttempts_) + " attempts exhausted");
    }

    std::chrono::milliseconds delay = backoffDelay(attemptsMade);
    if (jitter_ && delay.count() > 0) {
        std::uniform_int_distribution<long long> distribution(0, delay.count());
        delay = std::chrono::milliseconds(distribution(rng));
    }
    return RetryDecision::Retry(delay);
}
