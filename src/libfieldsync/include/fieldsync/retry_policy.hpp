#pragma once

#include "fieldsync/error.hpp"
#include "fieldsync/waiter.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace fieldsync {

struct RetryConfig {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};
    double backoff_factor = 2.0;
    std::chrono::milliseconds attempt_timeout{15000};  // applied per attempt, not per sequence

    // Empty means default_should_retry.
    std::function<bool(const SyncError&)> should_retry;
};

// Handed to every attempt so the operation can apply the per-attempt deadline.
struct RetryAttempt {
    int number;
    std::chrono::milliseconds timeout;
};

// The single failure a retry sequence surfaces to its caller.
class RetryError : public SyncError {
public:
    RetryError(int attempts, const SyncError& last_error);

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

// Timeout, network and server failures are transient; everything else is not.
bool default_should_retry(const SyncError& error);

// min(base * factor^exponent, max)
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                        double factor,
                                        int exponent,
                                        std::chrono::milliseconds max);

// Delay to wait after failed attempt number `attempt` (1-based).
inline std::chrono::milliseconds retry_delay(const RetryConfig& config, int attempt) {
    return backoff_delay(config.base_delay, config.backoff_factor, attempt - 1, config.max_delay);
}

// Runs op(const RetryAttempt&) until it succeeds, fails with a non-retryable
// error, or max_attempts is reached. Waits between attempts go through
// `waiter`; cancelling it abandons the sequence with OperationCancelled.
template <typename Operation>
auto with_retry(Operation&& op, const RetryConfig& config, Waiter& waiter)
    -> decltype(op(std::declval<const RetryAttempt&>())) {
    const int max_attempts = std::max(1, config.max_attempts);

    for (int attempt = 1;; ++attempt) {
        if (waiter.cancelled()) {
            throw OperationCancelled("retry abandoned before attempt " + std::to_string(attempt));
        }

        SyncError failure(ErrorKind::Unknown, "");
        try {
            return op(RetryAttempt{attempt, config.attempt_timeout});
        } catch (const OperationCancelled&) {
            throw;
        } catch (const SyncError& e) {
            failure = e;
        } catch (const std::exception& e) {
            failure = SyncError(ErrorKind::Unknown, e.what());
        }

        bool retryable = config.should_retry ? config.should_retry(failure)
                                             : default_should_retry(failure);

        std::cerr << "[Retry] Attempt " << attempt << "/" << max_attempts
                  << " failed (" << to_string(failure.kind()) << "): "
                  << failure.what() << std::endl;

        if (!retryable || attempt >= max_attempts) {
            throw RetryError(attempt, failure);
        }

        auto delay = retry_delay(config, attempt);
        std::cout << "[Retry] Waiting " << delay.count() << "ms before retry" << std::endl;
        if (!waiter.wait_for(delay)) {
            throw OperationCancelled("retry abandoned after attempt " + std::to_string(attempt));
        }
    }
}

} // namespace fieldsync
