#include "fieldsync/retry_policy.hpp"
#include <cmath>
#include <cstdint>

namespace fieldsync {

RetryError::RetryError(int attempts, const SyncError& last_error)
    : SyncError(last_error.kind(),
                "request failed after " + std::to_string(attempts) +
                    (attempts == 1 ? " attempt: " : " attempts: ") + last_error.what(),
                last_error.http_status())
    , attempts_(attempts) {}

bool default_should_retry(const SyncError& error) {
    switch (error.kind()) {
        case ErrorKind::Timeout:
        case ErrorKind::Network:
        case ErrorKind::Server:
            return true;
        case ErrorKind::Auth:
        case ErrorKind::Validation:
        case ErrorKind::Cancelled:
        case ErrorKind::Unknown:
            return false;
    }
    return false;
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                        double factor,
                                        int exponent,
                                        std::chrono::milliseconds max) {
    double delay_ms = static_cast<double>(base.count()) * std::pow(factor, std::max(0, exponent));
    delay_ms = std::min(delay_ms, static_cast<double>(max.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

} // namespace fieldsync
