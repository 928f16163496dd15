#pragma once

#include <stdexcept>
#include <string>

namespace fieldsync {

// Error classes shared by the retry policy and the sync logging.
enum class ErrorKind {
    Timeout,     // attempt deadline exceeded, HTTP 408
    Network,     // no connectivity / transport failure
    Server,      // 5xx, HTTP 429
    Auth,        // 401 / 403, never retried
    Validation,  // other 4xx, never retried
    Cancelled,   // sequence abandoned by its owner
    Unknown
};

const char* to_string(ErrorKind kind);

class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& message, int http_status = 0);

    ErrorKind kind() const { return kind_; }
    int http_status() const { return http_status_; }

private:
    ErrorKind kind_;
    int http_status_;
};

// Thrown when a Waiter is cancelled while a retry sequence is suspended.
class OperationCancelled : public SyncError {
public:
    explicit OperationCancelled(const std::string& message);
};

// Maps an HTTP response status onto the error taxonomy.
ErrorKind classify_http_status(int status);

} // namespace fieldsync
