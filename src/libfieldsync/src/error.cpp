#include "fieldsync/error.hpp"

namespace fieldsync {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Network:    return "network";
        case ErrorKind::Server:     return "server";
        case ErrorKind::Auth:       return "auth";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Cancelled:  return "cancelled";
        case ErrorKind::Unknown:    return "unknown";
    }
    return "unknown";
}

SyncError::SyncError(ErrorKind kind, const std::string& message, int http_status)
    : std::runtime_error(message)
    , kind_(kind)
    , http_status_(http_status) {}

OperationCancelled::OperationCancelled(const std::string& message)
    : SyncError(ErrorKind::Cancelled, message) {}

ErrorKind classify_http_status(int status) {
    if (status == 408) return ErrorKind::Timeout;
    if (status == 429) return ErrorKind::Server;
    if (status == 401 || status == 403) return ErrorKind::Auth;
    if (status >= 500) return ErrorKind::Server;
    if (status >= 400) return ErrorKind::Validation;
    return ErrorKind::Unknown;
}

} // namespace fieldsync
