#pragma once

#include <string>

namespace fieldsync {

// RFC 3986 percent-encoding; only unreserved characters pass through.
std::string percent_encode(const std::string& value);

} // namespace fieldsync
