#pragma once

#include "fieldsync/retry_policy.hpp"
#include "fieldsync/socket_client.hpp"
#include <chrono>
#include <string>

namespace fieldsync {

struct ClientConfig {
    std::string api_base_url = "http://localhost:8000/api/v1";
    std::string data_dir = ".";
    SocketConfig socket;  // socket.url is the live channel endpoint
    RetryConfig retry;
    std::chrono::hours cache_freshness{24};
    std::chrono::milliseconds sync_interval{30000};
    std::chrono::milliseconds network_poll_interval{10000};
};

// Overlays FIELDSYNC_* environment variables on `base`. A malformed value
// is logged and the base value kept.
ClientConfig load_config_from_env(const ClientConfig& base = ClientConfig());

// Overlays a JSON settings file, keyed like the environment variables in
// snake_case ("heartbeat_interval_ms"). Returns false, leaving `config`
// untouched, when the file is missing or unreadable.
bool load_config_file(const std::string& path, ClientConfig& config);

} // namespace fieldsync
