#pragma once

#include "fieldsync/config.hpp"
#include "fieldsync/socket_client.hpp"
#include "fieldsync/sync_coordinator.hpp"
#include <memory>
#include <string>

namespace fieldsync {

class NetworkMonitor;

// The whole engine wired for one app process: SQLite store under data_dir,
// HTTP API, polling network monitor, live socket and sync coordinator.
class Session {
public:
    explicit Session(const ClientConfig& config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Opens the store, restores cache and pending writes, starts watching
    // the network. Throws std::runtime_error if the store cannot be opened.
    void start();

    // Opens the live channel and runs a sync pass with the new credential.
    void login(const std::string& user_id, const std::string& token);

    // Closes the live channel and drops the user's cached data.
    void logout();

    // Reconnects after the reconnect budget was used up and syncs.
    void on_foreground();

    void shutdown();

    ResilientSocketClient& socket();
    SyncCoordinator& sync();
    NetworkMonitor& network();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace fieldsync
