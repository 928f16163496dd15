#include "fieldsync.h"
#include "fieldsync/http_remote_api.hpp"
#include "fieldsync/key_value_store.hpp"
#include "fieldsync/timer_queue.hpp"
#include "fieldsync/transport.hpp"
#include "modules/network/network_monitor.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace fieldsync {

struct Session::Impl {
    ClientConfig config;
    std::shared_ptr<SqliteKeyValueStore> store;
    std::shared_ptr<HttpRemoteApi> api;
    NetworkMonitor network;

    // Declared before the components so they outlive them.
    ThreadTimerQueue socket_timers{"SocketTimers"};
    ThreadTimerQueue sync_timers{"SyncTimers"};

    std::unique_ptr<ResilientSocketClient> socket;
    std::unique_ptr<SyncCoordinator> sync;

    std::mutex mutex;
    std::string user_id;
    std::string token;
    bool started = false;
    bool shut_down = false;

    explicit Impl(const ClientConfig& cfg)
        : config(cfg)
        , store(std::make_shared<SqliteKeyValueStore>())
        , api(std::make_shared<HttpRemoteApi>(cfg.api_base_url))
        , network(false) {
        socket = std::make_unique<ResilientSocketClient>(
            config.socket, create_websocket_transport(), socket_timers, &network);

        SyncOptions options;
        options.retry = config.retry;
        options.sync_interval = config.sync_interval;
        options.cache_freshness = config.cache_freshness;
        sync = std::make_unique<SyncCoordinator>(api, store, network, sync_timers, options);

        // The server tells us when shared records change.
        socket->subscribe(MessageKind::JobUpdate, [this](const SocketMessage&) {
            sync->invalidate(collection_name(EntityKind::Job));
        });
        socket->subscribe(MessageKind::BookingUpdate, [this](const SocketMessage&) {
            sync->invalidate(collection_name(EntityKind::Booking));
        });
    }

    void schedule_sync() {
        sync_timers.schedule_after(std::chrono::milliseconds(0), [this]() { sync->sync_data(); });
    }
};

Session::Session(const ClientConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    std::cout << "[Session] Created" << std::endl;
}

Session::~Session() {
    shutdown();
}

void Session::start() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->started) return;
        if (pImpl->shut_down) throw std::runtime_error("session already shut down");
    }

    std::error_code ec;
    std::filesystem::create_directories(pImpl->config.data_dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create data dir " + pImpl->config.data_dir + ": " + ec.message());
    }

    std::string db_path = pImpl->config.data_dir + "/fieldsync.db";
    if (!pImpl->store->initialize(db_path)) {
        throw std::runtime_error("cannot open store at " + db_path);
    }

    // Seed the state before anyone subscribes so startup is not an edge.
    pImpl->network.report(NetworkMonitor::check_connectivity());
    pImpl->sync->initialize();
    pImpl->network.start(&NetworkMonitor::check_connectivity, pImpl->config.network_poll_interval);

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->started = true;
    std::cout << "[Session] Started, data in " << pImpl->config.data_dir << std::endl;
}

void Session::login(const std::string& user_id, const std::string& token) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->started) throw std::runtime_error("session not started");
        pImpl->user_id = user_id;
        pImpl->token = token;
    }
    pImpl->api->set_token(token);
    pImpl->socket->connect(user_id, token);
    pImpl->schedule_sync();
}

void Session::logout() {
    pImpl->socket->disconnect();
    pImpl->api->set_token("");
    pImpl->sync->clear_cache();

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->user_id.clear();
    pImpl->token.clear();
    std::cout << "[Session] Logged out" << std::endl;
}

void Session::on_foreground() {
    std::string user_id;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->started || pImpl->user_id.empty()) return;
        user_id = pImpl->user_id;
        token = pImpl->token;
    }

    if (pImpl->socket->get_connection_state() == ConnectionState::Disconnected) {
        std::cout << "[Session] Foreground, reconnecting live channel" << std::endl;
        pImpl->socket->connect(user_id, token);
    }
    pImpl->schedule_sync();
}

void Session::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shut_down) return;
        pImpl->shut_down = true;
    }
    pImpl->socket->shutdown();
    pImpl->sync->shutdown();
    pImpl->network.stop();
    pImpl->sync_timers.cancel_all();
    pImpl->socket_timers.cancel_all();
    std::cout << "[Session] Shut down" << std::endl;
}

ResilientSocketClient& Session::socket() {
    return *pImpl->socket;
}

SyncCoordinator& Session::sync() {
    return *pImpl->sync;
}

NetworkMonitor& Session::network() {
    return pImpl->network;
}

} // namespace fieldsync
