#include "network_monitor.hpp"
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fieldsync {

struct NetworkMonitor::Impl {
    mutable std::mutex state_mutex;
    bool online;
    std::map<SubscriptionId, Listener> listeners;
    SubscriptionId next_id = 1;

    // Transitions waiting to be delivered, oldest first.
    std::deque<bool> pending_events;
    bool delivering = false;

    // Polling
    std::mutex poll_mutex;
    std::condition_variable poll_cond;
    bool polling = false;
    std::thread poll_thread;

    explicit Impl(bool initially_online) : online(initially_online) {}

    void report(bool now_online) {
        std::unique_lock<std::mutex> lock(state_mutex);
        if (now_online == online) return;
        online = now_online;
        pending_events.push_back(now_online);

        if (delivering) return;  // the active deliverer picks it up
        delivering = true;

        while (!pending_events.empty()) {
            bool event = pending_events.front();
            pending_events.pop_front();

            std::vector<Listener> targets;
            for (const auto& kv : listeners) {
                targets.push_back(kv.second);
            }

            lock.unlock();
            if (event) {
                std::cout << "[NetworkMonitor] Network connection restored" << std::endl;
            } else {
                std::cout << "[NetworkMonitor] Network connection lost" << std::endl;
            }
            for (const auto& listener : targets) {
                try {
                    listener(event);
                } catch (const std::exception& e) {
                    std::cerr << "[NetworkMonitor] Listener failed: " << e.what() << std::endl;
                } catch (...) {
                    std::cerr << "[NetworkMonitor] Listener failed" << std::endl;
                }
            }
            lock.lock();
        }

        delivering = false;
    }

    void poll_loop(Probe probe, std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lock(poll_mutex);
        while (polling) {
            lock.unlock();
            try {
                report(probe());
            } catch (const std::exception& e) {
                // Unknown is not offline; keep the last known state.
                std::cerr << "[NetworkMonitor] Probe failed: " << e.what() << std::endl;
            }
            lock.lock();

            poll_cond.wait_for(lock, interval, [this]() { return !polling; });
        }
    }
};

NetworkMonitor::NetworkMonitor(bool initially_online)
    : impl_(std::make_unique<Impl>(initially_online)) {}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::report(bool online) {
    impl_->report(online);
}

bool NetworkMonitor::is_online() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->online;
}

NetworkMonitor::SubscriptionId NetworkMonitor::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    SubscriptionId id = impl_->next_id++;
    impl_->listeners[id] = std::move(listener);
    return id;
}

void NetworkMonitor::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->listeners.erase(id);
}

void NetworkMonitor::start(Probe probe, std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(impl_->poll_mutex);
    if (impl_->polling) return;

    impl_->polling = true;
    try {
        impl_->poll_thread = std::thread(&Impl::poll_loop, impl_.get(), std::move(probe), interval);
        std::cout << "[NetworkMonitor] Started monitoring" << std::endl;
    } catch (const std::system_error& e) {
        std::cerr << "[NetworkMonitor] Failed to create monitor thread: " << e.what() << std::endl;
        impl_->polling = false;
    }
}

void NetworkMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->poll_mutex);
        if (!impl_->polling) return;
        impl_->polling = false;
    }
    impl_->poll_cond.notify_all();
    if (impl_->poll_thread.joinable()) {
        impl_->poll_thread.join();
    }
    std::cout << "[NetworkMonitor] Stopped monitoring" << std::endl;
}

bool NetworkMonitor::running() const {
    std::lock_guard<std::mutex> lock(impl_->poll_mutex);
    return impl_->polling;
}

bool NetworkMonitor::check_connectivity() {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator it("/sys/class/net", ec);
    if (ec) return false;

    for (const auto& iface : it) {
        std::string name = iface.path().filename().string();
        if (name == "lo") continue;

        std::ifstream carrier_file(iface.path() / "carrier");
        if (!carrier_file.good()) continue;

        std::string status;
        std::getline(carrier_file, status);
        if (status == "1") {
            return true;
        }
    }
    return false;
}

} // namespace fieldsync
