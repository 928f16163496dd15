#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace fieldsync {

// Single source of truth for device connectivity.
//
// Transitions are edge-triggered: reporting the current state again notifies
// nobody. Listeners run outside the monitor's lock, but in report order even
// when a listener reports again or several threads report at once; whichever
// thread is delivering drains the backlog before returning.
class NetworkMonitor {
public:
    using Listener = std::function<void(bool online)>;
    using Probe = std::function<bool()>;
    using SubscriptionId = uint64_t;

    explicit NetworkMonitor(bool initially_online = true);
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    // Feed from the platform's connectivity signal.
    void report(bool online);
    bool is_online() const;

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

    // Polls a probe on a background thread and reports its result.
    void start(Probe probe = &NetworkMonitor::check_connectivity,
               std::chrono::milliseconds interval = std::chrono::milliseconds(10000));
    void stop();
    bool running() const;

    // One-shot check: any non-loopback interface with carrier.
    static bool check_connectivity();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fieldsync
