#pragma once

#include "fieldsync/entity.hpp"
#include "fieldsync/key_value_store.hpp"
#include "fieldsync/remote_api.hpp"
#include "fieldsync/retry_policy.hpp"
#include "fieldsync/timer_queue.hpp"
#include "fieldsync/waiter.hpp"
#include "modules/offline/pending_mutation_queue.hpp"
#include "modules/offline/persistent_cache.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

class NetworkMonitor;

struct SyncOptions {
    RetryConfig retry;
    std::chrono::milliseconds sync_interval{30000};
    std::chrono::hours cache_freshness{24};
    PersistentCache::WallClock clock;  // empty means system_clock
};

// A remote collection kept in the cache and refreshed by sync passes.
struct TrackedCollection {
    std::string name;
    EntityKind kind;
    Filters filters;
};

enum class WriteStatus {
    Saved,   // accepted by the server
    Queued   // waiting in the pending queue
};

struct WriteOutcome {
    WriteStatus status;
    Entity entity;  // the server's copy when saved, the local one when queued
};

struct SyncReport {
    bool ran = false;
    std::string skipped_reason;
    std::vector<std::string> refreshed;
    std::vector<std::string> refresh_failed;
    PendingMutationQueue::DrainResult drain;
    bool badges_refreshed = false;
};

struct Badges {
    int unread_messages = 0;
};

// Keeps the local cache and the pending write queue in step with the
// backend.
//
// Nothing happens before initialize(). While online a pass runs every
// sync_interval and once on each online transition; while offline no pass
// runs. A pass refreshes stale collections, drains the pending queue and
// recomputes the badges, in that order; a failing step is logged and the
// next one still runs. Passes never overlap and never throw.
class SyncCoordinator {
public:
    using BadgeListener = std::function<void(const Badges&)>;

    // `waiter` paces retry backoff; a SteadyWaiter is used when null.
    SyncCoordinator(RemoteApiPtr api,
                    KeyValueStorePtr store,
                    NetworkMonitor& network,
                    TimerQueue& timers,
                    SyncOptions options = SyncOptions(),
                    std::shared_ptr<Waiter> waiter = nullptr);
    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    void initialize();
    bool is_initialized() const;

    SyncReport sync_data();
    bool is_syncing() const;

    // Online: write through to the server, queueing on failure.
    // Offline: queue. Throws std::runtime_error before initialize().
    WriteOutcome cache_job(const Entity& job);
    WriteOutcome cache_message(const Entity& message);
    WriteOutcome cache_booking(const Entity& booking);
    WriteOutcome cache_review(const Entity& review);
    WriteOutcome cache_entity(EntityKind kind, const Entity& entity);

    // Jobs and bookings are tracked by default.
    void track_collection(const std::string& name, EntityKind kind, Filters filters = Filters());
    std::vector<TrackedCollection> tracked_collections() const;

    void invalidate(const std::string& collection);
    std::optional<CacheEntry> get_cached(const std::string& collection);

    size_t pending_count() const;
    size_t pending_count(EntityKind kind) const;
    std::vector<PendingMutation> pending_mutations() const;

    Badges badges() const;
    void set_on_badges(BadgeListener listener);

    // Drops every cached collection and every pending write.
    void clear_cache();

    bool is_offline() const;

    // Stops the periodic timer, abandons in-flight retry waits and detaches
    // from the network monitor. Final.
    void shutdown();

private:
    void on_network_change(bool online);
    void start_periodic_locked();
    Entity write_remote(EntityKind kind, const Entity& entity);
    void apply_mutation(const PendingMutation& mutation);
    void refresh_collections(SyncReport& report);
    void refresh_badges(SyncReport& report);

    RemoteApiPtr api_;
    NetworkMonitor& network_;
    TimerQueue& timers_;
    SyncOptions options_;
    std::shared_ptr<Waiter> waiter_;

    std::unique_ptr<PersistentCache> cache_;
    std::unique_ptr<PendingMutationQueue> queue_;

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool shut_down_ = false;
    uint64_t network_subscription_ = 0;
    TimerId periodic_timer_ = 0;
    TimerId immediate_timer_ = 0;
    std::vector<TrackedCollection> tracked_;
    Badges badges_;
    BadgeListener on_badges_;

    std::atomic<bool> syncing_{false};
};

} // namespace fieldsync
