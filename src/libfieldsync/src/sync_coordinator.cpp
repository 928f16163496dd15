#include "fieldsync/sync_coordinator.hpp"
#include "modules/network/network_monitor.hpp"
#include <iostream>
#include <stdexcept>

namespace fieldsync {

namespace {

// Resets the syncing flag on every exit path.
class SyncingGuard {
public:
    explicit SyncingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~SyncingGuard() { flag_ = false; }

private:
    std::atomic<bool>& flag_;
};

} // namespace

SyncCoordinator::SyncCoordinator(RemoteApiPtr api,
                                 KeyValueStorePtr store,
                                 NetworkMonitor& network,
                                 TimerQueue& timers,
                                 SyncOptions options,
                                 std::shared_ptr<Waiter> waiter)
    : api_(std::move(api))
    , network_(network)
    , timers_(timers)
    , options_(std::move(options))
    , waiter_(waiter ? std::move(waiter) : std::make_shared<SteadyWaiter>()) {
    cache_ = std::make_unique<PersistentCache>(store, options_.cache_freshness, options_.clock);
    queue_ = std::make_unique<PendingMutationQueue>(store);

    tracked_.push_back(TrackedCollection{collection_name(EntityKind::Job), EntityKind::Job, Filters()});
    tracked_.push_back(TrackedCollection{collection_name(EntityKind::Booking), EntityKind::Booking, Filters()});
}

SyncCoordinator::~SyncCoordinator() {
    shutdown();
}

void SyncCoordinator::initialize() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw std::runtime_error("SyncCoordinator already shut down");
        }
        if (initialized_) return;
        for (const auto& c : tracked_) {
            names.push_back(c.name);
        }
    }

    cache_->load(names);
    queue_->load();

    uint64_t subscription = network_.subscribe([this](bool online) { on_network_change(online); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        network_subscription_ = subscription;
        initialized_ = true;
        if (network_.is_online()) {
            start_periodic_locked();
        }
    }

    std::cout << "[SyncCoordinator] Initialized with " << queue_->size()
              << " pending mutations" << std::endl;
}

bool SyncCoordinator::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

SyncReport SyncCoordinator::sync_data() {
    SyncReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || shut_down_) {
            report.skipped_reason = shut_down_ ? "shut down" : "not initialized";
            return report;
        }
    }
    if (!network_.is_online()) {
        report.skipped_reason = "offline";
        return report;
    }

    bool expected = false;
    if (!syncing_.compare_exchange_strong(expected, true)) {
        std::cout << "[SyncCoordinator] Sync already in progress, skipping" << std::endl;
        report.skipped_reason = "already syncing";
        return report;
    }
    SyncingGuard guard(syncing_);

    report.ran = true;
    std::cout << "[SyncCoordinator] Sync started" << std::endl;

    refresh_collections(report);

    if (!waiter_->cancelled()) {
        report.drain = queue_->drain([this](const PendingMutation& m) { apply_mutation(m); });
        if (report.drain.failed) {
            std::cerr << "[SyncCoordinator] Pending queue stopped with " << queue_->size()
                      << " mutations left" << std::endl;
        }
    }

    if (!waiter_->cancelled()) {
        refresh_badges(report);
    }

    std::cout << "[SyncCoordinator] Sync finished: " << report.refreshed.size()
              << " collections refreshed, " << report.drain.applied
              << " mutations applied" << std::endl;
    return report;
}

bool SyncCoordinator::is_syncing() const {
    return syncing_;
}

WriteOutcome SyncCoordinator::cache_job(const Entity& job) {
    return cache_entity(EntityKind::Job, job);
}

WriteOutcome SyncCoordinator::cache_message(const Entity& message) {
    return cache_entity(EntityKind::Message, message);
}

WriteOutcome SyncCoordinator::cache_booking(const Entity& booking) {
    return cache_entity(EntityKind::Booking, booking);
}

WriteOutcome SyncCoordinator::cache_review(const Entity& review) {
    return cache_entity(EntityKind::Review, review);
}

WriteOutcome SyncCoordinator::cache_entity(EntityKind kind, const Entity& entity) {
    if (!is_initialized()) {
        throw std::runtime_error("SyncCoordinator not initialized");
    }

    if (network_.is_online()) {
        try {
            Entity saved = write_remote(kind, entity);
            cache_->mark_stale(collection_name(kind));
            return WriteOutcome{WriteStatus::Saved, saved};
        } catch (const SyncError& e) {
            std::cerr << "[SyncCoordinator] Remote " << to_string(kind) << " write failed ("
                      << to_string(e.kind()) << "), queueing: " << e.what() << std::endl;
        }
    }

    PendingMutation mutation = make_mutation(kind, entity);
    if (!queue_->enqueue(mutation)) {
        std::cerr << "[SyncCoordinator] Queued " << mutation.id
                  << " in memory only, store write failed" << std::endl;
    }
    return WriteOutcome{WriteStatus::Queued, entity};
}

void SyncCoordinator::track_collection(const std::string& name, EntityKind kind, Filters filters) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& c : tracked_) {
            if (c.name == name) {
                c.kind = kind;
                c.filters = std::move(filters);
                return;
            }
        }
        tracked_.push_back(TrackedCollection{name, kind, std::move(filters)});
        if (!initialized_) return;
    }
    // Tracked after startup: pick up whatever an earlier run cached.
    cache_->load({name});
}

std::vector<TrackedCollection> SyncCoordinator::tracked_collections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_;
}

void SyncCoordinator::invalidate(const std::string& collection) {
    std::cout << "[SyncCoordinator] Invalidating " << collection << std::endl;
    cache_->mark_stale(collection);
}

std::optional<CacheEntry> SyncCoordinator::get_cached(const std::string& collection) {
    return cache_->get(collection);
}

size_t SyncCoordinator::pending_count() const {
    return queue_->size();
}

size_t SyncCoordinator::pending_count(EntityKind kind) const {
    return queue_->size_for(kind);
}

std::vector<PendingMutation> SyncCoordinator::pending_mutations() const {
    return queue_->snapshot();
}

Badges SyncCoordinator::badges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return badges_;
}

void SyncCoordinator::set_on_badges(BadgeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_badges_ = std::move(listener);
}

void SyncCoordinator::clear_cache() {
    cache_->clear();
    queue_->clear();
    std::cout << "[SyncCoordinator] Cache and pending queue cleared" << std::endl;
}

bool SyncCoordinator::is_offline() const {
    return !network_.is_online();
}

void SyncCoordinator::shutdown() {
    TimerId periodic;
    TimerId immediate;
    uint64_t subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        periodic = periodic_timer_;
        immediate = immediate_timer_;
        subscription = network_subscription_;
        periodic_timer_ = 0;
        immediate_timer_ = 0;
        network_subscription_ = 0;
    }

    if (subscription) network_.unsubscribe(subscription);
    // Wake a pass suspended in backoff before waiting on its timer.
    waiter_->cancel();
    if (immediate) timers_.cancel(immediate);
    if (periodic) timers_.cancel(periodic);

    std::cout << "[SyncCoordinator] Shut down" << std::endl;
}

void SyncCoordinator::on_network_change(bool online) {
    TimerId periodic = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || shut_down_) return;

        if (online) {
            std::cout << "[SyncCoordinator] Back online, syncing now" << std::endl;
            start_periodic_locked();
            // One queued pass covers any number of flaps before it runs.
            if (immediate_timer_) return;
            immediate_timer_ = timers_.schedule_after(std::chrono::milliseconds(0), [this]() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    immediate_timer_ = 0;
                }
                sync_data();
            });
            return;
        }

        std::cout << "[SyncCoordinator] Offline, periodic sync stopped" << std::endl;
        periodic = periodic_timer_;
        periodic_timer_ = 0;
    }
    if (periodic) timers_.cancel(periodic);
}

void SyncCoordinator::start_periodic_locked() {
    if (periodic_timer_ || options_.sync_interval.count() <= 0) return;
    periodic_timer_ = timers_.schedule_every(options_.sync_interval, [this]() { sync_data(); });
}

Entity SyncCoordinator::write_remote(EntityKind kind, const Entity& entity) {
    auto id = server_id(entity);
    return with_retry([&](const RetryAttempt& attempt) {
        if (id) {
            return api_->update(kind, *id, entity, attempt.timeout);
        }
        return api_->create(kind, entity, attempt.timeout);
    }, options_.retry, *waiter_);
}

void SyncCoordinator::apply_mutation(const PendingMutation& mutation) {
    with_retry([&](const RetryAttempt& attempt) {
        if (mutation.operation == MutationOp::Update) {
            return api_->update(mutation.entity_kind, mutation.id, mutation.payload, attempt.timeout);
        }
        return api_->create(mutation.entity_kind, mutation.payload, attempt.timeout);
    }, options_.retry, *waiter_);
    cache_->mark_stale(collection_name(mutation.entity_kind));
}

void SyncCoordinator::refresh_collections(SyncReport& report) {
    for (const auto& collection : tracked_collections()) {
        if (waiter_->cancelled()) return;
        if (!cache_->needs_refresh(collection.name)) continue;

        try {
            auto items = with_retry([&](const RetryAttempt& attempt) {
                return api_->list(collection.kind, collection.filters, attempt.timeout);
            }, options_.retry, *waiter_);
            cache_->set(collection.name, nlohmann::json(items));
            report.refreshed.push_back(collection.name);
            std::cout << "[SyncCoordinator] Refreshed " << collection.name
                      << " (" << items.size() << " items)" << std::endl;
        } catch (const SyncError& e) {
            report.refresh_failed.push_back(collection.name);
            std::cerr << "[SyncCoordinator] Refresh of " << collection.name << " failed ("
                      << to_string(e.kind()) << "): " << e.what() << std::endl;
        }
    }
}

void SyncCoordinator::refresh_badges(SyncReport& report) {
    int unread = 0;
    try {
        unread = with_retry([&](const RetryAttempt& attempt) {
            return api_->unread_count(attempt.timeout);
        }, options_.retry, *waiter_);
    } catch (const SyncError& e) {
        std::cerr << "[SyncCoordinator] Badge refresh failed (" << to_string(e.kind())
                  << "): " << e.what() << std::endl;
        return;
    }

    Badges updated;
    BadgeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        badges_.unread_messages = unread;
        updated = badges_;
        listener = on_badges_;
    }
    report.badges_refreshed = true;

    if (listener) {
        try {
            listener(updated);
        } catch (const std::exception& e) {
            std::cerr << "[SyncCoordinator] Badge listener failed: " << e.what() << std::endl;
        }
    }
}

} // namespace fieldsync
