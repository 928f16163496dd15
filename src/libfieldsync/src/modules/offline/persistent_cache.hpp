#pragma once

#include "fieldsync/key_value_store.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

struct CacheEntry {
    nlohmann::json data;
    std::chrono::system_clock::time_point fetched_at;
    bool is_stale = false;
};

// Last-known-good snapshots of remote collections, persisted under
// "cache:<collection>". Stale entries are still served; staleness only
// tells the sync pass what to refresh.
class PersistentCache {
public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    explicit PersistentCache(KeyValueStorePtr store,
                             std::chrono::hours freshness = std::chrono::hours(24),
                             WallClock clock = nullptr);

    // Restores the given collections. Expired entries come back flagged
    // stale; unreadable ones are removed from the store.
    size_t load(const std::vector<std::string>& collections);

    void set(const std::string& collection, nlohmann::json data);

    // Never blocks and never hides data: an expired entry is returned as is
    // and flagged stale for the next refresh.
    std::optional<CacheEntry> get(const std::string& collection);

    void mark_stale(const std::string& collection);

    // True when the collection is absent, flagged or older than the window.
    bool needs_refresh(const std::string& collection) const;

    std::vector<std::string> collections() const;
    void remove(const std::string& collection);
    void clear();

private:
    bool expired(const CacheEntry& entry) const;
    void persist_locked(const std::string& collection, const CacheEntry& entry);
    static std::string storage_key(const std::string& collection);

    KeyValueStorePtr store_;
    std::chrono::hours freshness_;
    WallClock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
};

} // namespace fieldsync
