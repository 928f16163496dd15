#include "persistent_cache.hpp"
#include <iostream>
#include <stdexcept>

namespace fieldsync {

PersistentCache::PersistentCache(KeyValueStorePtr store, std::chrono::hours freshness, WallClock clock)
    : store_(std::move(store))
    , freshness_(freshness)
    , clock_(clock ? std::move(clock) : WallClock([] { return std::chrono::system_clock::now(); })) {}

std::string PersistentCache::storage_key(const std::string& collection) {
    return "cache:" + collection;
}

size_t PersistentCache::load(const std::vector<std::string>& collections) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t restored = 0;

    for (const auto& collection : collections) {
        auto raw = store_->get(storage_key(collection));
        if (!raw) continue;

        nlohmann::json doc = nlohmann::json::parse(*raw, nullptr, false);
        try {
            if (doc.is_discarded() || !doc.is_object()) {
                throw std::runtime_error("not a JSON object");
            }
            CacheEntry entry;
            entry.data = doc.at("data");
            entry.fetched_at = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(doc.at("fetched_at").get<int64_t>()));
            entry.is_stale = doc.value("is_stale", false);
            if (expired(entry)) {
                entry.is_stale = true;
            }
            entries_[collection] = std::move(entry);
            restored++;
        } catch (const std::exception& e) {
            std::cerr << "[Cache] Discarding unreadable entry for " << collection
                      << ": " << e.what() << std::endl;
            store_->remove(storage_key(collection));
        }
    }

    std::cout << "[Cache] Restored " << restored << " collections" << std::endl;
    return restored;
}

void PersistentCache::set(const std::string& collection, nlohmann::json data) {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheEntry& entry = entries_[collection];
    entry.data = std::move(data);
    entry.fetched_at = clock_();
    entry.is_stale = false;
    persist_locked(collection, entry);
}

std::optional<CacheEntry> PersistentCache::get(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    if (it == entries_.end()) return std::nullopt;

    if (!it->second.is_stale && expired(it->second)) {
        it->second.is_stale = true;
        persist_locked(collection, it->second);
    }
    return it->second;
}

void PersistentCache::mark_stale(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    if (it == entries_.end() || it->second.is_stale) return;
    it->second.is_stale = true;
    persist_locked(collection, it->second);
}

bool PersistentCache::needs_refresh(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    if (it == entries_.end()) return true;
    return it->second.is_stale || expired(it->second);
}

std::vector<std::string> PersistentCache::collections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& kv : entries_) {
        names.push_back(kv.first);
    }
    return names;
}

void PersistentCache::remove(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(collection);
    store_->remove(storage_key(collection));
}

void PersistentCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : entries_) {
        store_->remove(storage_key(kv.first));
    }
    entries_.clear();
    std::cout << "[Cache] Cleared" << std::endl;
}

bool PersistentCache::expired(const CacheEntry& entry) const {
    return clock_() - entry.fetched_at >= freshness_;
}

void PersistentCache::persist_locked(const std::string& collection, const CacheEntry& entry) {
    nlohmann::json doc;
    doc["data"] = entry.data;
    doc["fetched_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.fetched_at.time_since_epoch()).count();
    doc["is_stale"] = entry.is_stale;
    std::string text;
    try {
        text = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Cache] Failed to serialize " << collection << ": " << e.what() << std::endl;
        return;
    }
    if (!store_->set(storage_key(collection), text)) {
        std::cerr << "[Cache] Failed to persist " << collection << std::endl;
    }
}

} // namespace fieldsync
