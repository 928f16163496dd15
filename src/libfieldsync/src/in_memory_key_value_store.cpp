#include "fieldsync/key_value_store.hpp"

namespace fieldsync {

std::optional<std::string> InMemoryKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return false;
    values_[key] = value;
    return true;
}

bool InMemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return false;
    values_.erase(key);
    return true;
}

void InMemoryKeyValueStore::fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

size_t InMemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

} // namespace fieldsync
