#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace fieldsync {

// Durable string store shared by the cache and the pending queue. Each user
// owns a disjoint key namespace. A value that cannot be read is reported as
// absent, never as an error.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

using KeyValueStorePtr = std::shared_ptr<KeyValueStore>;

// SQLite-backed store; survives process restarts.
class SqliteKeyValueStore : public KeyValueStore {
public:
    SqliteKeyValueStore();
    ~SqliteKeyValueStore() override;

    // Opens (creating if needed) the database at db_path.
    bool initialize(const std::string& db_path);

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Process-local store for tests and memory-only sessions.
class InMemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    // Test hook: makes every following set() fail.
    void fail_writes(bool fail);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
    bool fail_writes_ = false;
};

} // namespace fieldsync
