#include "fieldsync/key_value_store.hpp"
#include <sqlite3.h>
#include <chrono>
#include <iostream>

namespace fieldsync {

struct SqliteKeyValueStore::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;

    ~Impl() {
        if (db) sqlite3_close(db);
    }

    bool exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[SqliteStore] SQLite error: " << (err ? err : "unknown") << std::endl;
            sqlite3_free(err);
            return false;
        }
        return true;
    }
};

SqliteKeyValueStore::SqliteKeyValueStore() : impl_(std::make_unique<Impl>()) {}

SqliteKeyValueStore::~SqliteKeyValueStore() = default;

bool SqliteKeyValueStore::initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (sqlite3_open(db_path.c_str(), &impl_->db) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Cannot open database: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    std::cout << "[SqliteStore] Opened database at: " << db_path << std::endl;

    // WAL keeps a torn write from corrupting the previous value
    impl_->exec("PRAGMA journal_mode=WAL");

    const char* create_table_sql = R"(
        CREATE TABLE IF NOT EXISTS kv_store (
            key TEXT PRIMARY KEY NOT NULL,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )";

    return impl_->exec(create_table_sql);
}

std::optional<std::string> SqliteKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->db) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT value FROM kv_store WHERE key = ?";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Failed to prepare query: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) {
            value = std::string(reinterpret_cast<const char*>(text),
                                static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
        }
    } else if (rc != SQLITE_DONE) {
        std::cerr << "[SqliteStore] Read of '" << key << "' failed, treating as absent: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
    }
    sqlite3_finalize(stmt);

    return value;
}

bool SqliteKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT OR REPLACE INTO kv_store (key, value, updated_at)
        VALUES (?, ?, ?)
    )";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Failed to prepare statement: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "[SqliteStore] Failed to write '" << key << "': "
                  << sqlite3_errmsg(impl_->db) << std::endl;
    }
    sqlite3_finalize(stmt);

    return success;
}

bool SqliteKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM kv_store WHERE key = ?";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);

    return success;
}

} // namespace fieldsync
