#include "pending_mutation_queue.hpp"
#include "fieldsync/error.hpp"
#include <iostream>

namespace fieldsync {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// Clears the draining flag on every exit path.
class DrainGuard {
public:
    explicit DrainGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~DrainGuard() { flag_ = false; }

private:
    std::atomic<bool>& flag_;
};

} // namespace

PendingMutation make_mutation(EntityKind kind, const Entity& entity) {
    PendingMutation m;
    auto id = server_id(entity);
    m.id = id ? *id : generate_client_id();
    m.entity_kind = kind;
    m.operation = id ? MutationOp::Update : MutationOp::Create;
    m.payload = entity;
    m.enqueued_at = std::chrono::system_clock::now();
    return m;
}

nlohmann::json to_json(const PendingMutation& mutation) {
    nlohmann::json j;
    j["id"] = mutation.id;
    j["entity_kind"] = to_string(mutation.entity_kind);
    j["operation"] = mutation.operation == MutationOp::Create ? "create" : "update";
    j["payload"] = mutation.payload;
    j["attempts"] = mutation.attempts;
    j["last_error"] = mutation.last_error ? nlohmann::json(*mutation.last_error) : nlohmann::json();
    j["enqueued_at"] = to_epoch_ms(mutation.enqueued_at);
    return j;
}

std::optional<PendingMutation> mutation_from_json(const nlohmann::json& j) {
    try {
        if (!j.is_object()) return std::nullopt;

        PendingMutation m;
        m.id = j.at("id").get<std::string>();
        if (m.id.empty()) return std::nullopt;

        auto kind = parse_entity_kind(j.at("entity_kind").get<std::string>());
        if (!kind) return std::nullopt;
        m.entity_kind = *kind;

        std::string op = j.at("operation").get<std::string>();
        if (op == "create") {
            m.operation = MutationOp::Create;
        } else if (op == "update") {
            m.operation = MutationOp::Update;
        } else {
            return std::nullopt;
        }

        m.payload = j.at("payload");
        m.attempts = j.value("attempts", 0);
        if (m.attempts < 0) return std::nullopt;

        auto err = j.find("last_error");
        if (err != j.end() && err->is_string()) {
            m.last_error = err->get<std::string>();
        }
        m.enqueued_at = from_epoch_ms(j.at("enqueued_at").get<int64_t>());
        return m;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

PendingMutationQueue::PendingMutationQueue(KeyValueStorePtr store, std::string storage_key)
    : store_(std::move(store))
    , storage_key_(std::move(storage_key)) {}

size_t PendingMutationQueue::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();

    auto raw = store_->get(storage_key_);
    if (!raw) return 0;

    nlohmann::json doc = nlohmann::json::parse(*raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        std::cerr << "[PendingQueue] Persisted queue is unreadable, discarding it" << std::endl;
        store_->remove(storage_key_);
        return 0;
    }

    int dropped = 0;
    for (const auto& item : doc) {
        auto m = mutation_from_json(item);
        if (m) {
            entries_.push_back(std::move(*m));
        } else {
            dropped++;
        }
    }

    if (dropped > 0) {
        std::cerr << "[PendingQueue] Dropped " << dropped << " malformed entries" << std::endl;
        persist_locked(entries_);
    }

    std::cout << "[PendingQueue] Restored " << entries_.size() << " pending mutations" << std::endl;
    return entries_.size();
}

bool PendingMutationQueue::enqueue(PendingMutation mutation) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::cout << "[PendingQueue] Queued " << to_string(mutation.entity_kind) << " "
              << (mutation.operation == MutationOp::Create ? "create" : "update")
              << ": " << mutation.id << std::endl;

    // Kept in memory even when the write fails; the next successful write
    // persists it.
    entries_.push_back(std::move(mutation));
    return persist_locked(entries_);
}

PendingMutationQueue::DrainResult PendingMutationQueue::drain(const ApplyFn& apply) {
    DrainResult result;

    bool expected = false;
    if (!draining_.compare_exchange_strong(expected, true)) {
        std::cout << "[PendingQueue] Drain already in progress, skipping" << std::endl;
        result.skipped = true;
        return result;
    }
    DrainGuard guard(draining_);

    while (true) {
        PendingMutation head;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entries_.empty()) break;
            head = entries_.front();
            generation = generation_;
        }

        try {
            apply(head);
        } catch (const OperationCancelled&) {
            // Abandoned by shutdown, not a failed attempt.
            std::cout << "[PendingQueue] Drain cancelled at " << head.id << std::endl;
            result.failed = true;
            break;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ == generation && !entries_.empty()) {
                entries_.front().attempts++;
                entries_.front().last_error = e.what();
                persist_locked(entries_);
                std::cerr << "[PendingQueue] Failed to apply " << head.id
                          << " (attempt " << entries_.front().attempts << "): "
                          << e.what() << std::endl;
            }
            result.failed = true;
            break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != generation || entries_.empty()) {
            break;  // cleared while the head was in flight
        }

        std::deque<PendingMutation> remaining(entries_.begin() + 1, entries_.end());
        if (!persist_locked(remaining)) {
            // Still queued, so it will be replayed; handlers are idempotent.
            std::cerr << "[PendingQueue] Could not persist removal of " << head.id
                      << ", stopping drain" << std::endl;
            result.failed = true;
            break;
        }
        entries_ = std::move(remaining);
        result.applied++;
        std::cout << "[PendingQueue] Applied " << head.id << std::endl;
    }

    return result;
}

size_t PendingMutationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t PendingMutationQueue::size_for(EntityKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& m : entries_) {
        if (m.entity_kind == kind) count++;
    }
    return count;
}

std::vector<PendingMutation> PendingMutationQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PendingMutation>(entries_.begin(), entries_.end());
}

PendingMutationQueue::Stats PendingMutationQueue::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats = {0, 0, false};
    stats.pending_count = static_cast<int>(entries_.size());
    for (const auto& m : entries_) {
        stats.total_attempts += m.attempts;
    }
    stats.head_failing = !entries_.empty() && entries_.front().attempts > 0;
    return stats;
}

void PendingMutationQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    generation_++;
    store_->remove(storage_key_);
    std::cout << "[PendingQueue] Cleared" << std::endl;
}

bool PendingMutationQueue::persist_locked(const std::deque<PendingMutation>& entries) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& m : entries) {
        doc.push_back(to_json(m));
    }
    std::string text;
    try {
        // Invalid UTF-8 in a payload becomes U+FFFD rather than blocking the queue.
        text = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[PendingQueue] Failed to serialize queue: " << e.what() << std::endl;
        return false;
    }
    if (!store_->set(storage_key_, text)) {
        std::cerr << "[PendingQueue] Failed to persist queue" << std::endl;
        return false;
    }
    return true;
}

} // namespace fieldsync
