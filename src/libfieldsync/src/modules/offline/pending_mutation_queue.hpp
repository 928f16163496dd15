#pragma once

#include "fieldsync/entity.hpp"
#include "fieldsync/key_value_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

enum class MutationOp {
    Create,
    Update
};

struct PendingMutation {
    std::string id;          // server id, or a generated client id for creates
    EntityKind entity_kind = EntityKind::Job;
    MutationOp operation = MutationOp::Create;
    Entity payload;
    int attempts = 0;
    std::optional<std::string> last_error;
    std::chrono::system_clock::time_point enqueued_at;
};

// Update when the entity already carries a server id, create otherwise.
PendingMutation make_mutation(EntityKind kind, const Entity& entity);

nlohmann::json to_json(const PendingMutation& mutation);
std::optional<PendingMutation> mutation_from_json(const nlohmann::json& j);

// Durable FIFO of writes that have not reached the server yet.
//
// The whole queue is persisted under one key as a JSON array. Every change is
// written to the store first and only then applied in memory, so the store
// is authoritative after a crash. drain() never skips a failing head entry:
// later mutations wait behind it, which keeps replay order across the whole
// queue at the cost of head-of-line blocking.
class PendingMutationQueue {
public:
    // Applies one mutation remotely; throws on failure.
    using ApplyFn = std::function<void(const PendingMutation&)>;

    struct DrainResult {
        int applied = 0;
        bool failed = false;   // stopped at a failing head entry
        bool skipped = false;  // another drain was already running
    };

    struct Stats {
        int pending_count;
        int total_attempts;
        bool head_failing;
    };

    explicit PendingMutationQueue(KeyValueStorePtr store,
                                  std::string storage_key = "pending_mutations");

    // Restores persisted mutations; malformed entries are dropped.
    size_t load();

    bool enqueue(PendingMutation mutation);

    // Not re-entrant: a call made while another drain runs returns skipped.
    DrainResult drain(const ApplyFn& apply);

    size_t size() const;
    size_t size_for(EntityKind kind) const;
    std::vector<PendingMutation> snapshot() const;
    Stats get_stats() const;
    void clear();

private:
    bool persist_locked(const std::deque<PendingMutation>& entries);

    KeyValueStorePtr store_;
    std::string storage_key_;
    mutable std::mutex mutex_;
    std::deque<PendingMutation> entries_;
    uint64_t generation_ = 0;  // bumped by clear()
    std::atomic<bool> draining_{false};
};

} // namespace fieldsync
