#pragma once

#include "fieldsync/entity.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fieldsync {

// Query parameters of a list request.
using Filters = std::map<std::string, std::string>;

// The backend as seen by the sync engine. Every call either returns the
// saved or fetched data or throws SyncError classified by ErrorKind. The
// timeout bounds a single attempt.
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    virtual Entity create(EntityKind kind, const Entity& entity,
                          std::chrono::milliseconds timeout) = 0;
    virtual Entity update(EntityKind kind, const std::string& id, const Entity& entity,
                          std::chrono::milliseconds timeout) = 0;
    virtual std::vector<Entity> list(EntityKind kind, const Filters& filters,
                                     std::chrono::milliseconds timeout) = 0;
    virtual int unread_count(std::chrono::milliseconds timeout) = 0;
};

using RemoteApiPtr = std::shared_ptr<RemoteApi>;

} // namespace fieldsync
