#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fieldsync {

// Domain records are opaque JSON snapshots owned by the API layer.
using Entity = nlohmann::json;

enum class EntityKind {
    Job,
    Message,
    Review,
    Booking
};

const char* to_string(EntityKind kind);
std::optional<EntityKind> parse_entity_kind(const std::string& text);

// REST collection and cache collection name ("jobs", "messages", ...).
const char* collection_name(EntityKind kind);

// The server-assigned id of an entity, if it has one yet.
std::optional<std::string> server_id(const Entity& entity);

// Random identifier for records created before the server has seen them,
// e.g. "local-3f9a...". Uses libsodium's CSPRNG.
std::string generate_client_id();

} // namespace fieldsync
