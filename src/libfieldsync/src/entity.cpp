#include "fieldsync/entity.hpp"

namespace fieldsync {

const char* to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Job:     return "job";
        case EntityKind::Message: return "message";
        case EntityKind::Review:  return "review";
        case EntityKind::Booking: return "booking";
    }
    return "job";
}

std::optional<EntityKind> parse_entity_kind(const std::string& text) {
    if (text == "job") return EntityKind::Job;
    if (text == "message") return EntityKind::Message;
    if (text == "review") return EntityKind::Review;
    if (text == "booking") return EntityKind::Booking;
    return std::nullopt;
}

const char* collection_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::Job:     return "jobs";
        case EntityKind::Message: return "messages";
        case EntityKind::Review:  return "reviews";
        case EntityKind::Booking: return "bookings";
    }
    return "jobs";
}

std::optional<std::string> server_id(const Entity& entity) {
    if (!entity.is_object()) return std::nullopt;
    auto it = entity.find("id");
    if (it == entity.end()) return std::nullopt;
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_string() && !it->get<std::string>().empty()) return it->get<std::string>();
    return std::nullopt;
}

} // namespace fieldsync
