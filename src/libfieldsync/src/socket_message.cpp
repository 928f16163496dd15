#include "fieldsync/socket_message.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace fieldsync {

namespace {

struct KindName {
    MessageKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {MessageKind::DomainMessage, "message"},
    {MessageKind::JobUpdate, "job_update"},
    {MessageKind::BookingUpdate, "booking_update"},
    {MessageKind::Notification, "notification"},
    {MessageKind::Typing, "typing"},
    {MessageKind::ReadReceipt, "read_receipt"},
    {MessageKind::Ping, "ping"},
    {MessageKind::Pong, "pong"},
};

// Backend ids arrive as numbers, occasionally as numeric strings.
int64_t read_id(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("non-numeric id in ") + key);
        }
    }
    throw std::invalid_argument(std::string("missing id in ") + key);
}

} // namespace

const char* to_string(MessageKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

std::optional<MessageKind> parse_message_kind(const std::string& type) {
    for (const auto& entry : kKindNames) {
        if (type == entry.name) return entry.kind;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const ChatMessage& m) {
    j = nlohmann::json{
        {"receiverId", m.receiver_id},
        {"jobId", m.job_id},
        {"content", m.content},
        {"attachments", m.attachments},
    };
}

void from_json(const nlohmann::json& j, ChatMessage& m) {
    m.receiver_id = read_id(j, "receiverId");
    m.job_id = read_id(j, "jobId");
    m.content = j.at("content").get<std::string>();
    m.attachments.clear();
    auto it = j.find("attachments");
    if (it != j.end() && it->is_array()) {
        m.attachments = it->get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const TypingIndicator& t) {
    j = nlohmann::json{
        {"receiverId", t.receiver_id},
        {"jobId", t.job_id},
        {"isTyping", t.is_typing},
    };
}

void from_json(const nlohmann::json& j, TypingIndicator& t) {
    t.receiver_id = read_id(j, "receiverId");
    t.job_id = read_id(j, "jobId");
    t.is_typing = j.at("isTyping").get<bool>();
}

void to_json(nlohmann::json& j, const ReadReceipt& r) {
    j = nlohmann::json{
        {"messageId", r.message_id},
        {"senderId", r.sender_id},
    };
}

void from_json(const nlohmann::json& j, ReadReceipt& r) {
    r.message_id = read_id(j, "messageId");
    r.sender_id = read_id(j, "senderId");
}

SocketMessage SocketMessage::make(MessageKind kind, nlohmann::json payload) {
    SocketMessage msg;
    msg.kind = kind;
    msg.payload = std::move(payload);
    msg.sent_at = std::chrono::system_clock::now();
    return msg;
}

std::string SocketMessage::serialize() const {
    nlohmann::json j;
    j["type"] = to_string(kind);
    j["data"] = payload;
    j["timestamp"] = format_timestamp(sent_at);
    // Invalid UTF-8 in user text becomes U+FFFD instead of failing the send.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<SocketMessage> SocketMessage::parse(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[SocketMessage] Dropping malformed frame" << std::endl;
        return std::nullopt;
    }

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        std::cerr << "[SocketMessage] Dropping frame without a type" << std::endl;
        return std::nullopt;
    }

    auto kind = parse_message_kind(type->get<std::string>());
    if (!kind) {
        std::cout << "[SocketMessage] Unknown message type: " << type->get<std::string>() << std::endl;
        return std::nullopt;
    }

    SocketMessage msg;
    msg.kind = *kind;
    auto data = j.find("data");
    msg.payload = data != j.end() ? *data : nlohmann::json::object();

    std::optional<std::chrono::system_clock::time_point> sent_at;
    auto ts = j.find("timestamp");
    if (ts != j.end() && ts->is_string()) {
        sent_at = parse_timestamp(ts->get<std::string>());
    }
    msg.sent_at = sent_at ? *sent_at : std::chrono::system_clock::now();
    return msg;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm utc{};
    int millis = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                             &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                             &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis);
    if (fields < 6) return std::nullopt;

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t secs = timegm(&utc);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;

    return std::chrono::system_clock::time_point(
        std::chrono::seconds(secs) + std::chrono::milliseconds(fields == 7 ? millis : 0));
}

} // namespace fieldsync
