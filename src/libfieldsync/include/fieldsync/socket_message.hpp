#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

enum class MessageKind {
    DomainMessage,
    JobUpdate,
    BookingUpdate,
    Notification,
    Typing,
    ReadReceipt,
    Ping,
    Pong
};

// Wire name of the kind ("message", "job_update", ...).
const char* to_string(MessageKind kind);
std::optional<MessageKind> parse_message_kind(const std::string& type);

// Payload of a "message" frame.
struct ChatMessage {
    int64_t receiver_id = 0;
    int64_t job_id = 0;
    std::string content;
    std::vector<std::string> attachments;
};

// Payload of a "typing" frame.
struct TypingIndicator {
    int64_t receiver_id = 0;
    int64_t job_id = 0;
    bool is_typing = false;
};

// Payload of a "read_receipt" frame.
struct ReadReceipt {
    int64_t message_id = 0;
    int64_t sender_id = 0;
};

void to_json(nlohmann::json& j, const ChatMessage& m);
void from_json(const nlohmann::json& j, ChatMessage& m);
void to_json(nlohmann::json& j, const TypingIndicator& t);
void from_json(const nlohmann::json& j, TypingIndicator& t);
void to_json(nlohmann::json& j, const ReadReceipt& r);
void from_json(const nlohmann::json& j, ReadReceipt& r);

// Payload type carried by each kind; kinds without a fixed shape stay JSON.
template <MessageKind Kind>
struct PayloadTraits {
    using type = nlohmann::json;
};

template <>
struct PayloadTraits<MessageKind::DomainMessage> {
    using type = ChatMessage;
};

template <>
struct PayloadTraits<MessageKind::Typing> {
    using type = TypingIndicator;
};

template <>
struct PayloadTraits<MessageKind::ReadReceipt> {
    using type = ReadReceipt;
};

// One frame on the live channel:
//   {"type": "<kind>", "data": <payload>, "timestamp": "<ISO-8601 UTC>"}
class SocketMessage {
public:
    MessageKind kind = MessageKind::Notification;
    nlohmann::json payload = nlohmann::json::object();
    std::chrono::system_clock::time_point sent_at;

    static SocketMessage make(MessageKind kind, nlohmann::json payload);

    std::string serialize() const;

    // Returns nullopt for malformed JSON or an unknown type.
    static std::optional<SocketMessage> parse(const std::string& text);

    template <MessageKind Kind>
    typename PayloadTraits<Kind>::type payload_as() const {
        return payload.get<typename PayloadTraits<Kind>::type>();
    }
};

std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

} // namespace fieldsync
