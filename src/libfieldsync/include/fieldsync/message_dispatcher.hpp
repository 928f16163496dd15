#pragma once

#include "fieldsync/socket_message.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace fieldsync {

// Routes inbound frames to the handlers registered for their kind.
//
// Dispatch is synchronous. A throwing handler is logged and skipped; the
// remaining handlers for the same frame still run.
class MessageDispatcher {
public:
    using Handler = std::function<void(const SocketMessage&)>;
    using HandlerId = uint64_t;

    HandlerId subscribe(MessageKind kind, Handler handler);
    void unsubscribe(HandlerId id);

    // Hands the handler the decoded payload type of the kind.
    template <MessageKind Kind>
    HandlerId subscribe_typed(std::function<void(const typename PayloadTraits<Kind>::type&)> handler) {
        return subscribe(Kind, [handler](const SocketMessage& msg) {
            handler(msg.payload_as<Kind>());
        });
    }

    // Returns how many handlers ran without throwing.
    size_t dispatch(const SocketMessage& msg) const;

    size_t handler_count(MessageKind kind) const;
    void clear();

private:
    struct Entry {
        HandlerId id;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::map<MessageKind, std::vector<Entry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace fieldsync
