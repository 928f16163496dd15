#include "fieldsync/message_dispatcher.hpp"
#include <iostream>

namespace fieldsync {

MessageDispatcher::HandlerId MessageDispatcher::subscribe(MessageKind kind, Handler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    HandlerId id = next_id_++;
    handlers_[kind].push_back(Entry{id, std::move(handler)});
    return id;
}

void MessageDispatcher::unsubscribe(HandlerId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& kv : handlers_) {
        auto& entries = kv.second;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->id == id) {
                entries.erase(it);
                return;
            }
        }
    }
}

size_t MessageDispatcher::dispatch(const SocketMessage& msg) const {
    std::vector<Handler> targets;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = handlers_.find(msg.kind);
        if (it == handlers_.end()) return 0;
        for (const auto& entry : it->second) {
            targets.push_back(entry.handler);
        }
    }

    // Handlers may subscribe or unsubscribe, so they run on a copy.
    size_t delivered = 0;
    for (const auto& handler : targets) {
        try {
            handler(msg);
            delivered++;
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] Handler for " << to_string(msg.kind)
                      << " failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[Dispatcher] Handler for " << to_string(msg.kind) << " failed" << std::endl;
        }
    }
    return delivered;
}

size_t MessageDispatcher::handler_count(MessageKind kind) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = handlers_.find(kind);
    return it == handlers_.end() ? 0 : it->second.size();
}

void MessageDispatcher::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    handlers_.clear();
}

} // namespace fieldsync
