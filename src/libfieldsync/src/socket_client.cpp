#include "fieldsync/socket_client.hpp"
#include "fieldsync/retry_policy.hpp"
#include "fieldsync/url.hpp"
#include "modules/network/network_monitor.hpp"
#include <iostream>

namespace fieldsync {

namespace {

constexpr int kNormalClosure = 1000;

} // namespace

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::ConnectedUnauthenticated: return "connected(unauthenticated)";
        case ConnectionState::ConnectedAuthenticated: return "connected(authenticated)";
        case ConnectionState::Closing: return "closing";
    }
    return "unknown";
}

ResilientSocketClient::ResilientSocketClient(SocketConfig config,
                                             TransportPtr transport,
                                             TimerQueue& timers,
                                             NetworkMonitor* network)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , timers_(timers)
    , network_(network) {
    transport_->set_on_open([this]() { on_open(); });
    transport_->set_on_message([this](const std::string& text) { on_message(text); });
    transport_->set_on_close([this](int code, bool was_clean) { on_close(code, was_clean); });
    transport_->set_on_error([this](const std::string& message) { on_error(message); });

    if (network_) {
        network_subscription_ = network_->subscribe([this](bool online) { on_network_change(online); });
    }
}

ResilientSocketClient::~ResilientSocketClient() {
    shutdown();
}

std::string ResilientSocketClient::build_url(const std::string& base,
                                             const std::string& user_id,
                                             const std::string& token) {
    std::string url = base;
    url += (base.find('?') == std::string::npos) ? '?' : '&';
    url += "user_id=" + percent_encode(user_id);
    url += "&token=" + percent_encode(token);
    return url;
}

void ResilientSocketClient::connect(const std::string& user_id, const std::string& token) {
    std::string url;
    TimerId pending_reconnect = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            std::cerr << "[SocketClient] connect() after shutdown ignored" << std::endl;
            return;
        }
        if (state_ != ConnectionState::Disconnected) {
            std::cout << "[SocketClient] Already " << to_string(state_) << ", connect() ignored" << std::endl;
            return;
        }
        user_id_ = user_id;
        token_ = token;
        has_identity_ = true;
        waiting_for_network_ = false;
        pending_reconnect = reconnect_timer_;
        reconnect_timer_ = 0;
        open_locked(url);
    }

    if (pending_reconnect) timers_.cancel(pending_reconnect);
    transport_->open(url);
}

void ResilientSocketClient::disconnect() {
    TimerId heartbeat;
    TimerId reconnect;
    bool close_transport = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        heartbeat = heartbeat_timer_;
        reconnect = reconnect_timer_;
        heartbeat_timer_ = 0;
        reconnect_timer_ = 0;
        waiting_for_network_ = false;
        if (!outbound_.empty()) {
            std::cout << "[SocketClient] Dropping " << outbound_.size() << " buffered messages" << std::endl;
            outbound_.clear();
        }
        if (state_ != ConnectionState::Disconnected) {
            state_ = ConnectionState::Closing;
            close_transport = true;
        }
    }

    if (reconnect) timers_.cancel(reconnect);
    if (heartbeat) timers_.cancel(heartbeat);
    if (!close_transport) return;

    std::cout << "[SocketClient] Disconnecting" << std::endl;
    transport_->close(kNormalClosure, "Client disconnect");

    // The transport may report the close later, or not at all if it never
    // finished opening; the client is disconnected either way.
    bool finished_here = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Closing) {
            state_ = ConnectionState::Disconnected;
            finished_here = true;
        }
    }
    if (finished_here) {
        SocketEventInfo info{SocketEvent::Disconnected, kNormalClosure, ""};
        emit(info);
    }
}

void ResilientSocketClient::send(const SocketMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        std::cerr << "[SocketClient] send() after shutdown dropped" << std::endl;
        return;
    }
    std::string text = message.serialize();
    if (state_ == ConnectionState::ConnectedAuthenticated) {
        transport_->send(text);
        return;
    }
    outbound_.push_back(std::move(text));
    std::cout << "[SocketClient] Not connected, buffered " << to_string(message.kind)
              << " (" << outbound_.size() << " pending)" << std::endl;
}

void ResilientSocketClient::send_chat_message(int64_t receiver_id, int64_t job_id,
                                              const std::string& content,
                                              const std::vector<std::string>& attachments) {
    ChatMessage chat;
    chat.receiver_id = receiver_id;
    chat.job_id = job_id;
    chat.content = content;
    chat.attachments = attachments;
    send(SocketMessage::make(MessageKind::DomainMessage, chat));
}

void ResilientSocketClient::send_typing_indicator(int64_t receiver_id, int64_t job_id, bool is_typing) {
    TypingIndicator typing;
    typing.receiver_id = receiver_id;
    typing.job_id = job_id;
    typing.is_typing = is_typing;
    send(SocketMessage::make(MessageKind::Typing, typing));
}

void ResilientSocketClient::send_read_receipt(int64_t message_id, int64_t sender_id) {
    ReadReceipt receipt;
    receipt.message_id = message_id;
    receipt.sender_id = sender_id;
    send(SocketMessage::make(MessageKind::ReadReceipt, receipt));
}

MessageDispatcher::HandlerId ResilientSocketClient::subscribe(MessageKind kind,
                                                              MessageDispatcher::Handler handler) {
    return dispatcher_.subscribe(kind, std::move(handler));
}

void ResilientSocketClient::unsubscribe(MessageDispatcher::HandlerId id) {
    dispatcher_.unsubscribe(id);
}

ResilientSocketClient::ListenerId ResilientSocketClient::add_lifecycle_listener(LifecycleListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void ResilientSocketClient::remove_lifecycle_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

ConnectionState ResilientSocketClient::get_connection_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int ResilientSocketClient::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

size_t ResilientSocketClient::buffered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

void ResilientSocketClient::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
    }

    disconnect();

    if (network_ && network_subscription_) {
        network_->unsubscribe(network_subscription_);
        network_subscription_ = 0;
    }

    transport_->set_on_open(nullptr);
    transport_->set_on_message(nullptr);
    transport_->set_on_close(nullptr);
    transport_->set_on_error(nullptr);

    dispatcher_.clear();
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.clear();
    }
    std::cout << "[SocketClient] Shut down" << std::endl;
}

void ResilientSocketClient::on_open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connecting) {
            std::cout << "[SocketClient] Ignoring open while " << to_string(state_) << std::endl;
            return;
        }

        state_ = ConnectionState::ConnectedUnauthenticated;
        // Credentials were part of the handshake.
        state_ = ConnectionState::ConnectedAuthenticated;
        std::cout << "[SocketClient] Connected as " << user_id_ << std::endl;

        reconnect_attempts_ = 0;
        waiting_for_network_ = false;
        if (config_.heartbeat_interval.count() > 0) {
            heartbeat_timer_ = timers_.schedule_every(config_.heartbeat_interval,
                                                      [this]() { send_heartbeat(); });
        }
        flush_locked();
    }

    SocketEventInfo info{SocketEvent::Connected, 0, ""};
    emit(info);
}

void ResilientSocketClient::on_close(int code, bool was_clean) {
    TimerId heartbeat;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Disconnected) return;

        bool clean = was_clean || state_ == ConnectionState::Closing;
        state_ = ConnectionState::Disconnected;
        heartbeat = heartbeat_timer_;
        heartbeat_timer_ = 0;

        std::cout << "[SocketClient] Connection closed (" << code
                  << (clean ? ", clean" : ", abnormal") << ")" << std::endl;

        if (!clean && !shut_down_ && has_identity_) {
            if (reconnect_attempts_ < config_.max_reconnect_attempts) {
                auto delay = backoff_delay(config_.reconnect_base_delay,
                                           config_.reconnect_backoff_factor,
                                           reconnect_attempts_,
                                           config_.reconnect_max_delay);
                reconnect_attempts_++;
                std::cout << "[SocketClient] Reconnecting in " << delay.count() << "ms (attempt "
                          << reconnect_attempts_ << "/" << config_.max_reconnect_attempts << ")" << std::endl;
                reconnect_timer_ = timers_.schedule_after(delay, [this]() { on_reconnect_due(); });
            } else {
                std::cerr << "[SocketClient] Max reconnect attempts reached, staying disconnected" << std::endl;
            }
        }
    }

    if (heartbeat) timers_.cancel(heartbeat);

    SocketEventInfo info{SocketEvent::Disconnected, code, ""};
    emit(info);
}

void ResilientSocketClient::on_error(const std::string& message) {
    std::cerr << "[SocketClient] Transport error: " << message << std::endl;
    SocketEventInfo info{SocketEvent::Error, 0, message};
    emit(info);
}

void ResilientSocketClient::on_message(const std::string& text) {
    auto message = SocketMessage::parse(text);
    if (!message) return;
    dispatcher_.dispatch(*message);
}

void ResilientSocketClient::on_reconnect_due() {
    std::string url;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_timer_ = 0;
        if (shut_down_ || state_ != ConnectionState::Disconnected) return;

        if (network_ && !network_->is_online()) {
            waiting_for_network_ = true;
            std::cout << "[SocketClient] Offline, reconnect deferred until network returns" << std::endl;
            return;
        }
        open_locked(url);
    }
    transport_->open(url);
}

void ResilientSocketClient::on_network_change(bool online) {
    if (!online) return;

    std::string url;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!waiting_for_network_ || shut_down_ || state_ != ConnectionState::Disconnected) return;
        waiting_for_network_ = false;
        open_locked(url);
    }
    transport_->open(url);
}

void ResilientSocketClient::send_heartbeat() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::ConnectedAuthenticated) return;
    transport_->send(SocketMessage::make(MessageKind::Ping, nlohmann::json::object()).serialize());
}

void ResilientSocketClient::open_locked(std::string& url_out) {
    state_ = ConnectionState::Connecting;
    url_out = build_url(config_.url, user_id_, token_);
    std::cout << "[SocketClient] Connecting" << std::endl;
}

void ResilientSocketClient::flush_locked() {
    if (outbound_.empty()) return;
    std::cout << "[SocketClient] Flushing " << outbound_.size() << " buffered messages" << std::endl;
    while (!outbound_.empty()) {
        transport_->send(outbound_.front());
        outbound_.pop_front();
    }
}

void ResilientSocketClient::emit(const SocketEventInfo& info) {
    std::vector<LifecycleListener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& kv : listeners_) {
            targets.push_back(kv.second);
        }
    }
    for (const auto& listener : targets) {
        try {
            listener(info);
        } catch (const std::exception& e) {
            std::cerr << "[SocketClient] Lifecycle listener failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[SocketClient] Lifecycle listener failed" << std::endl;
        }
    }
}

} // namespace fieldsync
