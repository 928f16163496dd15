#pragma once

#include "fieldsync/message_dispatcher.hpp"
#include "fieldsync/socket_message.hpp"
#include "fieldsync/timer_queue.hpp"
#include "fieldsync/transport.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fieldsync {

class NetworkMonitor;

enum class ConnectionState {
    Disconnected,
    Connecting,
    ConnectedUnauthenticated,
    ConnectedAuthenticated,
    Closing
};

const char* to_string(ConnectionState state);

struct SocketConfig {
    std::string url = "ws://localhost:8000/ws";
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds reconnect_base_delay{3000};
    double reconnect_backoff_factor = 2.0;
    std::chrono::milliseconds reconnect_max_delay{60000};
    int max_reconnect_attempts = 5;
};

enum class SocketEvent {
    Connected,
    Disconnected,
    Error
};

struct SocketEventInfo {
    SocketEvent event;
    int close_code = 0;   // Disconnected only
    std::string message;  // Error only
};

// Owns the single live connection to the backend.
//
// Identity and credential travel in the handshake URL, so a transport open
// moves straight through Connected(unauthenticated) to
// Connected(authenticated). Only an abnormal close schedules a reconnect,
// with exponential backoff, up to max_reconnect_attempts; after that the
// client stays Disconnected until connect() is called again.
//
// Heartbeat pings are sent but pongs are not checked; a dead peer is only
// noticed when the transport reports a close.
//
// Messages sent while not authenticated are buffered and flushed in order on
// the next successful connect.
class ResilientSocketClient {
public:
    using LifecycleListener = std::function<void(const SocketEventInfo&)>;
    using ListenerId = uint64_t;

    // With a monitor, a reconnect falling due while offline waits for the
    // next online transition.
    ResilientSocketClient(SocketConfig config,
                          TransportPtr transport,
                          TimerQueue& timers,
                          NetworkMonitor* network = nullptr);
    ~ResilientSocketClient();

    ResilientSocketClient(const ResilientSocketClient&) = delete;
    ResilientSocketClient& operator=(const ResilientSocketClient&) = delete;

    // No-op unless Disconnected.
    void connect(const std::string& user_id, const std::string& token);

    // Clean close: cancels any pending reconnect and drops the buffer.
    void disconnect();

    void send(const SocketMessage& message);

    void send_chat_message(int64_t receiver_id, int64_t job_id, const std::string& content,
                           const std::vector<std::string>& attachments = {});
    void send_typing_indicator(int64_t receiver_id, int64_t job_id, bool is_typing);
    void send_read_receipt(int64_t message_id, int64_t sender_id);

    MessageDispatcher::HandlerId subscribe(MessageKind kind, MessageDispatcher::Handler handler);
    void unsubscribe(MessageDispatcher::HandlerId id);

    template <MessageKind Kind>
    MessageDispatcher::HandlerId subscribe_typed(
        std::function<void(const typename PayloadTraits<Kind>::type&)> handler) {
        return dispatcher_.subscribe_typed<Kind>(std::move(handler));
    }

    ListenerId add_lifecycle_listener(LifecycleListener listener);
    void remove_lifecycle_listener(ListenerId id);

    ConnectionState get_connection_state() const;
    int reconnect_attempts() const;
    size_t buffered_count() const;

    // Disconnects, drops every listener and cancels every timer. Final.
    void shutdown();

    // base?user_id=<id>&token=<token>, both percent-encoded.
    static std::string build_url(const std::string& base,
                                 const std::string& user_id,
                                 const std::string& token);

private:
    void on_open();
    void on_close(int code, bool was_clean);
    void on_error(const std::string& message);
    void on_message(const std::string& text);
    void on_reconnect_due();
    void on_network_change(bool online);
    void send_heartbeat();

    void open_locked(std::string& url_out);
    void flush_locked();
    void emit(const SocketEventInfo& info);

    SocketConfig config_;
    TransportPtr transport_;
    TimerQueue& timers_;
    NetworkMonitor* network_;
    uint64_t network_subscription_ = 0;

    MessageDispatcher dispatcher_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string user_id_;
    std::string token_;
    bool has_identity_ = false;
    bool shut_down_ = false;
    bool waiting_for_network_ = false;
    int reconnect_attempts_ = 0;
    TimerId heartbeat_timer_ = 0;
    TimerId reconnect_timer_ = 0;
    std::deque<std::string> outbound_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, LifecycleListener> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace fieldsync
