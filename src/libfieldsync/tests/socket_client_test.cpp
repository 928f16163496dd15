#include "fieldsync/in_memory_transport.hpp"
#include "fieldsync/socket_client.hpp"
#include "modules/network/network_monitor.hpp"
#include "common/manual_timer_queue.hpp"
#include "common/test_check.hpp"
#include <iostream>

using namespace fieldsync;
using fieldsync::testing::ManualTimerQueue;
using std::chrono::milliseconds;

namespace {

struct Harness {
    std::shared_ptr<InMemoryTransport> transport = std::make_shared<InMemoryTransport>();
    ManualTimerQueue timers;
    std::vector<SocketEventInfo> events;
    std::unique_ptr<ResilientSocketClient> client;

    explicit Harness(NetworkMonitor* network = nullptr, SocketConfig config = SocketConfig()) {
        config.url = "ws://api.test/ws";
        client = std::make_unique<ResilientSocketClient>(config, transport, timers, network);
        client->add_lifecycle_listener([this](const SocketEventInfo& info) { events.push_back(info); });
    }

    size_t count(SocketEvent event) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.event == event) ++n;
        }
        return n;
    }
};

std::vector<std::string> frame_types(const std::vector<std::string>& frames) {
    std::vector<std::string> types;
    for (const auto& f : frames) {
        types.push_back(nlohmann::json::parse(f)["type"].get<std::string>());
    }
    return types;
}

} // namespace

static void test_build_url() {
    TEST_CHECK(ResilientSocketClient::build_url("ws://h/ws", "42", "abc") ==
               "ws://h/ws?user_id=42&token=abc");
    TEST_CHECK(ResilientSocketClient::build_url("ws://h/ws?v=2", "42", "a b/c") ==
               "ws://h/ws?v=2&user_id=42&token=a%20b%2Fc");
    std::cout << "Build URL test: OK\n";
}

static void test_connect_and_authenticate() {
    Harness h;
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);

    h.client->connect("42", "secret");
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Connecting);
    TEST_CHECK(h.transport->opened_urls().size() == 1);
    TEST_CHECK(h.transport->opened_urls()[0] == "ws://api.test/ws?user_id=42&token=secret");

    // Second connect while connecting is ignored.
    h.client->connect("42", "secret");
    TEST_CHECK(h.transport->opened_urls().size() == 1);

    h.transport->simulate_open();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::ConnectedAuthenticated);
    TEST_CHECK(h.count(SocketEvent::Connected) == 1);

    h.client->connect("42", "secret");
    TEST_CHECK(h.transport->opened_urls().size() == 1);
    std::cout << "Connect and authenticate test: OK\n";
}

static void test_buffered_messages_flush_in_order() {
    Harness h;
    h.client->send_chat_message(7, 99, "first");
    h.client->send_typing_indicator(7, 99, true);
    h.client->send_read_receipt(311, 7);
    TEST_CHECK(h.client->buffered_count() == 3);
    TEST_CHECK(h.transport->sent().empty());

    h.client->connect("42", "secret");
    TEST_CHECK(h.client->buffered_count() == 3);
    h.transport->simulate_open();

    TEST_CHECK(h.client->buffered_count() == 0);
    auto types = frame_types(h.transport->sent());
    TEST_CHECK((types == std::vector<std::string>{"message", "typing", "read_receipt"}));
    auto first = nlohmann::json::parse(h.transport->sent()[0]);
    TEST_CHECK(first["data"]["content"] == "first");
    TEST_CHECK(first["data"]["receiverId"] == 7);

    // Once connected, frames go straight out.
    h.client->send_chat_message(7, 99, "second");
    TEST_CHECK(h.transport->sent().size() == 4);
    std::cout << "Buffered flush test: OK\n";
}

static void test_reconnect_backoff_and_cap() {
    Harness h;
    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.transport->simulate_close(1006, false);

    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.count(SocketEvent::Disconnected) == 1);
    TEST_CHECK(h.events.back().close_code == 1006);
    TEST_CHECK(h.client->reconnect_attempts() == 1);

    // 3s, 6s, 12s, 24s, 48s; every attempt fails before opening.
    const long expected[] = {3000, 6000, 12000, 24000, 48000};
    for (int i = 0; i < 5; ++i) {
        size_t opens = h.transport->opened_urls().size();
        h.timers.advance(milliseconds(expected[i] - 1));
        TEST_CHECK(h.transport->opened_urls().size() == opens);
        h.timers.advance(milliseconds(1));
        TEST_CHECK(h.transport->opened_urls().size() == opens + 1);
        TEST_CHECK(h.client->get_connection_state() == ConnectionState::Connecting);
        h.transport->simulate_close(1006, false);
    }

    TEST_CHECK(h.client->reconnect_attempts() == 5);
    TEST_CHECK(h.timers.pending() == 0);
    size_t opens = h.transport->opened_urls().size();
    h.timers.advance(milliseconds(600000));
    TEST_CHECK(h.transport->opened_urls().size() == opens);
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);

    // An explicit connect still works after giving up.
    h.client->connect("42", "secret");
    h.transport->simulate_open();
    TEST_CHECK(h.client->reconnect_attempts() == 0);
    std::cout << "Reconnect backoff test: OK\n";
}

static void test_successful_open_resets_attempts() {
    Harness h;
    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.transport->simulate_close(1011, false);
    h.timers.advance(milliseconds(3000));
    h.transport->simulate_close(1006, false);
    TEST_CHECK(h.client->reconnect_attempts() == 2);

    h.timers.advance(milliseconds(6000));
    h.transport->simulate_open();
    TEST_CHECK(h.client->reconnect_attempts() == 0);

    // The next outage starts the schedule from the base delay again.
    size_t opens = h.transport->opened_urls().size();
    h.transport->simulate_close(1006, false);
    h.timers.advance(milliseconds(3000));
    TEST_CHECK(h.transport->opened_urls().size() == opens + 1);
    std::cout << "Attempt reset test: OK\n";
}

static void test_clean_close_does_not_reconnect() {
    Harness h;
    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.transport->simulate_close(1000, true);

    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.client->reconnect_attempts() == 0);
    TEST_CHECK(h.timers.pending() == 0);
    h.timers.advance(milliseconds(120000));
    TEST_CHECK(h.transport->opened_urls().size() == 1);
    std::cout << "Clean close test: OK\n";
}

static void test_heartbeat() {
    Harness h;
    h.client->connect("42", "secret");
    h.transport->simulate_open();

    h.timers.advance(milliseconds(29999));
    TEST_CHECK(h.transport->sent().empty());
    h.timers.advance(milliseconds(1));
    TEST_CHECK((frame_types(h.transport->sent()) == std::vector<std::string>{"ping"}));
    h.timers.advance(milliseconds(60000));
    TEST_CHECK(h.transport->sent().size() == 3);

    // Pongs are accepted without effect.
    h.transport->simulate_message(R"({"type":"pong","data":{}})");
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::ConnectedAuthenticated);

    h.client->disconnect();
    h.transport->clear_sent();
    h.timers.advance(milliseconds(90000));
    TEST_CHECK(h.transport->sent().empty());
    std::cout << "Heartbeat test: OK\n";
}

static void test_reconnect_waits_for_network() {
    NetworkMonitor network(true);
    Harness h(&network);
    h.client->connect("42", "secret");
    h.transport->simulate_open();

    network.report(false);
    h.transport->simulate_close(1006, false);
    h.timers.advance(milliseconds(3000));
    TEST_CHECK(h.transport->opened_urls().size() == 1);
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);

    network.report(true);
    TEST_CHECK(h.transport->opened_urls().size() == 2);
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Connecting);

    // Network changes alone never open a connection nobody asked for.
    h.transport->simulate_open();
    h.client->disconnect();
    network.report(false);
    network.report(true);
    TEST_CHECK(h.transport->opened_urls().size() == 2);
    std::cout << "Network gated reconnect test: OK\n";
}

static void test_disconnect() {
    Harness h;
    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.transport->simulate_close(1006, false);
    TEST_CHECK(h.timers.pending() == 1);

    // Disconnect while a reconnect is pending cancels it.
    h.client->send_chat_message(7, 99, "never sent");
    h.client->disconnect();
    TEST_CHECK(h.timers.pending() == 0);
    TEST_CHECK(h.client->buffered_count() == 0);
    h.timers.advance(milliseconds(10000));
    TEST_CHECK(h.transport->opened_urls().size() == 1);

    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.events.clear();
    h.client->disconnect();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.transport->last_close_code() == 1000);
    TEST_CHECK(h.count(SocketEvent::Disconnected) == 1);
    TEST_CHECK(h.events.back().close_code == 1000);
    TEST_CHECK(h.timers.pending() == 0);

    // Disconnect before the handshake finishes still ends disconnected.
    h.client->connect("42", "secret");
    h.events.clear();
    h.client->disconnect();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.count(SocketEvent::Disconnected) == 1);
    h.transport->simulate_open();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    std::cout << "Disconnect test: OK\n";
}

static void test_inbound_dispatch_and_errors() {
    Harness h;
    std::vector<std::string> received;
    h.client->subscribe_typed<MessageKind::DomainMessage>([&](const ChatMessage& chat) {
        received.push_back(chat.content);
    });
    auto id = h.client->subscribe(MessageKind::JobUpdate, [&](const SocketMessage& msg) {
        received.push_back("job " + std::to_string(msg.payload.value("id", 0)));
    });

    h.client->connect("42", "secret");
    h.transport->simulate_open();
    h.transport->simulate_message(R"({"type":"message","data":{"receiverId":42,"jobId":1,"content":"hi"}})");
    h.transport->simulate_message(R"({"type":"job_update","data":{"id":8}})");
    h.transport->simulate_message("garbage");
    h.transport->simulate_message(R"({"type":"presence","data":{}})");
    TEST_CHECK((received == std::vector<std::string>{"hi", "job 8"}));

    h.client->unsubscribe(id);
    h.transport->simulate_message(R"({"type":"job_update","data":{"id":9}})");
    TEST_CHECK(received.size() == 2);

    h.transport->simulate_error("TLS handshake failed");
    TEST_CHECK(h.count(SocketEvent::Error) == 1);
    TEST_CHECK(h.events.back().message == "TLS handshake failed");
    std::cout << "Inbound dispatch test: OK\n";
}

static void test_shutdown() {
    Harness h;
    int delivered = 0;
    h.client->subscribe(MessageKind::Notification, [&](const SocketMessage&) { ++delivered; });
    h.client->connect("42", "secret");
    h.transport->simulate_open();

    h.client->shutdown();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.timers.pending() == 0);

    h.transport->simulate_message(R"({"type":"notification","data":{}})");
    TEST_CHECK(delivered == 0);

    h.client->connect("42", "secret");
    TEST_CHECK(h.transport->opened_urls().size() == 1);
    h.client->shutdown();
    std::cout << "Shutdown test: OK\n";
}

static void test_invalid_utf8_message_flushes() {
    Harness h;
    h.client->send_chat_message(7, 99, "caf\xe9");
    TEST_CHECK(h.client->buffered_count() == 1);

    h.client->connect("42", "secret");
    h.transport->simulate_open();
    TEST_CHECK(h.client->get_connection_state() == ConnectionState::ConnectedAuthenticated);
    TEST_CHECK(h.client->buffered_count() == 0);
    TEST_CHECK(h.transport->sent().size() == 1);
    auto frame = nlohmann::json::parse(h.transport->sent()[0]);
    TEST_CHECK(frame["data"]["content"] == "caf\xEF\xBF\xBD");
    std::cout << "Invalid UTF-8 message test: OK\n";
}

static void test_throwing_listener_does_not_block_others() {
    Harness h;
    int seen = 0;
    h.client->add_lifecycle_listener([](const SocketEventInfo&) { throw 42; });
    h.client->add_lifecycle_listener([&](const SocketEventInfo&) { seen++; });

    h.client->connect("42", "secret");
    h.transport->simulate_open();
    TEST_CHECK(seen == 1);
    TEST_CHECK(h.count(SocketEvent::Connected) == 1);
    std::cout << "Throwing listener test: OK\n";
}

int main() {
    try {
        test_build_url();
        test_connect_and_authenticate();
        test_buffered_messages_flush_in_order();
        test_reconnect_backoff_and_cap();
        test_successful_open_resets_attempts();
        test_clean_close_does_not_reconnect();
        test_heartbeat();
        test_reconnect_waits_for_network();
        test_disconnect();
        test_inbound_dispatch_and_errors();
        test_shutdown();
        test_invalid_utf8_message_flushes();
        test_throwing_listener_does_not_block_others();
        std::cout << "Socket client tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
