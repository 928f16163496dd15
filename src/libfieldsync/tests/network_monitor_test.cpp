#include "modules/network/network_monitor.hpp"
#include "common/test_check.hpp"
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fieldsync;
using std::chrono::milliseconds;

static void test_edge_triggered() {
    NetworkMonitor network(true);
    std::vector<bool> seen;
    network.subscribe([&](bool online) { seen.push_back(online); });

    network.report(true);
    TEST_CHECK(seen.empty());
    network.report(false);
    network.report(false);
    network.report(true);
    TEST_CHECK((seen == std::vector<bool>{false, true}));
    TEST_CHECK(network.is_online());
    std::cout << "Edge triggered test: OK\n";
}

static void test_unsubscribe_and_failing_listener() {
    NetworkMonitor network(false);
    int a = 0;
    int c = 0;
    auto first = network.subscribe([&](bool) { ++a; });
    network.subscribe([&](bool) { throw std::runtime_error("listener bug"); });
    network.subscribe([&](bool) { ++c; });

    network.report(true);
    TEST_CHECK(a == 1);
    TEST_CHECK(c == 1);

    network.unsubscribe(first);
    network.report(false);
    TEST_CHECK(a == 1);
    TEST_CHECK(c == 2);
    std::cout << "Unsubscribe test: OK\n";
}

static void test_reentrant_report_keeps_order() {
    NetworkMonitor network(true);
    std::vector<bool> first_seen;
    std::vector<bool> second_seen;

    // The first listener flips the state back while the drop is being delivered.
    network.subscribe([&](bool online) {
        first_seen.push_back(online);
        if (!online) network.report(true);
    });
    network.subscribe([&](bool online) { second_seen.push_back(online); });

    network.report(false);
    TEST_CHECK((first_seen == std::vector<bool>{false, true}));
    TEST_CHECK((second_seen == std::vector<bool>{false, true}));
    TEST_CHECK(network.is_online());
    std::cout << "Re-entrant report test: OK\n";
}

static void test_polling_probe() {
    NetworkMonitor network(true);
    std::atomic<bool> link{false};
    std::atomic<int> transitions{0};
    network.subscribe([&](bool) { ++transitions; });

    network.start([&]() { return link.load(); }, milliseconds(5));
    TEST_CHECK(network.running());

    for (int i = 0; i < 400 && network.is_online(); ++i) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    TEST_CHECK(!network.is_online());

    link = true;
    for (int i = 0; i < 400 && !network.is_online(); ++i) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    TEST_CHECK(network.is_online());
    TEST_CHECK(transitions >= 2);

    network.stop();
    TEST_CHECK(!network.running());
    link = false;
    std::this_thread::sleep_for(milliseconds(30));
    TEST_CHECK(network.is_online());
    std::cout << "Polling probe test: OK\n";
}

static void test_throwing_probe() {
    NetworkMonitor network(true);
    network.start([]() -> bool { throw std::runtime_error("probe failed"); }, milliseconds(5));
    std::this_thread::sleep_for(milliseconds(30));
    TEST_CHECK(network.is_online());
    network.stop();

    // Whatever the host looks like, the one-shot check must not throw.
    bool online = NetworkMonitor::check_connectivity();
    std::cout << "Host connectivity: " << (online ? "online" : "offline") << "\n";
    std::cout << "Throwing probe test: OK\n";
}

int main() {
    try {
        test_edge_triggered();
        test_unsubscribe_and_failing_listener();
        test_reentrant_report_keeps_order();
        test_polling_probe();
        test_throwing_probe();
        std::cout << "Network monitor tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
