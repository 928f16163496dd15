#include "fieldsync/config.hpp"
#include "common/test_check.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

using namespace fieldsync;
using std::chrono::milliseconds;

static void test_defaults() {
    ClientConfig config;
    TEST_CHECK(config.socket.url == "ws://localhost:8000/ws");
    TEST_CHECK(config.socket.heartbeat_interval == milliseconds(30000));
    TEST_CHECK(config.socket.reconnect_base_delay == milliseconds(3000));
    TEST_CHECK(config.socket.max_reconnect_attempts == 5);
    TEST_CHECK(config.retry.max_attempts == 3);
    TEST_CHECK(config.retry.base_delay == milliseconds(1000));
    TEST_CHECK(config.retry.max_delay == milliseconds(10000));
    TEST_CHECK(config.retry.attempt_timeout == milliseconds(15000));
    TEST_CHECK(config.cache_freshness == std::chrono::hours(24));
    TEST_CHECK(config.sync_interval == milliseconds(30000));
    std::cout << "Config defaults test: OK\n";
}

static void test_environment_overlay() {
    ::setenv("FIELDSYNC_SOCKET_URL", "wss://field.example/ws", 1);
    ::setenv("FIELDSYNC_MAX_RECONNECT_ATTEMPTS", "8", 1);
    ::setenv("FIELDSYNC_RETRY_BACKOFF_FACTOR", "1.5", 1);
    ::setenv("FIELDSYNC_SYNC_INTERVAL_MS", "soon", 1);
    ::setenv("FIELDSYNC_RETRY_MAX_ATTEMPTS", "0", 1);

    ClientConfig base;
    base.data_dir = "/var/lib/fieldsync";
    ClientConfig config = load_config_from_env(base);

    TEST_CHECK(config.socket.url == "wss://field.example/ws");
    TEST_CHECK(config.socket.max_reconnect_attempts == 8);
    TEST_CHECK(config.retry.backoff_factor == 1.5);
    TEST_CHECK(config.data_dir == "/var/lib/fieldsync");
    // Rejected values keep the base.
    TEST_CHECK(config.sync_interval == milliseconds(30000));
    TEST_CHECK(config.retry.max_attempts == 3);

    for (const char* name : {"FIELDSYNC_SOCKET_URL", "FIELDSYNC_MAX_RECONNECT_ATTEMPTS",
                             "FIELDSYNC_RETRY_BACKOFF_FACTOR", "FIELDSYNC_SYNC_INTERVAL_MS",
                             "FIELDSYNC_RETRY_MAX_ATTEMPTS"}) {
        ::unsetenv(name);
    }
    std::cout << "Environment overlay test: OK\n";
}

static void test_settings_file() {
    auto path = std::filesystem::temp_directory_path() /
                ("fieldsync_config_test_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({
            "api_base_url": "https://field.example/api/v1",
            "heartbeat_interval_ms": 15000,
            "cache_freshness_hours": "6",
            "request_timeout_ms": -5,
            "data_dir": ["not", "a", "string"],
            "unknown_key": true
        })";
    }

    ClientConfig config;
    TEST_CHECK(load_config_file(path.string(), config));
    TEST_CHECK(config.api_base_url == "https://field.example/api/v1");
    TEST_CHECK(config.socket.heartbeat_interval == milliseconds(15000));
    TEST_CHECK(config.cache_freshness == std::chrono::hours(6));
    TEST_CHECK(config.retry.attempt_timeout == milliseconds(15000));
    TEST_CHECK(config.data_dir == ".");

    {
        std::ofstream out(path);
        out << "[1, 2, 3]";
    }
    ClientConfig untouched;
    TEST_CHECK(!load_config_file(path.string(), untouched));
    TEST_CHECK(untouched.api_base_url == ClientConfig().api_base_url);

    std::filesystem::remove(path);
    TEST_CHECK(!load_config_file(path.string(), untouched));
    std::cout << "Settings file test: OK\n";
}

int main() {
    try {
        test_defaults();
        test_environment_overlay();
        test_settings_file();
        std::cout << "Config tests: OK\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
}
