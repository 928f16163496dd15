#include "fieldsync.h"
#include "modules/network/network_monitor.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop = true;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

} // namespace

// Usage: fieldsync_desktop [settings.json]
// Credentials come from FIELDSYNC_USER_ID and FIELDSYNC_TOKEN.
int main(int argc, char** argv) {
    try {
        std::cout << "Starting fieldsync desktop client..." << std::endl;

        fieldsync::ClientConfig config;
        if (argc > 1) {
            fieldsync::load_config_file(argv[1], config);
        }
        config = fieldsync::load_config_from_env(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        fieldsync::Session session(config);
        session.start();

        session.socket().add_lifecycle_listener([](const fieldsync::SocketEventInfo& info) {
            switch (info.event) {
                case fieldsync::SocketEvent::Connected:
                    std::cout << "Live channel up" << std::endl;
                    break;
                case fieldsync::SocketEvent::Disconnected:
                    std::cout << "Live channel down (" << info.close_code << ")" << std::endl;
                    break;
                case fieldsync::SocketEvent::Error:
                    std::cout << "Live channel error: " << info.message << std::endl;
                    break;
            }
        });

        session.socket().subscribe_typed<fieldsync::MessageKind::DomainMessage>(
            [](const fieldsync::ChatMessage& msg) {
                std::cout << "Message for job " << msg.job_id << ": " << msg.content << std::endl;
            });

        session.sync().set_on_badges([](const fieldsync::Badges& badges) {
            std::cout << "Unread messages: " << badges.unread_messages << std::endl;
        });

        std::string user_id = env_or("FIELDSYNC_USER_ID", "");
        std::string token = env_or("FIELDSYNC_TOKEN", "");
        if (user_id.empty() || token.empty()) {
            std::cout << "FIELDSYNC_USER_ID / FIELDSYNC_TOKEN not set, running offline only" << std::endl;
        } else {
            session.login(user_id, token);
        }

        auto last_status = std::chrono::steady_clock::now();
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(10)) {
                last_status = now;
                std::cout << "Status: " << (session.network().is_online() ? "online" : "offline")
                          << ", socket " << fieldsync::to_string(session.socket().get_connection_state())
                          << ", " << session.sync().pending_count() << " pending writes" << std::endl;
            }
        }

        std::cout << "Stopping..." << std::endl;
        session.shutdown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Unknown exception caught" << std::endl;
        return 1;
    }
}
