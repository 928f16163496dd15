#include "fieldsync/transport.hpp"
#include <curl/curl.h>
#include <poll.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fieldsync {

namespace {

constexpr int kAbnormalClosure = 1006;
constexpr int kPollTimeoutMs = 50;

} // namespace

// One I/O thread per connection owns the curl handle: it performs the
// handshake, then alternates between flushing the outbound queue and
// reading frames. Callbacks are invoked on that thread.
class WebSocketClientTransport : public Transport {
public:
    WebSocketClientTransport() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~WebSocketClientTransport() override {
        running_ = false;
        if (io_thread_.joinable()) {
            if (io_thread_.get_id() == std::this_thread::get_id()) {
                io_thread_.detach();
            } else {
                io_thread_.join();
            }
        }
        curl_global_cleanup();
    }

    void open(const std::string& url) override {
        if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
            report_failure(generation_, "open() called from the transport thread");
            return;
        }

        // Late callbacks of the previous connection are dropped.
        uint64_t generation = ++generation_;
        running_ = false;
        if (io_thread_.joinable()) {
            io_thread_.join();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            send_queue_.clear();
            close_requested_ = false;
            close_code_ = 1000;
            close_reason_.clear();
        }

        running_ = true;
        io_thread_ = std::thread([this, url, generation]() { run(url, generation); });
        std::cout << "[WebSocket] Connecting to " << redact(url) << std::endl;
    }

    void send(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        send_queue_.push_back(text);
    }

    void close(int code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        close_requested_ = true;
        close_code_ = code;
        close_reason_ = reason;
    }

    void set_on_open(OnOpen cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_open_ = std::move(cb);
    }

    void set_on_message(OnMessage cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_message_ = std::move(cb);
    }

    void set_on_close(OnClose cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_close_ = std::move(cb);
    }

    void set_on_error(OnError cb) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_error_ = std::move(cb);
    }

private:
    // Credentials travel in the query string; keep them out of the log.
    static std::string redact(const std::string& url) {
        auto q = url.find('?');
        return q == std::string::npos ? url : url.substr(0, q) + "?...";
    }

    void run(const std::string& url, uint64_t generation) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            report_failure(generation, "Failed to initialize curl");
            return;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::cerr << "[WebSocket] Handshake failed: " << curl_easy_strerror(res) << std::endl;
            curl_easy_cleanup(curl);
            report_failure(generation, curl_easy_strerror(res));
            return;
        }

        curl_socket_t sockfd = CURL_SOCKET_BAD;
        curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sockfd);

        std::cout << "[WebSocket] Connected" << std::endl;
        emit_open(generation);

        std::string partial;
        std::vector<char> buffer(16 * 1024);

        while (running_) {
            std::string send_error;
            if (!flush_outbound(curl, send_error)) {
                curl_easy_cleanup(curl);
                report_failure(generation, send_error);
                return;
            }

            if (handle_close_request(curl, generation)) {
                curl_easy_cleanup(curl);
                return;
            }

            size_t received = 0;
            struct curl_ws_frame* meta = nullptr;
            res = curl_ws_recv(curl, buffer.data(), buffer.size(), &received, &meta);

            if (res == CURLE_AGAIN) {
                if (sockfd != CURL_SOCKET_BAD) {
                    struct pollfd pfd;
                    pfd.fd = sockfd;
                    pfd.events = POLLIN;
                    pfd.revents = 0;
                    ::poll(&pfd, 1, kPollTimeoutMs);
                }
                continue;
            }

            if (res != CURLE_OK) {
                std::cerr << "[WebSocket] Receive failed: " << curl_easy_strerror(res) << std::endl;
                curl_easy_cleanup(curl);
                report_failure(generation, curl_easy_strerror(res));
                return;
            }

            if (!meta) continue;

            if (meta->flags & CURLWS_CLOSE) {
                int code = kAbnormalClosure;
                if (received >= 2) {
                    code = (static_cast<unsigned char>(buffer[0]) << 8) |
                           static_cast<unsigned char>(buffer[1]);
                }
                std::cout << "[WebSocket] Server closed connection (" << code << ")" << std::endl;
                size_t sent = 0;
                curl_ws_send(curl, buffer.data(), received >= 2 ? 2 : 0, &sent, 0, CURLWS_CLOSE);
                curl_easy_cleanup(curl);
                emit_close(generation, code, true);
                return;
            }

            if (meta->flags & (CURLWS_TEXT | CURLWS_BINARY | CURLWS_CONT)) {
                partial.append(buffer.data(), received);
                if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                    emit_message(generation, partial);
                    partial.clear();
                }
            }
        }

        // Transport replaced or destroyed while connected.
        curl_easy_cleanup(curl);
    }

    bool flush_outbound(CURL* curl, std::string& error) {
        std::deque<std::string> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(send_queue_);
        }

        while (!batch.empty()) {
            const std::string& frame = batch.front();
            size_t offset = 0;
            while (offset < frame.size()) {
                size_t sent = 0;
                CURLcode res = curl_ws_send(curl, frame.data() + offset, frame.size() - offset,
                                            &sent, 0, CURLWS_TEXT);
                if (res == CURLE_AGAIN) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    continue;
                }
                if (res != CURLE_OK) {
                    std::cerr << "[WebSocket] Send failed: " << curl_easy_strerror(res) << std::endl;
                    error = curl_easy_strerror(res);
                    return false;
                }
                offset += sent;
            }
            batch.pop_front();
        }
        return true;
    }

    bool handle_close_request(CURL* curl, uint64_t generation) {
        int code;
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!close_requested_) return false;
            code = close_code_;
            reason = close_reason_;
        }

        std::string payload;
        payload.push_back(static_cast<char>((code >> 8) & 0xFF));
        payload.push_back(static_cast<char>(code & 0xFF));
        payload += reason;

        size_t sent = 0;
        CURLcode res = curl_ws_send(curl, payload.data(), payload.size(), &sent, 0, CURLWS_CLOSE);
        if (res != CURLE_OK) {
            std::cerr << "[WebSocket] Close frame failed: " << curl_easy_strerror(res) << std::endl;
        }
        std::cout << "[WebSocket] Closed (" << code << " " << reason << ")" << std::endl;
        emit_close(generation, code, true);
        return true;
    }

    void report_failure(uint64_t generation, const std::string& message) {
        emit_error(generation, message);
        emit_close(generation, kAbnormalClosure, false);
    }

    void emit_open(uint64_t generation) {
        OnOpen cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) return;
            cb = on_open_;
        }
        if (!cb) return;
        try {
            cb();
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] Open callback failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[WebSocket] Open callback failed" << std::endl;
        }
    }

    void emit_message(uint64_t generation, const std::string& text) {
        OnMessage cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) return;
            cb = on_message_;
        }
        if (!cb) return;
        try {
            cb(text);
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] Message callback failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[WebSocket] Message callback failed" << std::endl;
        }
    }

    void emit_close(uint64_t generation, int code, bool was_clean) {
        OnClose cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) return;
            cb = on_close_;
        }
        if (!cb) return;
        try {
            cb(code, was_clean);
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] Close callback failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[WebSocket] Close callback failed" << std::endl;
        }
    }

    void emit_error(uint64_t generation, const std::string& message) {
        OnError cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) return;
            cb = on_error_;
        }
        if (!cb) return;
        try {
            cb(message);
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] Error callback failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[WebSocket] Error callback failed" << std::endl;
        }
    }

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> generation_{0};
    std::thread io_thread_;

    std::mutex mutex_;
    std::deque<std::string> send_queue_;
    bool close_requested_ = false;
    int close_code_ = 1000;
    std::string close_reason_;

    OnOpen on_open_;
    OnMessage on_message_;
    OnClose on_close_;
    OnError on_error_;
};

TransportPtr create_websocket_transport() {
    return std::make_shared<WebSocketClientTransport>();
}

} // namespace fieldsync
