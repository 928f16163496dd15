#pragma once

#include "fieldsync/transport.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace fieldsync {

// Transport that never touches the network. Frames sent while open are
// recorded; the simulate_* hooks play the server side synchronously on the
// calling thread.
class InMemoryTransport : public Transport {
public:
    InMemoryTransport() = default;
    ~InMemoryTransport() override = default;

    void open(const std::string& url) override;
    void send(const std::string& text) override;
    void close(int code, const std::string& reason) override;

    void set_on_open(OnOpen cb) override;
    void set_on_message(OnMessage cb) override;
    void set_on_close(OnClose cb) override;
    void set_on_error(OnError cb) override;

    void simulate_open();
    void simulate_message(const std::string& text);
    void simulate_close(int code, bool was_clean);
    void simulate_error(const std::string& message);

    bool is_open() const;
    std::vector<std::string> sent() const;
    std::vector<std::string> opened_urls() const;
    int close_calls() const;
    int last_close_code() const;
    void clear_sent();

private:
    mutable std::mutex mutex_;
    bool open_ = false;
    std::vector<std::string> sent_;
    std::vector<std::string> opened_urls_;
    int close_calls_ = 0;
    int last_close_code_ = 0;

    OnOpen on_open_;
    OnMessage on_message_;
    OnClose on_close_;
    OnError on_error_;
};

} // namespace fieldsync
