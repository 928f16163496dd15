#include "fieldsync/in_memory_transport.hpp"
#include <iostream>

namespace fieldsync {

void InMemoryTransport::open(const std::string& url) {
    std::lock_guard<std::mutex> lk(mutex_);
    opened_urls_.push_back(url);
}

void InMemoryTransport::send(const std::string& text) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) {
        std::cout << "[InMemoryTransport] Dropping frame, transport not open" << std::endl;
        return;
    }
    sent_.push_back(text);
}

void InMemoryTransport::close(int code, const std::string& reason) {
    OnClose cb;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        close_calls_++;
        last_close_code_ = code;
        if (!open_) return;
        open_ = false;
        cb = on_close_;
    }
    std::cout << "[InMemoryTransport] Closed (" << code << " " << reason << ")" << std::endl;
    if (cb) cb(code, true);
}

void InMemoryTransport::set_on_open(OnOpen cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_open_ = std::move(cb);
}

void InMemoryTransport::set_on_message(OnMessage cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_message_ = std::move(cb);
}

void InMemoryTransport::set_on_close(OnClose cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_close_ = std::move(cb);
}

void InMemoryTransport::set_on_error(OnError cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_error_ = std::move(cb);
}

void InMemoryTransport::simulate_open() {
    OnOpen cb;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        open_ = true;
        cb = on_open_;
    }
    if (cb) cb();
}

void InMemoryTransport::simulate_message(const std::string& text) {
    OnMessage cb;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cb = on_message_;
    }
    if (cb) cb(text);
}

void InMemoryTransport::simulate_close(int code, bool was_clean) {
    OnClose cb;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        open_ = false;
        cb = on_close_;
    }
    if (cb) cb(code, was_clean);
}

void InMemoryTransport::simulate_error(const std::string& message) {
    OnError cb;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cb = on_error_;
    }
    if (cb) cb(message);
}

bool InMemoryTransport::is_open() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_;
}

std::vector<std::string> InMemoryTransport::sent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sent_;
}

std::vector<std::string> InMemoryTransport::opened_urls() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return opened_urls_;
}

int InMemoryTransport::close_calls() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return close_calls_;
}

int InMemoryTransport::last_close_code() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return last_close_code_;
}

void InMemoryTransport::clear_sent() {
    std::lock_guard<std::mutex> lk(mutex_);
    sent_.clear();
}

} // namespace fieldsync
