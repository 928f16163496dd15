#pragma once

#include <functional>
#include <memory>
#include <string>

namespace fieldsync {

// Bidirectional text-frame channel. open() and close() start the work;
// results arrive through the callbacks, possibly on another thread.
// A failed open reports on_error followed by on_close(1006, false).
class Transport {
public:
    using OnOpen = std::function<void()>;
    using OnMessage = std::function<void(const std::string& text)>;
    using OnClose = std::function<void(int code, bool was_clean)>;
    using OnError = std::function<void(const std::string& message)>;

    virtual ~Transport() = default;

    virtual void open(const std::string& url) = 0;
    virtual void send(const std::string& text) = 0;
    virtual void close(int code, const std::string& reason) = 0;

    virtual void set_on_open(OnOpen cb) = 0;
    virtual void set_on_message(OnMessage cb) = 0;
    virtual void set_on_close(OnClose cb) = 0;
    virtual void set_on_error(OnError cb) = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

// WebSocket transport backed by libcurl.
TransportPtr create_websocket_transport();

} // namespace fieldsync
