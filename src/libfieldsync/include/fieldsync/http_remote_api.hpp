#pragma once

#include "fieldsync/remote_api.hpp"
#include <memory>
#include <string>

namespace fieldsync {

// RemoteApi over the backend's REST layout, using libcurl.
//
//   jobs      POST /jobs/          PUT /jobs/{id}      GET /jobs/
//   messages  POST /messages       PUT /messages/{id}  GET /messages/conversations
//   bookings  POST /bookings       PUT /bookings/{id}  GET /bookings
//   reviews   POST /reviews        PUT /reviews/{id}   GET /reviews
//   GET /messages/unread-count
//
// Curl timeouts map to ErrorKind::Timeout, other transfer failures to
// Network, and HTTP error statuses through classify_http_status().
class HttpRemoteApi : public RemoteApi {
public:
    explicit HttpRemoteApi(const std::string& base_url);
    ~HttpRemoteApi() override;

    HttpRemoteApi(const HttpRemoteApi&) = delete;
    HttpRemoteApi& operator=(const HttpRemoteApi&) = delete;

    // Sent as "Authorization: Bearer <token>"; empty sends no header.
    void set_token(const std::string& token);

    Entity create(EntityKind kind, const Entity& entity,
                  std::chrono::milliseconds timeout) override;
    Entity update(EntityKind kind, const std::string& id, const Entity& entity,
                  std::chrono::milliseconds timeout) override;
    std::vector<Entity> list(EntityKind kind, const Filters& filters,
                             std::chrono::milliseconds timeout) override;
    int unread_count(std::chrono::milliseconds timeout) override;

    // Path segments, exposed for tests.
    static std::string create_path(EntityKind kind);
    static std::string item_path(EntityKind kind, const std::string& id);
    static std::string list_path(EntityKind kind, const Filters& filters);

    // Accepts a bare array or one wrapped as {"<collection>": [...]}.
    static std::vector<Entity> unwrap_list(EntityKind kind, const nlohmann::json& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fieldsync
