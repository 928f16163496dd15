#include "fieldsync/http_remote_api.hpp"
#include "fieldsync/error.hpp"
#include "fieldsync/url.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <iostream>
#include <mutex>

namespace fieldsync {

namespace {

size_t write_body(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), realsize);
    return realsize;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

// FastAPI puts the reason in "detail", other handlers in "message".
std::string error_message(int status, const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_object()) {
        for (const char* key : {"detail", "message"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    return "HTTP " + std::to_string(status);
}

} // namespace

struct HttpRemoteApi::Impl {
    std::string base_url;
    std::mutex mutex;
    std::string token;

    nlohmann::json request(const std::string& method, const std::string& path,
                           const nlohmann::json* body, std::chrono::milliseconds timeout) {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl) {
            throw SyncError(ErrorKind::Unknown, "Failed to initialize curl");
        }

        std::string url = base_url + path;
        std::string payload;
        if (body) {
            payload = body->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        std::string response;

        std::string bearer;
        {
            std::lock_guard<std::mutex> lock(mutex);
            bearer = token;
        }

        curl_slist* raw_headers = nullptr;
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
        raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
        if (!bearer.empty()) {
            raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + bearer).c_str());
        }
        std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long long>(timeout.count(), 10000)));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

        if (method == "POST") {
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        } else if (method == "PUT") {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        }

        CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_OPERATION_TIMEDOUT) {
            std::cerr << "[HttpRemoteApi] " << method << " " << path << " timed out" << std::endl;
            throw SyncError(ErrorKind::Timeout, "request timed out after " +
                            std::to_string(timeout.count()) + "ms");
        }
        if (res != CURLE_OK) {
            std::cerr << "[HttpRemoteApi] " << method << " " << path << " failed: "
                      << curl_easy_strerror(res) << std::endl;
            throw SyncError(ErrorKind::Network, curl_easy_strerror(res));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
        std::cout << "[HttpRemoteApi] " << method << " " << path << " -> " << http_code << std::endl;

        int status = static_cast<int>(http_code);
        if (status >= 400) {
            throw SyncError(classify_http_status(status), error_message(status, response), status);
        }

        if (response.empty()) return nlohmann::json();
        nlohmann::json parsed = nlohmann::json::parse(response, nullptr, false);
        if (parsed.is_discarded()) {
            throw SyncError(ErrorKind::Server, "malformed JSON response from " + path, status);
        }
        return parsed;
    }
};

HttpRemoteApi::HttpRemoteApi(const std::string& base_url)
    : impl_(std::make_unique<Impl>()) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    impl_->base_url = base_url;
    while (!impl_->base_url.empty() && impl_->base_url.back() == '/') {
        impl_->base_url.pop_back();
    }
    std::cout << "[HttpRemoteApi] Base URL: " << impl_->base_url << std::endl;
}

HttpRemoteApi::~HttpRemoteApi() {
    curl_global_cleanup();
}

void HttpRemoteApi::set_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->token = token;
}

std::string HttpRemoteApi::create_path(EntityKind kind) {
    // The jobs router is mounted with a trailing slash.
    if (kind == EntityKind::Job) return "/jobs/";
    return std::string("/") + collection_name(kind);
}

std::string HttpRemoteApi::item_path(EntityKind kind, const std::string& id) {
    return std::string("/") + collection_name(kind) + "/" + percent_encode(id);
}

std::string HttpRemoteApi::list_path(EntityKind kind, const Filters& filters) {
    std::string path;
    if (kind == EntityKind::Message) {
        path = "/messages/conversations";
    } else {
        path = create_path(kind);
    }

    char sep = '?';
    for (const auto& kv : filters) {
        path += sep;
        path += percent_encode(kv.first) + "=" + percent_encode(kv.second);
        sep = '&';
    }
    return path;
}

std::vector<Entity> HttpRemoteApi::unwrap_list(EntityKind kind, const nlohmann::json& body) {
    const nlohmann::json* items = nullptr;
    if (body.is_array()) {
        items = &body;
    } else if (body.is_object()) {
        auto it = body.find(collection_name(kind));
        if (it != body.end() && it->is_array()) {
            items = &*it;
        }
    }
    if (!items) {
        throw SyncError(ErrorKind::Server, std::string("unexpected list response for ") +
                        collection_name(kind));
    }
    return std::vector<Entity>(items->begin(), items->end());
}

Entity HttpRemoteApi::create(EntityKind kind, const Entity& entity, std::chrono::milliseconds timeout) {
    return impl_->request("POST", create_path(kind), &entity, timeout);
}

Entity HttpRemoteApi::update(EntityKind kind, const std::string& id, const Entity& entity,
                             std::chrono::milliseconds timeout) {
    return impl_->request("PUT", item_path(kind, id), &entity, timeout);
}

std::vector<Entity> HttpRemoteApi::list(EntityKind kind, const Filters& filters,
                                        std::chrono::milliseconds timeout) {
    return unwrap_list(kind, impl_->request("GET", list_path(kind, filters), nullptr, timeout));
}

int HttpRemoteApi::unread_count(std::chrono::milliseconds timeout) {
    nlohmann::json body = impl_->request("GET", "/messages/unread-count", nullptr, timeout);
    if (body.is_number_integer()) {
        return body.get<int>();
    }
    if (body.is_object()) {
        for (const char* key : {"unread_count", "count"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_number_integer()) {
                return it->get<int>();
            }
        }
    }
    throw SyncError(ErrorKind::Server, "unexpected unread-count response");
}

} // namespace fieldsync
