#include "fieldsync/config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fieldsync {

namespace {

using Setter = std::function<void(ClientConfig&, const std::string&)>;

struct Field {
    const char* key;
    Setter apply;  // throws std::invalid_argument on a bad value
};

int64_t parse_integer(const std::string& text, int64_t min_value) {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size()) throw std::invalid_argument("trailing characters");
    if (value < min_value) throw std::invalid_argument("must be at least " + std::to_string(min_value));
    return value;
}

double parse_factor(const std::string& text) {
    size_t pos = 0;
    double value = std::stod(text, &pos);
    if (pos != text.size()) throw std::invalid_argument("trailing characters");
    if (value < 1.0) throw std::invalid_argument("must be at least 1");
    return value;
}

std::chrono::milliseconds parse_ms(const std::string& text) {
    return std::chrono::milliseconds(parse_integer(text, 0));
}

const std::vector<Field>& fields() {
    static const std::vector<Field> table = {
        {"socket_url", [](ClientConfig& c, const std::string& v) {
            if (v.empty()) throw std::invalid_argument("empty");
            c.socket.url = v;
        }},
        {"api_base_url", [](ClientConfig& c, const std::string& v) {
            if (v.empty()) throw std::invalid_argument("empty");
            c.api_base_url = v;
        }},
        {"data_dir", [](ClientConfig& c, const std::string& v) {
            if (v.empty()) throw std::invalid_argument("empty");
            c.data_dir = v;
        }},
        {"heartbeat_interval_ms", [](ClientConfig& c, const std::string& v) {
            c.socket.heartbeat_interval = parse_ms(v);
        }},
        {"reconnect_base_delay_ms", [](ClientConfig& c, const std::string& v) {
            c.socket.reconnect_base_delay = parse_ms(v);
        }},
        {"reconnect_backoff_factor", [](ClientConfig& c, const std::string& v) {
            c.socket.reconnect_backoff_factor = parse_factor(v);
        }},
        {"reconnect_max_delay_ms", [](ClientConfig& c, const std::string& v) {
            c.socket.reconnect_max_delay = parse_ms(v);
        }},
        {"max_reconnect_attempts", [](ClientConfig& c, const std::string& v) {
            c.socket.max_reconnect_attempts = static_cast<int>(parse_integer(v, 0));
        }},
        {"retry_base_delay_ms", [](ClientConfig& c, const std::string& v) {
            c.retry.base_delay = parse_ms(v);
        }},
        {"retry_max_delay_ms", [](ClientConfig& c, const std::string& v) {
            c.retry.max_delay = parse_ms(v);
        }},
        {"retry_backoff_factor", [](ClientConfig& c, const std::string& v) {
            c.retry.backoff_factor = parse_factor(v);
        }},
        {"retry_max_attempts", [](ClientConfig& c, const std::string& v) {
            c.retry.max_attempts = static_cast<int>(parse_integer(v, 1));
        }},
        {"request_timeout_ms", [](ClientConfig& c, const std::string& v) {
            c.retry.attempt_timeout = std::chrono::milliseconds(parse_integer(v, 1));
        }},
        {"cache_freshness_hours", [](ClientConfig& c, const std::string& v) {
            c.cache_freshness = std::chrono::hours(parse_integer(v, 1));
        }},
        {"sync_interval_ms", [](ClientConfig& c, const std::string& v) {
            c.sync_interval = std::chrono::milliseconds(parse_integer(v, 1));
        }},
        {"network_poll_interval_ms", [](ClientConfig& c, const std::string& v) {
            c.network_poll_interval = std::chrono::milliseconds(parse_integer(v, 1));
        }},
    };
    return table;
}

std::string env_name(const char* key) {
    std::string name = "FIELDSYNC_";
    for (const char* p = key; *p; ++p) {
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
    }
    return name;
}

// Applies to a copy so a bad value never leaves a half-written field.
void apply_field(ClientConfig& config, const Field& field, const std::string& value,
                 const std::string& source) {
    ClientConfig candidate = config;
    try {
        field.apply(candidate, value);
        config = candidate;
    } catch (const std::exception& e) {
        std::cerr << "[Config] Ignoring " << source << "=\"" << value << "\": " << e.what() << std::endl;
    }
}

} // namespace

ClientConfig load_config_from_env(const ClientConfig& base) {
    ClientConfig config = base;
    for (const auto& field : fields()) {
        std::string name = env_name(field.key);
        const char* value = std::getenv(name.c_str());
        if (!value) continue;
        apply_field(config, field, value, name);
    }
    return config;
}

bool load_config_file(const std::string& path, ClientConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[Config] No settings file at " << path << std::endl;
        return false;
    }

    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::cerr << "[Config] Settings file " << path << " is not a JSON object" << std::endl;
        return false;
    }

    for (const auto& field : fields()) {
        auto it = doc.find(field.key);
        if (it == doc.end()) continue;

        std::string value;
        if (it->is_string()) {
            value = it->get<std::string>();
        } else if (it->is_number()) {
            value = it->dump();
        } else {
            std::cerr << "[Config] Ignoring " << field.key << ": unsupported type" << std::endl;
            continue;
        }
        apply_field(config, field, value, field.key);
    }

    std::cout << "[Config] Loaded settings from " << path << std::endl;
    return true;
}

} // namespace fieldsync
