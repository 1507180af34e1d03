/**
 * Config: the JSON file given on the command line.
 *
 * Only registry.base_url is mandatory; every other key falls back to the
 * defaults in config.h.
 */

#include "config/config.h"

#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    const auto it = doc.find(name);
    if (it == doc.end()) return empty;
    if (!it->is_object()) throw ConfigError(std::string("\"") + name + "\" must be an object");
    return *it;
}

uint16_t read_port(const json& obj, const char* key, uint16_t fallback) {
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
    const auto value = it->get<long long>();
    if (value < 0 || value > 65535) {
        throw ConfigError(std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

uint32_t read_count(const json& obj, const char* key, uint32_t fallback) {
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
    if (!it->is_number_unsigned() && it->get<long long>() < 0) {
        throw ConfigError(std::string(key) + " must not be negative: " + std::to_string(it->get<long long>()));
    }
    const auto value = it->get<unsigned long long>();
    if (value > UINT32_MAX) throw ConfigError(std::string(key) + " out of range: " + std::to_string(value));
    return static_cast<uint32_t>(value);
}

template <typename T>
T read(const json& obj, const char* key, T fallback) {
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("invalid value for ") + key + ": " + ex.what());
    }
}

} // namespace

AppConfig parse_config(const json& doc) {
    if (!doc.is_object()) throw ConfigError("config root must be an object");

    AppConfig config;

    const json& registry = section(doc, "registry");
    config.registry.base_url = read<std::string>(registry, "base_url", "");
    if (config.registry.base_url.empty()) throw ConfigError("registry.base_url is required");
    while (!config.registry.base_url.empty() && config.registry.base_url.back() == '/') {
        config.registry.base_url.pop_back();
    }
    config.registry.rooms_path = read<std::string>(registry, "rooms_path", config.registry.rooms_path);
    config.registry.timeout_ms = read<long>(registry, "timeout_ms", config.registry.timeout_ms);
    if (config.registry.timeout_ms <= 0) throw ConfigError("registry.timeout_ms must be positive");

    const json& transport = section(doc, "transport");
    config.transport.listen_port = read_port(transport, "listen_port", config.transport.listen_port);
    config.transport.advertise_addresses =
        read<std::vector<std::string>>(transport, "advertise_addresses", {});
    config.transport.max_frame_bytes =
        read_count(transport, "max_frame_bytes", config.transport.max_frame_bytes);
    if (config.transport.max_frame_bytes == 0) throw ConfigError("transport.max_frame_bytes must be positive");
    config.transport.handshake_timeout_ms =
        read_count(transport, "handshake_timeout_ms", config.transport.handshake_timeout_ms);
    if (config.transport.handshake_timeout_ms == 0) {
        throw ConfigError("transport.handshake_timeout_ms must be positive");
    }

    const json& signaling = section(doc, "signaling");
    config.signaling.poll_interval_ms =
        read_count(signaling, "poll_interval_ms", config.signaling.poll_interval_ms);
    if (config.signaling.poll_interval_ms == 0) throw ConfigError("signaling.poll_interval_ms must be positive");
    config.signaling.timeout_ms = read_count(signaling, "timeout_ms", config.signaling.timeout_ms);
    config.signaling.sync_on_connect =
        read<bool>(signaling, "sync_on_connect", config.signaling.sync_on_connect);

    const json& api = section(doc, "api");
    config.api.bind_address = read<std::string>(api, "bind_address", config.api.bind_address);
    config.api.port = read_port(api, "port", config.api.port);

    const json& log = section(doc, "log");
    config.log.level = read<std::string>(log, "level", config.log.level);
    config.log.pattern = read<std::string>(log, "pattern", config.log.pattern);
    if (spdlog::level::from_str(config.log.level) == spdlog::level::off && config.log.level != "off") {
        throw ConfigError("unknown log level: " + config.log.level);
    }

    return config;
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& ex) {
        throw ConfigError("cannot parse " + path + ": " + ex.what());
    }
    return parse_config(doc);
}

void apply_log_config(const LogConfig& log) {
    spdlog::set_level(spdlog::level::from_str(log.level));
    if (!log.pattern.empty()) spdlog::set_pattern(log.pattern);
}
