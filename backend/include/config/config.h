#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RegistryConfig {
    std::string base_url;
    std::string rooms_path = "/rooms";
    long        timeout_ms = 10000;
};

struct TransportConfig {
    uint16_t                 listen_port = 0;       // 0 = ephemeral
    std::vector<std::string> advertise_addresses;   // empty = gather locally
    uint32_t                 max_frame_bytes = 1u << 20;
    uint32_t                 handshake_timeout_ms = 5000;   // hello/ack must arrive within this
};

struct SignalingConfig {
    uint32_t poll_interval_ms = 1000;
    uint32_t timeout_ms = 0;          // 0 = wait forever
    bool     sync_on_connect = true;
};

struct ApiConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t    port = 8787;
};

struct LogConfig {
    std::string level = "info";
    std::string pattern;
};

struct AppConfig {
    RegistryConfig  registry;
    TransportConfig transport;
    SignalingConfig signaling;
    ApiConfig       api;
    LogConfig       log;
};

/// Reads and validates a JSON config file. Throws ConfigError.
AppConfig load_config(const std::string& path);

/// Same validation for an already parsed document.
AppConfig parse_config(const nlohmann::json& doc);

/// Applies `log.level` and `log.pattern` to the default spdlog logger.
void apply_log_config(const LogConfig& log);
