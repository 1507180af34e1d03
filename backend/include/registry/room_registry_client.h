#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "config/config.h"

/// Network failure, unexpected HTTP status or unreadable body from the
/// room registry. `status()` is 0 when no HTTP response was received.
class RegistryError : public std::runtime_error {
public:
    RegistryError(const std::string& what, long status)
        : std::runtime_error(what), status_(status) {}

    [[nodiscard]] long status() const { return status_; }

private:
    long status_;
};

/// Mailbox entry for one room as stored by the registry.
struct RoomRecord {
    std::string  room_id;
    std::string  host_offer;
    std::string  guest_answer;
    std::int64_t created_at = 0;
    std::int64_t ttl = 0;
    std::string  tool_type;
};

void from_json(const nlohmann::json& j, RoomRecord& record);

struct RoomCheck {
    bool                      exists = false;
    std::optional<RoomRecord> room;
};

struct CreatedRoom {
    std::string room_id;
    std::string message;
};

/// 8 characters, uppercase letters and digits only.
bool is_valid_room_id(const std::string& room_id);

/**
 * Lightweight REST client for the room registry (signaling mailbox).
 *
 * All HTTP calls use libcurl under the hood and block for at most
 * `timeout_ms`. Nothing is retried; failures surface as RegistryError.
 */
class RoomRegistryClient {
public:
    explicit RoomRegistryClient(RegistryConfig config);
    virtual ~RoomRegistryClient() = default;

    /// POST /rooms. The offer may be left empty and published later.
    CreatedRoom create_room(const std::string& room_id, const std::string& host_offer = "");

    /// GET /rooms/{id}/check. A missing room is `exists == false`, not an error.
    RoomCheck check_room(const std::string& room_id);

    /// GET /rooms/{id}
    RoomRecord get_room_data(const std::string& room_id);

    /// PUT /rooms/{id}/offer; returns the registry's message.
    std::string update_room_offer(const std::string& room_id, const std::string& host_offer);

    /// PUT /rooms/{id}/answer; returns the registry's message.
    std::string update_room_answer(const std::string& room_id, const std::string& guest_answer);

protected:
    struct HttpResponse {
        long        status = 0;
        std::string body;
    };

    /// One HTTP exchange. Throws RegistryError when no response arrives.
    virtual HttpResponse perform(const std::string& method,
                                 const std::string& url,
                                 const std::string& body);

private:
    HttpResponse http_get(const std::string& endpoint);
    HttpResponse http_post(const std::string& endpoint, const nlohmann::json& body);
    HttpResponse http_put(const std::string& endpoint, const nlohmann::json& body);

    std::string room_endpoint(const std::string& room_id, const std::string& suffix) const;

    RegistryConfig config_;
};
