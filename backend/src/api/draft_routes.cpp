/**
 * Draft screen endpoints.
 *
 * Every handler runs on the io_context thread, so it can touch the Node
 * directly. Flow errors are mapped to HTTP statuses here; anything else
 * falls through to LocalAPI's 500.
 */

#include "api/draft_routes.h"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "draft/draft_state.h"
#include "network/signaling.h"
#include "node/node.h"
#include "protocol/state_codec.h"
#include "registry/room_registry_client.h"

using json = nlohmann::json;

namespace {

json session_json(const Node& node) {
    const Session& session = node.session();
    json j = {
        {"status", to_string(session.status)},
        {"room_id", session.room_id},
        {"role", to_string(session.role)},
    };
    if (!session.last_error.empty()) j["last_error"] = session.last_error;
    return j;
}

json state_json(const Node& node) {
    const draft::DraftState& state = node.controller().state();
    return {
        {"state", state},
        {"description", draft::describe(state)},
    };
}

json parse_body(const HttpRequest& request) {
    json body = json::parse(request.body);
    if (!body.is_object()) throw std::invalid_argument("request body must be a JSON object");
    return body;
}

void require_session(const Node& node) {
    if (!node.is_active()) throw SessionError("no active session");
}

LocalAPI::Handler guarded(LocalAPI::Handler handler) {
    return [handler](const HttpRequest& request) -> HttpResponse {
        try {
            return handler(request);
        } catch (const RoomNotFound& ex) {
            return error_response(404, ex.what());
        } catch (const SessionError& ex) {
            return error_response(409, ex.what());
        } catch (const RegistryError& ex) {
            spdlog::error("Registry request failed (HTTP {}): {}", ex.status(), ex.what());
            return error_response(502, ex.what());
        } catch (const NegotiationError& ex) {
            spdlog::error("Negotiation failed: {}", ex.what());
            return error_response(500, ex.what());
        } catch (const json::exception& ex) {
            return error_response(400, ex.what());
        } catch (const std::invalid_argument& ex) {
            return error_response(400, ex.what());
        }
    };
}

} // namespace

void register_draft_routes(LocalAPI& api, Node& node) {
    api.route("GET", "/status", guarded([&node](const HttpRequest&) {
        return json_response(200, session_json(node));
    }));

    api.route("GET", "/state", guarded([&node](const HttpRequest&) {
        require_session(node);
        return json_response(200, state_json(node));
    }));

    api.route("POST", "/select", guarded([&node](const HttpRequest& request) {
        require_session(node);
        const std::string item = parse_body(request).at("item").get<std::string>();
        const bool accepted = node.controller().select(item);
        json reply = state_json(node);
        reply["accepted"] = accepted;
        return json_response(200, reply);
    }));

    api.route("POST", "/reset", guarded([&node](const HttpRequest&) {
        require_session(node);
        node.controller().reset();
        return json_response(200, state_json(node));
    }));

    api.route("POST", "/first-attack/toggle", guarded([&node](const HttpRequest&) {
        require_session(node);
        const bool accepted = node.controller().toggle_first_attack();
        json reply = state_json(node);
        reply["accepted"] = accepted;
        return json_response(200, reply);
    }));

    api.route("POST", "/sync", guarded([&node](const HttpRequest&) {
        require_session(node);
        return json_response(200, json{{"sent", node.controller().push_state()}});
    }));

    api.route("POST", "/room/host", guarded([&node](const HttpRequest&) {
        const std::string room_id = node.host_room();
        json reply = session_json(node);
        reply["room_id"] = room_id;
        return json_response(200, reply);
    }));

    api.route("POST", "/room/join", guarded([&node](const HttpRequest& request) {
        node.join_room(parse_body(request).at("room_id").get<std::string>());
        return json_response(200, session_json(node));
    }));

    api.route("POST", "/room/solo", guarded([&node](const HttpRequest&) {
        node.start_solo();
        return json_response(200, session_json(node));
    }));

    api.route("POST", "/room/leave", guarded([&node](const HttpRequest&) {
        node.leave();
        return json_response(200, session_json(node));
    }));
}
