/**
 * Data channel wire format.
 *
 * Every message is `{"type": <tag>, "data": <payload>, "timestamp": <ms>}`.
 * Older clients sent `{"pokemon": {"id": ...}}` for selections and
 * `{"firstAttack": ...}` for toggles; both are still read.
 */

#include "protocol/message.h"
#include "protocol/state_codec.h"

#include <chrono>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {

namespace {

constexpr const char* kGameStateUpdate   = "GAME_STATE_UPDATE";
constexpr const char* kPokemonSelect     = "POKEMON_SELECT";
constexpr const char* kDraftReset        = "DRAFT_RESET";
constexpr const char* kFirstAttackToggle = "FIRST_ATTACK_TOGGLE";

json payload_to_json(const Payload& payload) {
    return std::visit(overloaded{
        [](const GameStateUpdate& m) { return json(m.state); },
        [](const PokemonSelect& m) { return json{{"item", m.item}}; },
        [](const DraftReset&) { return json::object(); },
        [](const FirstAttackToggle& m) {
            return json{{"firstAttackSide", draft::to_string(m.first_attack_side)}};
        },
    }, payload);
}

PokemonSelect select_from_json(const json& data) {
    PokemonSelect m;
    if (data.contains("item")) {
        m.item = data.at("item").get<std::string>();
    } else if (data.contains("pokemon")) {
        m.item = data.at("pokemon").at("id").get<std::string>();
    } else {
        throw ProtocolError("POKEMON_SELECT without item");
    }
    if (m.item.empty()) throw ProtocolError("POKEMON_SELECT with empty item");
    return m;
}

FirstAttackToggle toggle_from_json(const json& data) {
    const char* key = data.contains("firstAttackSide") ? "firstAttackSide" : "firstAttack";
    FirstAttackToggle m;
    if (!draft::parse_team(data.at(key).get<std::string>(), m.first_attack_side)) {
        throw ProtocolError("FIRST_ATTACK_TOGGLE with unknown side");
    }
    return m;
}

GameStateUpdate snapshot_from_json(const json& data) {
    GameStateUpdate m;
    m.state = data.get<draft::DraftState>();
    if (!draft::is_consistent(m.state)) {
        throw ProtocolError("GAME_STATE_UPDATE snapshot is inconsistent");
    }
    return m;
}

} // namespace

const char* kind_name(const Payload& payload) {
    return std::visit(overloaded{
        [](const GameStateUpdate&) { return kGameStateUpdate; },
        [](const PokemonSelect&) { return kPokemonSelect; },
        [](const DraftReset&) { return kDraftReset; },
        [](const FirstAttackToggle&) { return kFirstAttackToggle; },
    }, payload);
}

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Message make_message(Payload payload) {
    return Message{std::move(payload), now_ms()};
}

std::string encode(const Message& message) {
    json j{
        {"type",      kind_name(message.payload)},
        {"data",      payload_to_json(message.payload)},
        {"timestamp", message.timestamp},
    };
    return j.dump();
}

Message decode(const std::string& text) {
    try {
        const json j = json::parse(text);
        if (!j.is_object()) throw ProtocolError("message is not an object");

        const auto type = j.at("type").get<std::string>();
        const json& data = j.at("data");
        if (!data.is_object()) throw ProtocolError("data is not an object");

        Message message;
        message.timestamp = j.at("timestamp").get<std::int64_t>();

        if (type == kPokemonSelect) {
            message.payload = select_from_json(data);
        } else if (type == kDraftReset) {
            message.payload = DraftReset{};
        } else if (type == kFirstAttackToggle) {
            message.payload = toggle_from_json(data);
        } else if (type == kGameStateUpdate) {
            message.payload = snapshot_from_json(data);
        } else {
            throw ProtocolError("unknown message type: " + type);
        }
        return message;
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ProtocolError(std::string("malformed message: ") + ex.what());
    }
}

} // namespace protocol
