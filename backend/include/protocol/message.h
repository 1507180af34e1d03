#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

#include "draft/draft_state.h"

namespace protocol {

/// Raised by decode() for anything that is not a well-formed wire message.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Ban or pick of one item, sent right after it was applied locally.
struct PokemonSelect {
    std::string item;
};

struct DraftReset {};

/// Only meaningful while the draft is still at step 0.
struct FirstAttackToggle {
    draft::Team first_attack_side = draft::Team::First;
};

/// Whole-state resync; replaces the receiver's copy.
struct GameStateUpdate {
    draft::DraftState state;
};

using Payload = std::variant<GameStateUpdate, PokemonSelect, DraftReset, FirstAttackToggle>;

struct Message {
    Payload      payload;
    std::int64_t timestamp = 0;  // ms since epoch
};

/// Wire tag of the payload, e.g. "POKEMON_SELECT".
const char* kind_name(const Payload& payload);

/// Stamps `payload` with the current wall-clock time.
Message make_message(Payload payload);

std::int64_t now_ms();

/// `{"type", "data", "timestamp"}` as compact UTF-8 JSON.
std::string encode(const Message& message);

/// Throws ProtocolError on malformed JSON, unknown type, bad payload, or a
/// snapshot that violates the draft invariants.
Message decode(const std::string& text);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace protocol
