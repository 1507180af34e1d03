#pragma once

#include <nlohmann/json.hpp>

#include "draft/draft_state.h"

namespace draft {

/// Snapshot form used by GAME_STATE_UPDATE. Sets are written sorted.
void to_json(nlohmann::json& j, const DraftState& state);

/// Throws nlohmann::json::exception (or std::invalid_argument for bad
/// enum labels). Does not check invariants; see is_consistent().
void from_json(const nlohmann::json& j, DraftState& state);

void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);

} // namespace draft
