#pragma once

#include <array>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace draft {

enum class Team { First = 0, Second = 1 };

enum class Phase { Ban1, Ban2, Pick, Completed };

enum class Action { Ban, Pick };

/// One entry of the fixed ban/pick order. `role` is relative to the
/// configured first-attack side, not an absolute team label.
struct Step {
    Phase phase;
    Team  role;
};

constexpr std::size_t kStepCount = 14;
constexpr std::size_t kMaxBans   = 2;
constexpr std::size_t kMaxPicks  = 5;

extern const std::array<Step, kStepCount> kDraftOrder;

struct HistoryEntry {
    int         step;
    Team        team;
    Action      action;
    std::string item;

    bool operator==(const HistoryEntry& other) const;
    bool operator!=(const HistoryEntry& other) const { return !(*this == other); }
};

/**
 * Replicated draft state. Each peer holds its own copy; the controller is
 * the only mutator. `phase` and `turn` always follow from `step_counter`
 * and `first_attack_side`.
 */
struct DraftState {
    Phase       phase = Phase::Ban1;
    Team        turn = Team::First;
    int         step_counter = 0;
    Team        first_attack_side = Team::First;

    std::set<std::string> banned;
    std::set<std::string> picked;

    std::array<std::vector<std::string>, 2> team_bans;
    std::array<std::vector<std::string>, 2> team_picks;

    std::vector<HistoryEntry> history;

    bool operator==(const DraftState& other) const;
    bool operator!=(const DraftState& other) const { return !(*this == other); }
};

/// Fresh state at step 0 with `first_attack` acting first.
DraftState initial_state(Team first_attack = Team::First);

Team opponent(Team team);

/// Absolute team acting at `step` given the first-attack side.
Team team_at(std::size_t step, Team first_attack);

/// Ban or pick `item` for whoever's step it is. Returns false and leaves
/// `state` untouched when the draft is completed or the item is empty or
/// already used.
bool apply(DraftState& state, const std::string& item);

/// Back to step 0; keeps the first-attack side.
void reset(DraftState& state);

/// Flips the first-attack side. Only allowed before the first action.
bool toggle_first_attack(DraftState& state);

/// Receive-side form of the toggle: adopts `side` under the same guard.
bool set_first_attack(DraftState& state, Team side);

/// True when `team` is expected to act next.
bool is_turn(const DraftState& state, Team team);

bool is_used(const DraftState& state, const std::string& item);

/// Checks every invariant, including that phase and turn match the step.
bool is_consistent(const DraftState& state);

/// Human readable status line, e.g. "BAN1 phase - first team BAN (1/14)".
std::string describe(const DraftState& state);

const char* to_string(Team team);
const char* to_string(Phase phase);
const char* to_string(Action action);

bool parse_team(const std::string& text, Team& out);
bool parse_phase(const std::string& text, Phase& out);
bool parse_action(const std::string& text, Action& out);

inline std::size_t index_of(Team team) { return static_cast<std::size_t>(team); }

} // namespace draft
