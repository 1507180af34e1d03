/**
 * Draft state machine: the fixed 14-step ban/pick order and the pure
 * transitions over DraftState.
 *
 * After the two ban rounds the picks snake: first, second, second, first,
 * first, second, second, first, first, second.
 */

#include "draft/draft_state.h"

namespace draft {

const std::array<Step, kStepCount> kDraftOrder = {{
    {Phase::Ban1, Team::First},
    {Phase::Ban1, Team::Second},
    {Phase::Ban2, Team::First},
    {Phase::Ban2, Team::Second},
    {Phase::Pick, Team::First},
    {Phase::Pick, Team::Second},
    {Phase::Pick, Team::Second},
    {Phase::Pick, Team::First},
    {Phase::Pick, Team::First},
    {Phase::Pick, Team::Second},
    {Phase::Pick, Team::Second},
    {Phase::Pick, Team::First},
    {Phase::Pick, Team::First},
    {Phase::Pick, Team::Second},
}};

bool HistoryEntry::operator==(const HistoryEntry& other) const {
    return step == other.step && team == other.team &&
           action == other.action && item == other.item;
}

bool DraftState::operator==(const DraftState& other) const {
    return phase == other.phase && turn == other.turn &&
           step_counter == other.step_counter &&
           first_attack_side == other.first_attack_side &&
           banned == other.banned && picked == other.picked &&
           team_bans == other.team_bans && team_picks == other.team_picks &&
           history == other.history;
}

DraftState initial_state(Team first_attack) {
    DraftState state;
    state.first_attack_side = first_attack;
    state.turn = first_attack;
    return state;
}

Team opponent(Team team) {
    return team == Team::First ? Team::Second : Team::First;
}

Team team_at(std::size_t step, Team first_attack) {
    const Team role = kDraftOrder.at(step).role;
    return role == Team::First ? first_attack : opponent(first_attack);
}

bool is_used(const DraftState& state, const std::string& item) {
    return state.banned.count(item) != 0 || state.picked.count(item) != 0;
}

bool apply(DraftState& state, const std::string& item) {
    if (state.phase == Phase::Completed) return false;
    if (item.empty() || is_used(state, item)) return false;
    if (state.step_counter < 0 || state.step_counter >= static_cast<int>(kStepCount)) return false;

    const auto step = static_cast<std::size_t>(state.step_counter);
    const Phase phase = kDraftOrder[step].phase;
    const Team team = team_at(step, state.first_attack_side);

    Action action;
    if (phase == Phase::Ban1 || phase == Phase::Ban2) {
        action = Action::Ban;
        state.team_bans[index_of(team)].push_back(item);
        state.banned.insert(item);
    } else {
        action = Action::Pick;
        state.team_picks[index_of(team)].push_back(item);
        state.picked.insert(item);
    }

    state.history.push_back({state.step_counter, team, action, item});

    ++state.step_counter;
    if (state.step_counter == static_cast<int>(kStepCount)) {
        state.phase = Phase::Completed;
    } else {
        const auto next = static_cast<std::size_t>(state.step_counter);
        state.phase = kDraftOrder[next].phase;
        state.turn = team_at(next, state.first_attack_side);
    }
    return true;
}

void reset(DraftState& state) {
    state = initial_state(state.first_attack_side);
}

bool toggle_first_attack(DraftState& state) {
    return set_first_attack(state, opponent(state.first_attack_side));
}

bool set_first_attack(DraftState& state, Team side) {
    if (state.step_counter != 0) return false;
    state.first_attack_side = side;
    state.turn = side;
    return true;
}

bool is_turn(const DraftState& state, Team team) {
    return state.phase != Phase::Completed && state.turn == team;
}

bool is_consistent(const DraftState& state) {
    if (state.step_counter < 0 || state.step_counter > static_cast<int>(kStepCount)) return false;
    if (state.history.size() != static_cast<std::size_t>(state.step_counter)) return false;

    // Replaying the log from a fresh state must reproduce every field.
    DraftState replay = initial_state(state.first_attack_side);
    for (const auto& entry : state.history) {
        if (!apply(replay, entry.item)) return false;
    }
    return replay == state;
}

std::string describe(const DraftState& state) {
    if (state.phase == Phase::Completed) return "Draft completed";

    std::string phase_text;
    switch (state.phase) {
    case Phase::Ban1: phase_text = "BAN1 phase"; break;
    case Phase::Ban2: phase_text = "BAN2 phase"; break;
    default:          phase_text = "PICK phase"; break;
    }
    const char* action_text = state.phase == Phase::Pick ? "PICK" : "BAN";

    return phase_text + " - " + to_string(state.turn) + " team " + action_text +
           " (" + std::to_string(state.step_counter + 1) + "/" +
           std::to_string(kStepCount) + ")";
}

const char* to_string(Team team) {
    return team == Team::First ? "first" : "second";
}

const char* to_string(Phase phase) {
    switch (phase) {
    case Phase::Ban1:      return "ban1";
    case Phase::Ban2:      return "ban2";
    case Phase::Pick:      return "pick";
    case Phase::Completed: return "completed";
    }
    return "completed";
}

const char* to_string(Action action) {
    return action == Action::Ban ? "BAN" : "PICK";
}

bool parse_team(const std::string& text, Team& out) {
    if (text == "first")  { out = Team::First;  return true; }
    if (text == "second") { out = Team::Second; return true; }
    return false;
}

bool parse_phase(const std::string& text, Phase& out) {
    if (text == "ban1")      { out = Phase::Ban1;      return true; }
    if (text == "ban2")      { out = Phase::Ban2;      return true; }
    if (text == "pick")      { out = Phase::Pick;      return true; }
    if (text == "completed") { out = Phase::Completed; return true; }
    return false;
}

bool parse_action(const std::string& text, Action& out) {
    if (text == "BAN")  { out = Action::Ban;  return true; }
    if (text == "PICK") { out = Action::Pick; return true; }
    return false;
}

} // namespace draft
