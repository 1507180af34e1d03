/**
 * State codec: DraftState to and from its JSON wire form.
 */

#include "protocol/state_codec.h"

#include <stdexcept>

using json = nlohmann::json;

namespace draft {

namespace {

Team team_from(const json& j) {
    Team team;
    if (!parse_team(j.get<std::string>(), team)) {
        throw std::invalid_argument("unknown team label: " + j.dump());
    }
    return team;
}

json per_team(const std::array<std::vector<std::string>, 2>& lists) {
    return json{
        {to_string(Team::First),  lists[index_of(Team::First)]},
        {to_string(Team::Second), lists[index_of(Team::Second)]},
    };
}

void read_per_team(const json& j, std::array<std::vector<std::string>, 2>& lists) {
    lists[index_of(Team::First)]  = j.at(to_string(Team::First)).get<std::vector<std::string>>();
    lists[index_of(Team::Second)] = j.at(to_string(Team::Second)).get<std::vector<std::string>>();
}

} // namespace

void to_json(json& j, const HistoryEntry& entry) {
    j = json{
        {"step",   entry.step},
        {"team",   to_string(entry.team)},
        {"action", to_string(entry.action)},
        {"item",   entry.item},
    };
}

void from_json(const json& j, HistoryEntry& entry) {
    entry.step = j.at("step").get<int>();
    entry.team = team_from(j.at("team"));
    if (!parse_action(j.at("action").get<std::string>(), entry.action)) {
        throw std::invalid_argument("unknown action: " + j.at("action").dump());
    }
    entry.item = j.at("item").get<std::string>();
}

void to_json(json& j, const DraftState& state) {
    j = json{
        {"phase",           to_string(state.phase)},
        {"turn",            to_string(state.turn)},
        {"stepCounter",     state.step_counter},
        {"firstAttackSide", to_string(state.first_attack_side)},
        {"bannedSet",       state.banned},
        {"pickedSet",       state.picked},
        {"teamBans",        per_team(state.team_bans)},
        {"teamPicks",       per_team(state.team_picks)},
        {"history",         state.history},
    };
}

void from_json(const json& j, DraftState& state) {
    if (!parse_phase(j.at("phase").get<std::string>(), state.phase)) {
        throw std::invalid_argument("unknown phase: " + j.at("phase").dump());
    }
    state.turn = team_from(j.at("turn"));
    state.step_counter = j.at("stepCounter").get<int>();
    state.first_attack_side = team_from(j.at("firstAttackSide"));
    state.banned = j.at("bannedSet").get<std::set<std::string>>();
    state.picked = j.at("pickedSet").get<std::set<std::string>>();
    read_per_team(j.at("teamBans"), state.team_bans);
    read_per_team(j.at("teamPicks"), state.team_picks);
    state.history = j.at("history").get<std::vector<HistoryEntry>>();
}

} // namespace draft
