#include "draft/draft_controller.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "network/peer_transport.h"

void DraftController::attach(PeerTransport* transport) {
    if (transport_ && transport_ != transport) transport_->set_on_message(nullptr);
    transport_ = transport;
    if (transport_) {
        transport_->set_on_message([this](const protocol::Message& message) {
            handle_message(message);
        });
    }
}

bool DraftController::select(const std::string& item) {
    const int step = state_.step_counter;
    if (!draft::apply(state_, item)) {
        spdlog::debug("Ignoring selection of '{}' at step {}", item, step);
        return false;
    }
    const auto& entry = state_.history.back();
    spdlog::info("Step {}: {} team {} '{}'", step + 1, draft::to_string(entry.team),
                 draft::to_string(entry.action), item);
    changed();
    broadcast(protocol::PokemonSelect{item});
    return true;
}

void DraftController::reset() {
    draft::reset(state_);
    spdlog::info("Draft reset");
    changed();
    broadcast(protocol::DraftReset{});
}

bool DraftController::toggle_first_attack() {
    if (!draft::toggle_first_attack(state_)) return false;
    spdlog::info("First attack is now team {}", draft::to_string(state_.first_attack_side));
    changed();
    broadcast(protocol::FirstAttackToggle{state_.first_attack_side});
    return true;
}

bool DraftController::push_state() {
    return broadcast(protocol::GameStateUpdate{state_});
}

void DraftController::restart(draft::Team first) {
    state_ = draft::initial_state(first);
    changed();
}

void DraftController::handle_message(const protocol::Message& message) {
    spdlog::debug("Received {} from peer", protocol::kind_name(message.payload));

    const bool mutated = std::visit(protocol::overloaded{
        [this](const protocol::PokemonSelect& m) {
            const int step = state_.step_counter;
            if (!draft::apply(state_, m.item)) {
                spdlog::debug("Peer selection of '{}' ignored at step {}", m.item, step);
                return false;
            }
            spdlog::info("Step {}: peer chose '{}'", step + 1, m.item);
            return true;
        },
        [this](const protocol::DraftReset&) {
            draft::reset(state_);
            spdlog::info("Draft reset by peer");
            return true;
        },
        [this](const protocol::FirstAttackToggle& m) {
            if (!draft::set_first_attack(state_, m.first_attack_side)) {
                spdlog::debug("Peer first-attack toggle ignored after the draft started");
                return false;
            }
            return true;
        },
        [this](const protocol::GameStateUpdate& m) {
            state_ = m.state;
            spdlog::info("Draft state replaced by peer snapshot at step {}", state_.step_counter);
            return true;
        },
    }, message.payload);

    if (mutated) changed();
}

bool DraftController::broadcast(protocol::Payload payload) {
    if (!transport_) return false;
    const char* kind = protocol::kind_name(payload);
    if (!transport_->send(protocol::make_message(std::move(payload)))) {
        spdlog::debug("{} not sent: peer channel is not open", kind);
        return false;
    }
    return true;
}

void DraftController::changed() {
    if (on_change_) on_change_(state_);
}
