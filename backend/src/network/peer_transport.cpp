#include "network/peer_transport.h"

#include <spdlog/spdlog.h>

bool PeerTransport::send(const protocol::Message& message) {
    if (state_ != State::Open) return false;
    spdlog::debug("Sending {} to peer", protocol::kind_name(message.payload));
    return send_text(protocol::encode(message));
}

void PeerTransport::set_on_message(MessageHandler handler) {
    on_message_ = std::move(handler);
}

void PeerTransport::set_on_state_change(StateHandler handler) {
    on_state_change_ = std::move(handler);
}

void PeerTransport::deliver(const std::string& text) {
    protocol::Message message;
    try {
        message = protocol::decode(text);
    } catch (const protocol::ProtocolError& ex) {
        spdlog::warn("Dropping malformed peer message: {}", ex.what());
        return;
    }
    if (!on_message_) {
        spdlog::debug("No message handler, dropping {}", protocol::kind_name(message.payload));
        return;
    }
    on_message_(message);
}

void PeerTransport::set_state(State next) {
    if (state_ == next) return;
    if (state_ == State::Closed || state_ == State::Failed) return;

    spdlog::info("Peer connection {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    if (on_state_change_) {
        auto handler = on_state_change_;
        handler(next);
    }
}

void PeerTransport::clear_handlers() {
    on_message_ = nullptr;
    on_state_change_ = nullptr;
}

const char* to_string(PeerTransport::State state) {
    switch (state) {
    case PeerTransport::State::New:        return "new";
    case PeerTransport::State::Connecting: return "connecting";
    case PeerTransport::State::Open:       return "open";
    case PeerTransport::State::Closed:     return "closed";
    case PeerTransport::State::Failed:     return "failed";
    }
    return "failed";
}

const char* to_string(PeerTransport::Role role) {
    return role == PeerTransport::Role::Initiator ? "initiator" : "responder";
}
