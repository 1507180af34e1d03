#pragma once

#include <functional>
#include <string>
#include <utility>

#include "draft/draft_state.h"
#include "protocol/message.h"

class PeerTransport;

/**
 * Sole mutator of the local DraftState.
 *
 * Local actions are applied first and then broadcast; messages received
 * from the peer are applied without being sent back, so the two sides never
 * echo each other. Without a transport (or while it is not open) the
 * controller keeps working alone and both teams are driven from here.
 */
class DraftController {
public:
    using ChangeCallback = std::function<void(const draft::DraftState&)>;

    DraftController() = default;

    /// Registers this controller as the transport's message handler.
    /// Passing nullptr detaches; the transport must outlive the attachment.
    void attach(PeerTransport* transport);

    /// Local ban or pick; returns false when the state machine rejects it.
    bool select(const std::string& item);

    void reset();

    /// Local first-attack toggle; false once the draft has started.
    bool toggle_first_attack();

    /// Sends the whole state to the peer. False when nothing was sent.
    bool push_state();

    /// Applies a message received from the peer.
    void handle_message(const protocol::Message& message);

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

    /// Drops the draft and starts over at step 0 with `first` acting first.
    void restart(draft::Team first = draft::Team::First);

    [[nodiscard]] const draft::DraftState& state() const { return state_; }
    [[nodiscard]] bool is_attached() const { return transport_ != nullptr; }

private:
    bool broadcast(protocol::Payload payload);
    void changed();

    draft::DraftState state_;
    PeerTransport* transport_ = nullptr;
    ChangeCallback on_change_;
};
