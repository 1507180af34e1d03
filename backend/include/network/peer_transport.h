#pragma once

#include <functional>
#include <string>

#include "protocol/message.h"

/**
 * Direct, ordered, reliable message channel between the two peers.
 *
 * Setup is asymmetric: the initiator publishes an offer and waits for the
 * responder's answer; the responder consumes the offer and waits for the
 * channel to come up. Once `Open`, send() hands messages to the channel
 * without waiting for delivery.
 *
 * Concrete transports implement the negotiation and the raw text send; the
 * base class owns state transitions and message dispatch.
 */
class PeerTransport {
public:
    enum class Role { Initiator, Responder };
    enum class State { New, Connecting, Open, Closed, Failed };

    using MessageHandler = std::function<void(const protocol::Message&)>;
    using StateHandler   = std::function<void(State)>;

    explicit PeerTransport(Role role) : role_(role) {}
    virtual ~PeerTransport() = default;

    PeerTransport(const PeerTransport&) = delete;
    PeerTransport& operator=(const PeerTransport&) = delete;

    /// Initiator: returns the offer blob to publish.
    virtual std::string create_offer() = 0;

    /// Responder: consumes the offer, returns the answer blob to publish.
    virtual std::string create_answer(const std::string& offer) = 0;

    /// Initiator: accepts the responder's answer.
    virtual void set_remote_answer(const std::string& answer) = 0;

    /// Closes the channel and the connection. Safe to call repeatedly.
    virtual void disconnect() = 0;

    /// False unless the channel is open right now.
    bool send(const protocol::Message& message);

    /// Replaces the active handler; only one is ever registered.
    void set_on_message(MessageHandler handler);
    void set_on_state_change(StateHandler handler);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] Role role() const { return role_; }

protected:
    virtual bool send_text(const std::string& text) = 0;

    /// Parses `text` and hands it to the message handler; malformed input
    /// is logged and dropped.
    void deliver(const std::string& text);

    /// Closed and Failed are final.
    void set_state(State next);

    void clear_handlers();

private:
    Role role_;
    State state_ = State::New;
    MessageHandler on_message_;
    StateHandler on_state_change_;
};

const char* to_string(PeerTransport::State state);
const char* to_string(PeerTransport::Role role);
