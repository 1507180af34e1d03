#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.h"
#include "draft/draft_controller.h"
#include "network/peer_transport.h"

class RoomRegistryClient;

/// A room/session request the node cannot honour in its current state.
class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RoomNotFound : public SessionError {
public:
    using SessionError::SessionError;
};

enum class SessionStatus {
    Idle,
    Solo,
    WaitingForPeer,   // polling the registry for the other side's blob
    Connecting,
    Connected,
    Disconnected,
    Failed,
};

const char* to_string(SessionStatus status);

/// The one session this process takes part in.
struct Session {
    std::string         room_id;
    PeerTransport::Role role = PeerTransport::Role::Initiator;
    SessionStatus       status = SessionStatus::Idle;
    std::string         last_error;
};

/**
 * Represents the local draft peer.
 *
 * Owns the session, the peer transport and the draft controller, and
 * drives signaling through the room registry: the host publishes its offer
 * and polls for the guest's answer; the guest polls for the offer and
 * publishes its answer. The draft is usable as soon as a room is hosted,
 * before any guest arrives.
 */
class Node {
public:
    using TransportFactory = std::function<std::unique_ptr<PeerTransport>(PeerTransport::Role)>;

    Node(asio::io_context& io, AppConfig config, std::shared_ptr<RoomRegistryClient> registry);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Creates and registers a new room; returns its id.
    std::string host_room();

    /// Joins an existing room. Input is upper-cased before validation.
    void join_room(const std::string& room_id);

    /// Draft without any peer.
    void start_solo();

    /// Disconnects and returns to idle; the draft is discarded.
    void leave();

    /// Replaces how transports are built (tests use an in-memory pair).
    void set_transport_factory(TransportFactory factory);

    [[nodiscard]] const Session& session() const { return session_; }
    [[nodiscard]] bool is_active() const { return session_.status != SessionStatus::Idle; }

    DraftController& controller() { return controller_; }
    const DraftController& controller() const { return controller_; }

private:
    void begin(const std::string& room_id, PeerTransport::Role role,
               std::unique_ptr<PeerTransport> transport);
    void require_idle() const;

    void answer_offer(const std::string& offer);
    void poll_for_answer();
    void poll_for_offer();
    void schedule_poll(void (Node::*step)());
    void arm_deadline();

    void on_transport_state(PeerTransport::State state);
    void fail(const std::string& reason);

    asio::io_context& io_;
    AppConfig config_;
    std::shared_ptr<RoomRegistryClient> registry_;
    TransportFactory make_transport_;

    std::unique_ptr<PeerTransport> transport_;
    DraftController controller_;
    Session session_;

    asio::steady_timer poll_timer_;
    asio::steady_timer deadline_timer_;
    unsigned generation_ = 0;
};
