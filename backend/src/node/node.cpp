/**
 * Node: session orchestration for the local draft peer.
 *
 * Signaling is a pair of mailboxes in the room registry. Neither side is
 * notified of the other's blob, so both poll. A failed registry call ends
 * the poll and marks the session failed; it is not retried.
 */

#include "node/node.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "crypto/crypto_manager.h"
#include "network/signaling.h"
#include "network/tcp_peer_transport.h"
#include "registry/room_registry_client.h"

const char* to_string(SessionStatus status) {
    switch (status) {
    case SessionStatus::Idle:           return "idle";
    case SessionStatus::Solo:           return "solo";
    case SessionStatus::WaitingForPeer: return "waiting_for_peer";
    case SessionStatus::Connecting:     return "connecting";
    case SessionStatus::Connected:      return "connected";
    case SessionStatus::Disconnected:   return "disconnected";
    case SessionStatus::Failed:         return "failed";
    }
    return "failed";
}

Node::Node(asio::io_context& io, AppConfig config, std::shared_ptr<RoomRegistryClient> registry)
    : io_(io),
      config_(std::move(config)),
      registry_(std::move(registry)),
      poll_timer_(io),
      deadline_timer_(io) {
    make_transport_ = [this](PeerTransport::Role role) -> std::unique_ptr<PeerTransport> {
        return std::make_unique<TcpPeerTransport>(io_, role, config_.transport);
    };
}

Node::~Node() {
    leave();
}

void Node::set_transport_factory(TransportFactory factory) {
    make_transport_ = std::move(factory);
}

void Node::require_idle() const {
    if (is_active()) {
        throw SessionError(std::string("a session is already ") + to_string(session_.status));
    }
}

std::string Node::host_room() {
    require_idle();

    const std::string room_id = CryptoManager::random_room_id();
    auto transport = make_transport_(PeerTransport::Role::Initiator);
    const std::string offer = transport->create_offer();
    registry_->create_room(room_id, offer);

    begin(room_id, PeerTransport::Role::Initiator, std::move(transport));
    session_.status = SessionStatus::WaitingForPeer;
    spdlog::info("Hosting room {}; the draft is open while waiting for a guest", room_id);

    schedule_poll(&Node::poll_for_answer);
    return room_id;
}

void Node::join_room(const std::string& input) {
    require_idle();

    std::string room_id = input;
    room_id.erase(std::remove_if(room_id.begin(), room_id.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  room_id.end());
    std::transform(room_id.begin(), room_id.end(), room_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!is_valid_room_id(room_id)) {
        throw SessionError("invalid room id: " + input);
    }

    const RoomCheck check = registry_->check_room(room_id);
    if (!check.exists) throw RoomNotFound("room not found: " + room_id);

    begin(room_id, PeerTransport::Role::Responder, make_transport_(PeerTransport::Role::Responder));
    session_.status = SessionStatus::WaitingForPeer;
    spdlog::info("Joined room {}", room_id);

    if (check.room && !check.room->host_offer.empty()) {
        try {
            answer_offer(check.room->host_offer);
        } catch (...) {
            leave();
            throw;
        }
    } else {
        schedule_poll(&Node::poll_for_offer);
    }
}

void Node::start_solo() {
    require_idle();
    begin("", PeerTransport::Role::Initiator, nullptr);
    session_.status = SessionStatus::Solo;
    spdlog::info("Solo draft started");
}

void Node::leave() {
    ++generation_;
    poll_timer_.cancel();
    deadline_timer_.cancel();

    controller_.attach(nullptr);
    if (transport_) {
        transport_->set_on_state_change(nullptr);
        transport_->disconnect();
        transport_.reset();
    }
    if (is_active()) spdlog::info("Left room {}", session_.room_id);

    controller_.restart();
    session_ = Session{};
}

void Node::begin(const std::string& room_id, PeerTransport::Role role,
                 std::unique_ptr<PeerTransport> transport) {
    ++generation_;
    session_ = Session{};
    session_.room_id = room_id;
    session_.role = role;

    controller_.restart();
    transport_ = std::move(transport);
    if (transport_) {
        controller_.attach(transport_.get());
        transport_->set_on_state_change([this](PeerTransport::State state) {
            on_transport_state(state);
        });
        arm_deadline();
    }
}

void Node::answer_offer(const std::string& offer) {
    const std::string answer = transport_->create_answer(offer);
    registry_->update_room_answer(session_.room_id, answer);
    spdlog::info("Published answer for room {}", session_.room_id);
}

void Node::poll_for_answer() {
    try {
        const RoomRecord room = registry_->get_room_data(session_.room_id);
        if (room.guest_answer.empty()) {
            schedule_poll(&Node::poll_for_answer);
            return;
        }
        spdlog::info("Guest answer received for room {}", session_.room_id);
        transport_->set_remote_answer(room.guest_answer);
    } catch (const RegistryError& ex) {
        fail(std::string("registry error: ") + ex.what());
    } catch (const NegotiationError& ex) {
        fail(std::string("negotiation failed: ") + ex.what());
    }
}

void Node::poll_for_offer() {
    try {
        const RoomRecord room = registry_->get_room_data(session_.room_id);
        if (room.host_offer.empty()) {
            schedule_poll(&Node::poll_for_offer);
            return;
        }
        answer_offer(room.host_offer);
    } catch (const RegistryError& ex) {
        fail(std::string("registry error: ") + ex.what());
    } catch (const NegotiationError& ex) {
        fail(std::string("negotiation failed: ") + ex.what());
    }
}

void Node::schedule_poll(void (Node::*step)()) {
    const unsigned generation = generation_;
    poll_timer_.expires_after(std::chrono::milliseconds(config_.signaling.poll_interval_ms));
    poll_timer_.async_wait([this, step, generation](const asio::error_code& ec) {
        if (ec || generation != generation_ || !transport_) return;
        (this->*step)();
    });
}

void Node::arm_deadline() {
    if (config_.signaling.timeout_ms == 0) return;

    const unsigned generation = generation_;
    deadline_timer_.expires_after(std::chrono::milliseconds(config_.signaling.timeout_ms));
    deadline_timer_.async_wait([this, generation](const asio::error_code& ec) {
        if (ec || generation != generation_ || !transport_) return;
        if (transport_->state() == PeerTransport::State::New ||
            transport_->state() == PeerTransport::State::Connecting) {
            fail("timed out waiting for the peer");
        }
    });
}

void Node::on_transport_state(PeerTransport::State state) {
    switch (state) {
    case PeerTransport::State::New:
        break;
    case PeerTransport::State::Connecting:
        session_.status = SessionStatus::Connecting;
        break;
    case PeerTransport::State::Open:
        session_.status = SessionStatus::Connected;
        deadline_timer_.cancel();
        spdlog::info("Connected to peer in room {}", session_.room_id);
        if (session_.role == PeerTransport::Role::Initiator && config_.signaling.sync_on_connect) {
            controller_.push_state();
        }
        break;
    case PeerTransport::State::Closed:
        session_.status = SessionStatus::Disconnected;
        break;
    case PeerTransport::State::Failed:
        session_.status = SessionStatus::Failed;
        if (session_.last_error.empty()) session_.last_error = "peer connection failed";
        break;
    }
}

void Node::fail(const std::string& reason) {
    spdlog::error("Room {}: {}", session_.room_id, reason);
    poll_timer_.cancel();
    deadline_timer_.cancel();
    if (transport_) transport_->disconnect();
    session_.status = SessionStatus::Failed;
    session_.last_error = reason;
}
