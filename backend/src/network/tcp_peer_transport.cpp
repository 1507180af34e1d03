/**
 * TcpPeerTransport: offer/answer negotiation and the framed channel.
 *
 * The initiator listens from the moment its offer exists, so a responder
 * that connects before the host has read the answer simply waits in the
 * listen backlog. Accepting only starts once the answer is known, which
 * is what lets the host check the hello token against it.
 */

#include "network/tcp_peer_transport.h"

#include <algorithm>
#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "crypto/crypto_manager.h"
#include "network/peer_channel.h"
#include "network/peer_client.h"
#include "network/peer_server.h"

TcpPeerTransport::TcpPeerTransport(asio::io_context& io, Role role, TransportConfig config)
    : PeerTransport(role), io_(io), config_(std::move(config)) {}

TcpPeerTransport::~TcpPeerTransport() {
    clear_handlers();
    teardown();
}

uint16_t TcpPeerTransport::listen_port() const {
    return server_ ? server_->port() : 0;
}

std::string TcpPeerTransport::create_offer() {
    if (role() != Role::Initiator) throw NegotiationError("only the initiator creates an offer");
    if (offer_created_) throw NegotiationError("offer already created");

    try {
        server_ = std::make_shared<PeerServer>(io_, config_.listen_port);
    } catch (const asio::system_error& ex) {
        throw NegotiationError(std::string("cannot listen for the peer: ") + ex.what());
    }
    server_->set_on_accept([this](asio::ip::tcp::socket socket) {
        on_accepted(std::move(socket));
    });

    signaling::Offer offer;
    offer.session = CryptoManager::random_token();
    offer.candidates = gather_candidates(server_->port());
    session_ = offer.session;
    offer_created_ = true;

    spdlog::info("Created offer with {} candidate(s), listening on port {}",
                 offer.candidates.size(), server_->port());
    return signaling::encode_offer(offer);
}

void TcpPeerTransport::set_remote_answer(const std::string& blob) {
    if (role() != Role::Initiator) throw NegotiationError("only the initiator takes an answer");
    if (!offer_created_) throw NegotiationError("answer received before an offer was created");
    if (state() != State::New) {
        throw NegotiationError(std::string("answer not expected while ") + to_string(state()));
    }

    const signaling::Answer answer = signaling::decode_answer(blob);
    if (!CryptoManager::tokens_equal(answer.session, session_)) {
        throw NegotiationError("answer belongs to a different offer");
    }

    expected_token_ = answer.token;
    set_state(State::Connecting);
    server_->start();
}

std::string TcpPeerTransport::create_answer(const std::string& blob) {
    if (role() != Role::Responder) throw NegotiationError("only the responder creates an answer");
    if (state() != State::New || client_) throw NegotiationError("answer already created");

    const signaling::Offer offer = signaling::decode_offer(blob);

    std::vector<asio::ip::tcp::endpoint> endpoints;
    for (const auto& candidate : offer.candidates) {
        endpoints.emplace_back(asio::ip::make_address(candidate.address), candidate.port);
    }

    signaling::Answer answer;
    answer.session = offer.session;
    answer.token = CryptoManager::random_token();
    session_ = answer.session;
    expected_token_ = answer.token;

    set_state(State::Connecting);
    client_ = std::make_shared<PeerClient>(io_);
    client_->connect(endpoints, [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        on_connected(ec, std::move(socket));
    });

    spdlog::info("Created answer, connecting to {} candidate(s)", endpoints.size());
    return signaling::encode_answer(answer);
}

void TcpPeerTransport::disconnect() {
    teardown();
    set_state(State::Closed);
}

bool TcpPeerTransport::send_text(const std::string& text) {
    if (!channel_) return false;
    return channel_->write(text);
}

std::vector<signaling::Candidate> TcpPeerTransport::gather_candidates(uint16_t port) const {
    std::vector<signaling::Candidate> candidates;

    if (!config_.advertise_addresses.empty()) {
        for (const auto& address : config_.advertise_addresses) {
            asio::error_code ec;
            asio::ip::make_address(address, ec);
            if (ec) throw NegotiationError("invalid advertise address: " + address);
            candidates.push_back({address, port});
        }
        return candidates;
    }

    asio::error_code ec;
    const std::string host = asio::ip::host_name(ec);
    if (!ec) {
        asio::ip::tcp::resolver resolver(io_);
        const auto results = resolver.resolve(host, "", ec);
        if (!ec) {
            for (const auto& entry : results) {
                const auto address = entry.endpoint().address();
                if (!address.is_v4() || address.is_loopback()) continue;
                const std::string text = address.to_string();
                const bool seen = std::any_of(candidates.begin(), candidates.end(),
                    [&text](const signaling::Candidate& c) { return c.address == text; });
                if (!seen) candidates.push_back({text, port});
            }
        }
    }
    if (ec) spdlog::warn("Could not resolve local host addresses: {}", ec.message());

    candidates.push_back({"127.0.0.1", port});
    return candidates;
}

void TcpPeerTransport::on_accepted(asio::ip::tcp::socket socket) {
    auto channel = std::make_shared<PeerChannel>(std::move(socket), config_.max_frame_bytes);
    spdlog::info("Incoming peer connection from {}", channel->remote_endpoint());
    open_pending(channel);
}

void TcpPeerTransport::on_connected(const asio::error_code& ec, asio::ip::tcp::socket socket) {
    client_.reset();
    if (ec) {
        spdlog::error("Could not reach any candidate in the offer: {}", ec.message());
        set_state(State::Failed);
        return;
    }

    auto channel = std::make_shared<PeerChannel>(std::move(socket), config_.max_frame_bytes);
    open_pending(channel);

    signaling::Answer hello;
    hello.session = session_;
    hello.token = expected_token_;
    channel->write(signaling::encode_hello(hello));
}

void TcpPeerTransport::open_pending(const std::shared_ptr<PeerChannel>& channel) {
    pending_.push_back(channel);

    std::weak_ptr<PeerChannel> weak = channel;
    channel->start(
        [this, weak](const std::string& body) {
            auto c = weak.lock();
            if (!c) return;
            if (c == channel_) {
                deliver(body);
            } else if (role() == Role::Initiator) {
                on_handshake_frame(c, body);
            } else {
                on_ack_frame(c, body);
            }
        },
        [this, weak](const asio::error_code& ec) {
            auto c = weak.lock();
            if (!c) return;
            if (c == channel_) {
                on_channel_closed(ec);
                return;
            }
            drop_pending(c);
            if (role() == Role::Responder) {
                spdlog::error("Initiator closed the connection during the handshake: {}", ec.message());
                set_state(State::Failed);
            } else if (ec == asio::error::timed_out) {
                spdlog::warn("Dropped a peer connection that sent no handshake");
            }
        });
    // The responder waits in the listen backlog until the host reads the
    // answer, so only the accepting side bounds the handshake.
    if (role() == Role::Initiator) {
        channel->expect_frame_within(std::chrono::milliseconds(config_.handshake_timeout_ms));
    }
}

void TcpPeerTransport::drop_pending(const std::shared_ptr<PeerChannel>& channel) {
    pending_.erase(std::remove(pending_.begin(), pending_.end(), channel), pending_.end());
}

void TcpPeerTransport::on_handshake_frame(const std::shared_ptr<PeerChannel>& channel,
                                          const std::string& body) {
    drop_pending(channel);

    const auto hello = signaling::decode_hello(body);
    const bool matches = hello &&
                         CryptoManager::tokens_equal(hello->session, session_) &&
                         CryptoManager::tokens_equal(hello->token, expected_token_);
    if (!matches || channel_ || state() != State::Connecting) {
        spdlog::warn("Rejected peer connection from {}: handshake does not match the answer",
                     channel->remote_endpoint());
        channel->close();
        return;
    }

    channel->write(signaling::encode_ack(session_));
    open_channel(channel);
}

void TcpPeerTransport::on_ack_frame(const std::shared_ptr<PeerChannel>& channel,
                                    const std::string& body) {
    drop_pending(channel);

    if (!signaling::is_ack_for(body, session_)) {
        spdlog::error("Unexpected handshake reply from {}", channel->remote_endpoint());
        channel->close();
        set_state(State::Failed);
        return;
    }
    open_channel(channel);
}

void TcpPeerTransport::open_channel(std::shared_ptr<PeerChannel> channel) {
    spdlog::info("Peer channel open with {}", channel->remote_endpoint());
    channel_ = std::move(channel);

    if (server_) server_->stop();
    for (auto& other : pending_) other->close();
    pending_.clear();

    set_state(State::Open);
}

void TcpPeerTransport::on_channel_closed(const asio::error_code& ec) {
    channel_.reset();
    if (ec == asio::error::eof) {
        spdlog::info("Peer closed the channel");
        set_state(State::Closed);
    } else {
        spdlog::warn("Peer channel lost: {}", ec.message());
        set_state(State::Failed);
    }
}

void TcpPeerTransport::teardown() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    for (auto& channel : pending_) channel->close();
    pending_.clear();

    if (server_) {
        server_->stop();
        server_.reset();
    }
    if (client_) {
        client_->cancel();
        client_.reset();
    }
}
