#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "fakes.h"
#include "network/signaling.h"
#include "network/tcp_peer_transport.h"
#include "protocol/message.h"

using State = PeerTransport::State;
using Role = PeerTransport::Role;

class TcpPeerTransportTest : public ::testing::Test {
protected:
    TcpPeerTransportTest() {
        config.advertise_addresses = {"127.0.0.1"};
        host = std::make_unique<TcpPeerTransport>(io, Role::Initiator, config);
        guest = std::make_unique<TcpPeerTransport>(io, Role::Responder, config);

        host->set_on_state_change([this](State s) { host_states.push_back(s); });
        guest->set_on_state_change([this](State s) { guest_states.push_back(s); });
        guest->set_on_message([this](const protocol::Message& m) { guest_inbox.push_back(m); });
        host->set_on_message([this](const protocol::Message& m) { host_inbox.push_back(m); });
    }

    void connect() {
        const std::string offer = host->create_offer();
        const std::string answer = guest->create_answer(offer);
        host->set_remote_answer(answer);
        ASSERT_TRUE(run_until(io, [this] {
            return host->state() == State::Open && guest->state() == State::Open;
        }));
    }

    asio::io_context io;
    TransportConfig config;
    std::unique_ptr<TcpPeerTransport> host;
    std::unique_ptr<TcpPeerTransport> guest;
    std::vector<State> host_states;
    std::vector<State> guest_states;
    std::vector<protocol::Message> host_inbox;
    std::vector<protocol::Message> guest_inbox;
};

TEST_F(TcpPeerTransportTest, OfferAdvertisesListeningPort) {
    const auto offer = signaling::decode_offer(host->create_offer());
    ASSERT_EQ(offer.candidates.size(), 1u);
    EXPECT_EQ(offer.candidates[0].address, "127.0.0.1");
    EXPECT_EQ(offer.candidates[0].port, host->listen_port());
    EXPECT_NE(host->listen_port(), 0);
    EXPECT_EQ(offer.session.size(), 32u);
    EXPECT_EQ(host->state(), State::New);
}

TEST_F(TcpPeerTransportTest, HandshakeOpensBothSides) {
    connect();
    EXPECT_EQ(host_states, (std::vector<State>{State::Connecting, State::Open}));
    EXPECT_EQ(guest_states, (std::vector<State>{State::Connecting, State::Open}));
}

TEST_F(TcpPeerTransportTest, MessagesArriveInOrder) {
    connect();
    for (const char* item : {"a", "b", "c", "d", "e"}) {
        ASSERT_TRUE(host->send(protocol::make_message(protocol::PokemonSelect{item})));
    }
    ASSERT_TRUE(guest->send(protocol::make_message(protocol::DraftReset{})));

    ASSERT_TRUE(run_until(io, [this] { return guest_inbox.size() == 5 && host_inbox.size() == 1; }));
    const char* expected[] = {"a", "b", "c", "d", "e"};
    for (std::size_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(std::holds_alternative<protocol::PokemonSelect>(guest_inbox[i].payload));
        EXPECT_EQ(std::get<protocol::PokemonSelect>(guest_inbox[i].payload).item, expected[i]);
    }
    EXPECT_TRUE(std::holds_alternative<protocol::DraftReset>(host_inbox[0].payload));
}

TEST_F(TcpPeerTransportTest, SendBeforeOpenIsRefused) {
    host->create_offer();
    EXPECT_FALSE(host->send(protocol::make_message(protocol::DraftReset{})));
}

TEST_F(TcpPeerTransportTest, WrongTokenIsRejected) {
    const std::string offer = host->create_offer();
    const std::string answer = guest->create_answer(offer);

    auto forged = nlohmann::json::parse(answer);
    forged["token"] = std::string(32, '0');
    host->set_remote_answer(forged.dump());

    ASSERT_TRUE(run_until(io, [this] { return guest->state() == State::Failed; }));
    EXPECT_EQ(host->state(), State::Connecting);
}

TEST_F(TcpPeerTransportTest, AnswerForAnotherOfferIsRefused) {
    host->create_offer();
    const std::string foreign = signaling::encode_answer({std::string(32, 'f'), std::string(32, '1')});
    EXPECT_THROW(host->set_remote_answer(foreign), NegotiationError);
    EXPECT_EQ(host->state(), State::New);
}

TEST_F(TcpPeerTransportTest, RolesAreEnforced) {
    EXPECT_THROW(guest->create_offer(), NegotiationError);
    EXPECT_THROW(host->create_answer("{}"), NegotiationError);
    EXPECT_THROW(host->set_remote_answer("{}"), NegotiationError);   // no offer yet
    host->create_offer();
    EXPECT_THROW(host->create_offer(), NegotiationError);
}

TEST_F(TcpPeerTransportTest, DisconnectClosesThePeer) {
    connect();
    host->disconnect();
    EXPECT_EQ(host->state(), State::Closed);
    ASSERT_TRUE(run_until(io, [this] { return guest->state() == State::Closed; }));
    EXPECT_FALSE(guest->send(protocol::make_message(protocol::DraftReset{})));
}

TEST_F(TcpPeerTransportTest, UnreachableOfferFails) {
    // Nothing listens on the port once the acceptor is gone.
    uint16_t port = 0;
    {
        asio::ip::tcp::acceptor probe(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        port = probe.local_endpoint().port();
    }
    signaling::Offer offer;
    offer.session = std::string(32, 'a');
    offer.candidates = {{"127.0.0.1", port}};

    guest->create_answer(signaling::encode_offer(offer));
    ASSERT_TRUE(run_until(io, [this] { return guest->state() == State::Failed; }));
}

TEST_F(TcpPeerTransportTest, OversizedFrameFailsTheChannel) {
    config.max_frame_bytes = 256;
    host = std::make_unique<TcpPeerTransport>(io, Role::Initiator, config);
    guest = std::make_unique<TcpPeerTransport>(io, Role::Responder, config);
    host->set_on_state_change([this](State s) { host_states.push_back(s); });
    connect();

    ASSERT_TRUE(host->send(protocol::make_message(protocol::PokemonSelect{std::string(1024, 'x')})));
    ASSERT_TRUE(run_until(io, [this] { return guest->state() == State::Failed; }));
}

TEST_F(TcpPeerTransportTest, SilentConnectionIsDropped) {
    config.handshake_timeout_ms = 50;
    host = std::make_unique<TcpPeerTransport>(io, Role::Initiator, config);
    const auto offer = signaling::decode_offer(host->create_offer());
    host->set_remote_answer(signaling::encode_answer({offer.session, std::string(32, '7')}));

    // Connects and never says hello.
    asio::ip::tcp::socket silent(io);
    silent.connect({asio::ip::address_v4::loopback(), host->listen_port()});

    std::array<char, 16> scratch;
    asio::error_code silent_ec;
    bool silent_done = false;
    silent.async_read_some(asio::buffer(scratch), [&](const asio::error_code& ec, std::size_t) {
        silent_ec = ec;
        silent_done = true;
    });
    ASSERT_TRUE(run_until(io, [&] { return silent_done; }));
    EXPECT_TRUE(silent_ec);   // closed by the host
    EXPECT_EQ(host->state(), State::Connecting);
}
