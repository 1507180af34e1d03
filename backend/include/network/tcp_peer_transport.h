#pragma once

#include <asio.hpp>
#include <memory>
#include <string>
#include <vector>

#include "config/config.h"
#include "network/peer_transport.h"
#include "network/signaling.h"

class PeerChannel;
class PeerClient;
class PeerServer;

/**
 * PeerTransport over a direct TCP connection.
 *
 * Initiator: create_offer() binds a listening socket and advertises its
 * candidates; set_remote_answer() starts accepting and opens the channel
 * for the connection whose hello carries the answer's token.
 *
 * Responder: create_answer() generates a token, connects to the offer's
 * candidates and sends the hello; the channel opens on the initiator's ack.
 *
 * All callbacks run on the io_context passed in; the transport must be
 * used from that thread only.
 */
class TcpPeerTransport : public PeerTransport {
public:
    TcpPeerTransport(asio::io_context& io, Role role, TransportConfig config);
    ~TcpPeerTransport() override;

    std::string create_offer() override;
    std::string create_answer(const std::string& offer) override;
    void set_remote_answer(const std::string& answer) override;
    void disconnect() override;

    /// Port the initiator listens on; 0 before create_offer().
    [[nodiscard]] uint16_t listen_port() const;

protected:
    bool send_text(const std::string& text) override;

private:
    std::vector<signaling::Candidate> gather_candidates(uint16_t port) const;

    void on_accepted(asio::ip::tcp::socket socket);
    void on_connected(const asio::error_code& ec, asio::ip::tcp::socket socket);

    void open_pending(const std::shared_ptr<PeerChannel>& channel);
    void drop_pending(const std::shared_ptr<PeerChannel>& channel);
    void on_handshake_frame(const std::shared_ptr<PeerChannel>& channel, const std::string& body);
    void on_ack_frame(const std::shared_ptr<PeerChannel>& channel, const std::string& body);

    void open_channel(std::shared_ptr<PeerChannel> channel);
    void on_channel_closed(const asio::error_code& ec);
    void teardown();

    asio::io_context& io_;
    TransportConfig config_;

    std::string session_;
    std::string expected_token_;
    bool offer_created_ = false;

    std::shared_ptr<PeerServer> server_;
    std::shared_ptr<PeerClient> client_;
    std::vector<std::shared_ptr<PeerChannel>> pending_;
    std::shared_ptr<PeerChannel> channel_;
};
