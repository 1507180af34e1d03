#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

/**
 * Listening side of the peer channel, owned by the initiator.
 *
 * The socket is bound as soon as the server is constructed so that its
 * port can be advertised in the offer; connections are only accepted
 * after start().
 */
class PeerServer : public std::enable_shared_from_this<PeerServer> {
public:
    using AcceptCallback = std::function<void(asio::ip::tcp::socket socket)>;

    /// Throws asio::system_error if the port cannot be bound.
    PeerServer(asio::io_context& io, uint16_t port);

    void start();
    void stop();

    /// Set the callback invoked for every accepted connection.
    void set_on_accept(AcceptCallback cb);

    [[nodiscard]] uint16_t port() const { return port_; }

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    AcceptCallback on_accept_;
    uint16_t port_ = 0;
    bool running_ = false;
};
