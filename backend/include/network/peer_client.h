#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <vector>

/**
 * Outgoing side of the peer channel, used by the responder to reach one of
 * the initiator's advertised candidates.
 */
class PeerClient : public std::enable_shared_from_this<PeerClient> {
public:
    using ConnectCallback =
        std::function<void(const asio::error_code& ec, asio::ip::tcp::socket socket)>;

    explicit PeerClient(asio::io_context& io);

    /// Tries the candidates in order; the callback fires exactly once
    /// unless cancel() is called first.
    void connect(const std::vector<asio::ip::tcp::endpoint>& candidates, ConnectCallback cb);
    void cancel();

private:
    asio::ip::tcp::socket socket_;
    ConnectCallback on_connect_;
};
