/**
 * PeerClient: connects to the initiator.
 *
 * Candidates come from the host's offer blob; the first one that accepts a
 * TCP connection wins.
 */

#include "network/peer_client.h"

#include <spdlog/spdlog.h>

PeerClient::PeerClient(asio::io_context& io)
    : socket_(io) {}

void PeerClient::connect(const std::vector<asio::ip::tcp::endpoint>& candidates,
                         ConnectCallback cb) {
    on_connect_ = std::move(cb);
    auto self = shared_from_this();
    asio::async_connect(socket_, candidates,
        [this, self](const asio::error_code& ec, const asio::ip::tcp::endpoint& endpoint) {
            auto cb = std::move(on_connect_);
            on_connect_ = nullptr;
            if (!cb) return;
            if (!ec) {
                spdlog::debug("Connected to peer candidate {}:{}",
                              endpoint.address().to_string(), endpoint.port());
            }
            cb(ec, std::move(socket_));
        });
}

void PeerClient::cancel() {
    on_connect_ = nullptr;
    asio::error_code ignored;
    socket_.close(ignored);
}
