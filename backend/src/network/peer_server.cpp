/**
 * PeerServer: accepts the guest's incoming connection.
 *
 * Uses standalone ASIO. The accept loop keeps running until the transport
 * has matched a connection against the published answer and calls stop().
 */

#include "network/peer_server.h"

#include <spdlog/spdlog.h>

PeerServer::PeerServer(asio::io_context& io, uint16_t port)
    : acceptor_(io) {
    const asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void PeerServer::start() {
    if (running_) return;
    running_ = true;
    spdlog::debug("Peer server accepting on port {}", port_);
    do_accept();
}

void PeerServer::stop() {
    if (!acceptor_.is_open()) return;
    running_ = false;
    on_accept_ = nullptr;
    asio::error_code ignored;
    acceptor_.close(ignored);
}

void PeerServer::set_on_accept(AcceptCallback cb) {
    on_accept_ = std::move(cb);
}

void PeerServer::do_accept() {
    auto self = shared_from_this();
    acceptor_.async_accept(
        [this, self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (!running_) return;
            if (ec) {
                spdlog::warn("Peer accept failed: {}", ec.message());
            } else if (on_accept_) {
                auto cb = on_accept_;
                cb(std::move(socket));
            }
            if (running_) do_accept();
        });
}
