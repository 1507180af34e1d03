/**
 * PeerChannel: framed, ordered reads and writes over one TCP socket.
 */

#include "network/peer_channel.h"

#include <utility>

PeerChannel::PeerChannel(asio::ip::tcp::socket socket, std::uint32_t max_frame_bytes)
    : socket_(std::move(socket)),
      max_frame_bytes_(max_frame_bytes),
      frame_deadline_(socket_.get_executor()) {
    asio::error_code ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

void PeerChannel::start(FrameCallback on_frame, CloseCallback on_close) {
    on_frame_ = std::move(on_frame);
    on_close_ = std::move(on_close);
    read_header();
}

void PeerChannel::expect_frame_within(std::chrono::milliseconds limit) {
    frame_deadline_.expires_after(limit);
    auto self = shared_from_this();
    frame_deadline_.async_wait([this, self](const asio::error_code& ec) {
        if (ec) return;
        fail(asio::error::timed_out);
    });
}

bool PeerChannel::write(const std::string& body) {
    if (closing_) return false;
    write_queue_.push_back(frame::encode(body));
    if (write_queue_.size() == 1) do_write();
    return true;
}

void PeerChannel::close() {
    if (closing_) return;
    closing_ = true;
    frame_deadline_.cancel();
    on_frame_ = nullptr;
    on_close_ = nullptr;
    // An in-flight write closes the socket once the queue drains.
    if (write_queue_.empty()) shutdown_socket();
}

std::string PeerChannel::remote_endpoint() const {
    asio::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

void PeerChannel::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (closing_) return;
            if (ec) {
                fail(ec);
                return;
            }
            const std::uint32_t size = frame::decode_header(header_);
            if (size > max_frame_bytes_) {
                fail(asio::error::message_size);
                return;
            }
            read_body(size);
        });
}

void PeerChannel::read_body(std::uint32_t size) {
    body_.assign(size, '\0');
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&body_[0], body_.size()),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (closing_) return;
            if (ec) {
                fail(ec);
                return;
            }
            frame_deadline_.cancel();
            // Copy: the callback may close us and reset on_frame_.
            auto cb = on_frame_;
            if (cb) cb(body_);
            if (!closing_) read_header();
        });
}

void PeerChannel::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                write_queue_.clear();
                if (closing_) {
                    shutdown_socket();
                } else {
                    fail(ec);
                }
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                shutdown_socket();
            }
        });
}

void PeerChannel::fail(const asio::error_code& ec) {
    if (closing_) return;
    closing_ = true;
    frame_deadline_.cancel();
    shutdown_socket();

    on_frame_ = nullptr;
    auto cb = std::move(on_close_);
    on_close_ = nullptr;
    if (cb) cb(ec);
}

void PeerChannel::shutdown_socket() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}
