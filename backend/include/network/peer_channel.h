#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "network/frame.h"

/**
 * One established TCP connection to the other peer.
 *
 * Reads length-prefixed frames off the socket and hands each body to the
 * frame callback. Writes are queued and go out strictly in call order.
 */
class PeerChannel : public std::enable_shared_from_this<PeerChannel> {
public:
    using FrameCallback = std::function<void(const std::string& body)>;
    /// `ec` is asio::error::eof for an orderly shutdown by the remote side.
    using CloseCallback = std::function<void(const asio::error_code& ec)>;

    PeerChannel(asio::ip::tcp::socket socket, std::uint32_t max_frame_bytes);

    void start(FrameCallback on_frame, CloseCallback on_close);

    /// Fail the channel with asio::error::timed_out unless a frame
    /// arrives within `limit`.
    void expect_frame_within(std::chrono::milliseconds limit);

    /// Queue one frame. Returns false once the channel is closing.
    bool write(const std::string& body);

    /// Flush what is queued, then close. No callbacks fire afterwards.
    void close();

    [[nodiscard]] std::string remote_endpoint() const;

private:
    void read_header();
    void read_body(std::uint32_t size);
    void do_write();
    void fail(const asio::error_code& ec);
    void shutdown_socket();

    asio::ip::tcp::socket socket_;
    std::uint32_t max_frame_bytes_;
    asio::steady_timer frame_deadline_;

    frame::Header header_{};
    std::string body_;
    std::deque<std::string> write_queue_;

    FrameCallback on_frame_;
    CloseCallback on_close_;
    bool closing_ = false;
};
