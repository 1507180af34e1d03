/**
 * LocalAPI: HTTP server on localhost for the draft screen.
 *
 * Runs on <bind_address>:<port> using ASIO, on the same io_context as the
 * peer transport, so handlers never race with incoming peer messages.
 */

#include "api/local_api.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace {

class ApiConnection : public std::enable_shared_from_this<ApiConnection> {
public:
    ApiConnection(asio::ip::tcp::socket socket, const LocalAPI& api)
        : socket_(std::move(socket)), buffer_(kMaxRequestBytes), api_(api) {}

    void start() { read_head(); }

private:
    void read_head() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [this, self](const asio::error_code& ec, std::size_t head_size) {
                if (ec == asio::error::not_found) {
                    respond(error_response(413, "request too large"));
                    return;
                }
                if (ec) return;
                on_head(head_size);
            });
    }

    void on_head(std::size_t head_size) {
        const auto data = buffer_.data();
        const std::string buffered(asio::buffers_begin(data), asio::buffers_end(data));
        buffer_.consume(buffer_.size());

        auto request = parse_request_head(buffered.substr(0, head_size));
        if (!request) {
            respond(error_response(400, "malformed request"));
            return;
        }
        const auto length = content_length(*request);
        if (!length) {
            respond(error_response(400, "bad Content-Length"));
            return;
        }
        if (head_size > kMaxRequestBytes || *length > kMaxRequestBytes - head_size) {
            respond(error_response(413, "request too large"));
            return;
        }

        request_ = std::move(*request);
        request_.body = buffered.substr(head_size, *length);
        if (request_.body.size() >= *length) {
            respond(api_.dispatch(request_));
            return;
        }

        const std::size_t missing = *length - request_.body.size();
        body_rest_.assign(missing, '\0');
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(&body_rest_[0], body_rest_.size()),
            [this, self](const asio::error_code& ec, std::size_t) {
                if (ec) return;
                request_.body += body_rest_;
                respond(api_.dispatch(request_));
            });
    }

    void respond(const HttpResponse& response) {
        spdlog::debug("{} {} -> {}", request_.method, request_.target, response.status);
        out_ = serialize(response);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(out_),
            [this, self](const asio::error_code&, std::size_t) {
                asio::error_code ignored;
                socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                socket_.close(ignored);
            });
    }

    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
    const LocalAPI& api_;
    HttpRequest request_;
    std::string body_rest_;
    std::string out_;
};

} // namespace

LocalAPI::LocalAPI(asio::io_context& io, ApiConfig config)
    : acceptor_(io), config_(std::move(config)) {}

void LocalAPI::start() {
    const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    spdlog::info("Local API listening on {}:{}", config_.bind_address, port());
    do_accept();
}

void LocalAPI::stop() {
    asio::error_code ignored;
    acceptor_.close(ignored);
}

uint16_t LocalAPI::port() const {
    asio::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void LocalAPI::route(const std::string& method, const std::string& path, Handler handler) {
    routes_[path][method] = std::move(handler);
}

HttpResponse LocalAPI::dispatch(const HttpRequest& request) const {
    const auto by_path = routes_.find(request.path);
    if (by_path == routes_.end()) return error_response(404, "no such endpoint");

    const auto by_method = by_path->second.find(request.method);
    if (by_method == by_path->second.end()) return error_response(405, "method not allowed");

    try {
        return by_method->second(request);
    } catch (const std::exception& ex) {
        spdlog::error("{} {} failed: {}", request.method, request.path, ex.what());
        return error_response(500, ex.what());
    }
}

void LocalAPI::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            spdlog::warn("Local API accept failed: {}", ec.message());
        } else {
            std::make_shared<ApiConnection>(std::move(socket), *this)->start();
        }
        if (acceptor_.is_open()) do_accept();
    });
}
