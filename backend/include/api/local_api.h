#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "api/http_message.h"
#include "config/config.h"

/**
 * Minimal localhost-only HTTP API consumed by the draft screen.
 *
 * One request per connection; the response is written with
 * `Connection: close`. Routes match the path exactly.
 */
class LocalAPI {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    LocalAPI(asio::io_context& io, ApiConfig config);

    /// Binds and starts accepting. Throws asio::system_error.
    void start();
    void stop();

    void route(const std::string& method, const std::string& path, Handler handler);

    /// Runs the matching handler: 404 for an unknown path, 405 for a known
    /// path with another method, 500 if the handler throws.
    HttpResponse dispatch(const HttpRequest& request) const;

    [[nodiscard]] uint16_t port() const;

private:
    void do_accept();

    asio::ip::tcp::acceptor acceptor_;
    ApiConfig config_;
    std::map<std::string, std::map<std::string, Handler>> routes_;   // path -> method -> handler
};
