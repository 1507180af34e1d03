/**
 * draftsync: Entry Point
 *
 * Loads config, starts the local control API for the draft screen and,
 * if a mode is given on the command line, hosts, joins or starts a solo
 * draft right away. Everything then runs on one io_context until
 * SIGINT/SIGTERM.
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "api/draft_routes.h"
#include "api/local_api.h"
#include "config/config.h"
#include "crypto/crypto_manager.h"
#include "network/signaling.h"
#include "node/node.h"
#include "registry/room_registry_client.h"

namespace {

struct Options {
    std::string config_path = "config.json";
    std::string mode;      // "", "host", "join" or "solo"
    std::string room_id;
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.json] [host | join <ROOM_ID> | solo]\n";
}

bool is_mode(const std::string& arg) {
    return arg == "host" || arg == "join" || arg == "solo";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::size_t i = 0;
    if (i < args.size() && !is_mode(args[i])) opts.config_path = args[i++];
    if (i == args.size()) return true;

    opts.mode = args[i++];
    if (!is_mode(opts.mode)) return false;
    if (opts.mode == "join") {
        if (i == args.size()) return false;
        opts.room_id = args[i++];
    }
    return i == args.size();
}

/// Runs the mode picked on the command line. False when it could not start.
bool start_mode(Node& node, const Options& opts) {
    try {
        if (opts.mode == "host") {
            spdlog::info("Room id: {}", node.host_room());
        } else if (opts.mode == "join") {
            node.join_room(opts.room_id);
        } else if (opts.mode == "solo") {
            node.start_solo();
        }
        return true;
    } catch (const RegistryError& ex) {
        spdlog::error("Registry request failed: {}", ex.what());
    } catch (const NegotiationError& ex) {
        spdlog::error("Negotiation failed: {}", ex.what());
    } catch (const SessionError& ex) {
        spdlog::error("{}", ex.what());
    }
    return false;
}

/// RAII pairing for curl_global_init / curl_global_cleanup.
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    AppConfig config;
    try {
        config = load_config(opts.config_path);
    } catch (const ConfigError& ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }
    apply_log_config(config.log);
    spdlog::info("draftsync starting, config {}", opts.config_path);

    if (!CryptoManager::init()) {
        spdlog::critical("libsodium failed to initialise");
        return 1;
    }
    CurlGlobal curl;

    asio::io_context io;
    auto registry = std::make_shared<RoomRegistryClient>(config.registry);
    Node node(io, config, registry);

    LocalAPI api(io, config.api);
    register_draft_routes(api, node);
    try {
        api.start();
    } catch (const asio::system_error& ex) {
        spdlog::error("Cannot start local API on {}:{}: {}",
                      config.api.bind_address, config.api.port, ex.what());
        return 1;
    }

    if (!start_mode(node, opts)) return 1;

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Signal {} received, shutting down", signo);
        api.stop();
        node.leave();
        io.stop();
    });

    spdlog::info("Ready. Press Ctrl+C to exit.");
    try {
        io.run();
    } catch (const std::exception& ex) {
        spdlog::critical("Event loop stopped: {}", ex.what());
        node.leave();
        return 1;
    }
    return 0;
}
