#include "ControlService.hpp"
#include "DeviceRegistry.hpp"
#include "WebSocketServer.hpp"
#include "config/ConfigLoader.hpp"
#include "core/BuildInfo.hpp"
#include "core/EventSink.hpp"
#include "discovery/DiscoveryFactory.hpp"
#include "engine/ControlEngine.hpp"
#include "engine/HealthTracker.hpp"
#include "net/HttpDeviceClient.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace keylightd;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "  -v, --version       Print version and exit\n"
              << "  -c, --config PATH   Read configuration from PATH (default: $KEYLIGHTD_CONFIG)\n"
              << "  -p, --port PORT     Override server.port (default 9124)\n"
              << "  -b, --bind ADDR     Override server.bind (default 127.0.0.1)\n"
              << "  -d, --debug         Log debug events (same as log.level \"debug\")\n"
              << std::flush;
}

static std::optional<uint16_t> parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5 || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })) {
        return std::nullopt;
    }
    int v = std::stoi(s);
    if (v > 65535) return std::nullopt;
    return static_cast<uint16_t>(v);
}

int main(int argc, char** argv) {
    std::string config_path;
    std::optional<uint16_t> port_override;
    std::optional<std::string> bind_override;
    bool debug = false;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (a == "-v" || a == "--version") {
            std::cout << "keylightd " << buildinfo::version() << " (" << buildinfo::git_commit() << ")" << std::endl;
            return 0;
        } else if (a == "-c" || a == "--config") {
            auto v = next("--config");
            if (!v) return 2;
            config_path = *v;
        } else if (a == "-p" || a == "--port") {
            auto v = next("--port");
            if (!v) return 2;
            port_override = parse_port(*v);
            if (!port_override) {
                std::cerr << "invalid port: " << *v << std::endl;
                return 2;
            }
        } else if (a == "-d" || a == "--debug") {
            debug = true;
        } else if (a == "-b" || a == "--bind") {
            auto v = next("--bind");
            if (!v) return 2;
            bind_override = *v;
        } else {
            std::cerr << "unknown argument: " << a << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty()) {
        if (const char* env = std::getenv("KEYLIGHTD_CONFIG")) config_path = env;
    }

    config::DaemonConfig cfg;
    try {
        if (!config_path.empty()) cfg = config::load_config_file(config_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (port_override) cfg.server.port = *port_override;
    if (bind_override) cfg.server.bind = *bind_override;
    if (debug) cfg.log_level = LogLevel::Debug;

    if (cfg.log_level == LogLevel::Debug) {
        const auto& c = cfg.engine.control;
        std::cerr << "keylightd: config " << (config_path.empty() ? std::string("(defaults)") : config_path)
                  << ", request timeout " << c.request_timeout.count() << " ms"
                  << ", probe interval " << c.probe_interval.count() << " ms"
                  << ", queue depth " << c.queue_depth
                  << ", failure threshold " << c.failure_threshold << std::endl;
    }

    StreamEventSink events(std::cerr, cfg.log_level);
    DeviceRegistry registry(events, make_health_policy(cfg.engine.control), cfg.engine.limits);
    HttpDeviceClient client(cfg.engine.control.request_timeout);
    ControlEngine engine(cfg.engine, registry, client, events);

    try {
        for (auto& source : make_discovery_sources(cfg.engine.discovery, client, events)) {
            engine.add_discovery_source(std::move(source));
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    ControlService service(engine);
    WebSocketServer server(cfg.server, service);
    if (!server.start()) {
        std::cerr << "keylightd: failed to listen on " << cfg.server.bind << ":" << cfg.server.port << std::endl;
        return 1;
    }
    engine.start();

    std::cout << "keylightd " << buildinfo::version() << " listening on ws://"
              << cfg.server.bind << ":" << server.port() << "/ ("
              << engine.discovery_source_count() << " discovery source(s))" << std::endl;

    // Block until SIGINT/SIGTERM, then shut down cleanly.
    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cout << "keylightd: signal " << signo << ", shutting down..." << std::endl;
    });
    signals_ioc.run();

    // Shutting the engine down resolves queued commands, which releases any
    // rpc worker still waiting on one.
    server.stop_accepting();
    engine.shutdown();
    server.stop();
    std::cout << "keylightd: stopped" << std::endl;
    return 0;
}
