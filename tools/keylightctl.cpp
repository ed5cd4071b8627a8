#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

constexpr const char* kDefaultPort = "9124";

// ws://host[:port][/path]
static std::optional<WsUrl> parse_ws_url(const std::string& url) {
    constexpr std::size_t scheme_len = 5;
    if (url.compare(0, scheme_len, "ws://") != 0) return std::nullopt;

    WsUrl u;
    const auto path_at = url.find('/', scheme_len);
    const std::string authority = url.substr(scheme_len, path_at == std::string::npos ? std::string::npos : path_at - scheme_len);
    u.target = path_at == std::string::npos ? "/" : url.substr(path_at);

    const auto port_at = authority.rfind(':');
    u.host = authority.substr(0, port_at);
    if (port_at != std::string::npos) u.port = authority.substr(port_at + 1);
    if (u.port.empty()) u.port = kDefaultPort;
    if (u.host.empty()) return std::nullopt;
    return u;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--url ws://host:port/] <command> [args]\n"
              << "Commands:\n"
              << "  list                       List known lights\n"
              << "  get ID                     Show one light\n"
              << "  on ID | off ID             Switch a light\n"
              << "  brightness ID N [MS]       Set brightness (percent), fading over MS\n"
              << "  temperature ID K           Set colour temperature (Kelvin)\n"
              << "  query ID                   Read state from the light\n"
              << "  expire ID SECONDS          Drop ID if unseen for SECONDS\n"
              << "  remove ID                  Drop ID from the registry\n"
              << "  scan                       Trigger a discovery cycle\n"
              << "  info                       Daemon version and counters\n"
              << "  raw METHOD [PARAMS_JSON]   Send an arbitrary request\n"
              << "Default url: $KEYLIGHTD_URL or ws://127.0.0.1:9124/\n";
}

static std::optional<long> parse_long(const std::string& s) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Maps a command line to {method, params}. Returns false on bad usage.
static bool build_request(const std::vector<std::string>& args, std::string& method, json& params) {
    if (args.empty()) return false;
    const std::string& cmd = args[0];
    auto need = [&](size_t n) { return args.size() == n; };
    params = json::object();

    if (cmd == "list" && need(1)) { method = "devices.list"; return true; }
    if (cmd == "scan" && need(1)) { method = "discovery.scan"; return true; }
    if (cmd == "info" && need(1)) { method = "daemon.info"; return true; }
    if (cmd == "get" && need(2)) {
        method = "device.get";
        params["device_id"] = args[1];
        return true;
    }
    if (cmd == "remove" && need(2)) {
        method = "device.remove";
        params["device_id"] = args[1];
        return true;
    }
    if ((cmd == "on" || cmd == "off") && need(2)) {
        method = "device.command";
        params = { {"device_id", args[1]}, {"op", "set_power"}, {"value", cmd == "on"} };
        return true;
    }
    if (cmd == "query" && need(2)) {
        method = "device.command";
        params = { {"device_id", args[1]}, {"op", "query"} };
        return true;
    }
    if ((cmd == "brightness" || cmd == "temperature") && need(3)) {
        auto v = parse_long(args[2]);
        if (!v) {
            std::cerr << "expected an integer, got '" << args[2] << "'\n";
            return false;
        }
        method = "device.command";
        params = { {"device_id", args[1]}, {"op", cmd == "brightness" ? "set_brightness" : "set_temperature"}, {"value", *v} };
        return true;
    }
    if (cmd == "brightness" && need(4)) {
        auto v = parse_long(args[2]);
        auto ms = parse_long(args[3]);
        if (!v || !ms) {
            std::cerr << "expected integers, got '" << args[2] << "' '" << args[3] << "'\n";
            return false;
        }
        method = "device.command";
        params = { {"device_id", args[1]}, {"op", "set_brightness"}, {"value", *v}, {"transition_ms", *ms} };
        return true;
    }
    if (cmd == "expire" && need(3)) {
        auto v = parse_long(args[2]);
        if (!v || *v < 0) {
            std::cerr << "expected a non-negative number of seconds, got '" << args[2] << "'\n";
            return false;
        }
        method = "device.expire";
        params = { {"device_id", args[1]}, {"older_than_s", *v} };
        return true;
    }
    if (cmd == "raw" && (need(2) || need(3))) {
        method = args[1];
        if (args.size() == 3) {
            params = json::parse(args[2], nullptr, false);
            if (params.is_discarded()) {
                std::cerr << "Invalid params_json: " << args[2] << "\n";
                return false;
            }
        }
        return true;
    }
    return false;
}

int main(int argc, char** argv) {
    std::string ws_url = "ws://127.0.0.1:9124/";
    if (const char* env = std::getenv("KEYLIGHTD_URL")) ws_url = env;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "--url" && i + 1 < argc) {
            ws_url = argv[++i];
            continue;
        }
        args.push_back(a);
    }

    std::string method;
    json params;
    if (!build_request(args, method, params)) {
        print_usage(argv[0]);
        return 2;
    }

    const auto parsed = parse_ws_url(ws_url);
    if (!parsed) {
        std::cerr << "keylightctl: not a ws:// url: " << ws_url << "\n";
        return 2;
    }
    const WsUrl& u = *parsed;

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        net::connect(ws.next_layer(), resolver.resolve(u.host, u.port));
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.handshake(u.host + ":" + u.port, u.target);

        const std::string id = "keylightctl_1";
        json req = {
            {"type", "rpc"},
            {"id", id},
            {"method", method},
            {"params", params},
        };
        ws.text(true);
        ws.write(net::buffer(req.dump()));

        beast::flat_buffer buffer;
        json msg;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            msg = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
            if (msg.is_discarded()) continue;
            if (msg.value("type", std::string{}) == "rpc_result" && msg.contains("id") && msg["id"] == id) break;
        }

        boost::system::error_code ec;
        ws.close(websocket::close_code::normal, ec);

        if (msg.value("ok", false)) {
            std::cout << msg["result"].dump(2) << std::endl;
            return 0;
        }
        const json err = msg.value("error", json::object());
        std::cerr << err.value("message", std::string("request failed")) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "keylightctl: " << e.what() << "\n";
        return 1;
    }
}
