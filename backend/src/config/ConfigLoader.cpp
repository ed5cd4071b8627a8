#include "config/ConfigLoader.hpp"
#include "core/ErrorCatalog.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace keylightd::config {

static std::runtime_error config_error(const std::string& key, const char* detail) {
    return std::runtime_error("config: " + key + ": " + detail);
}

static const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) return empty;
    if (!it->is_object()) throw config_error(name, errors::DCFG_NOT_OBJECT);
    return *it;
}

static bool read_int(const json& obj, const std::string& prefix, const char* key, int64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return false;
    if (!it->is_number_integer()) throw std::runtime_error("config: " + prefix + "." + key + ": expected an integer");
    out = it->get<int64_t>();
    return true;
}

static void read_positive_ms(const json& obj, const std::string& prefix, const char* key,
                             int64_t scale_ms, std::chrono::milliseconds& out) {
    int64_t v = 0;
    if (!read_int(obj, prefix, key, v)) return;
    if (v <= 0) throw config_error(prefix + "." + key, errors::DCFG_NON_POSITIVE);
    out = std::chrono::milliseconds(v * scale_ms);
}

static std::string read_string(const json& obj, const std::string& prefix, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_string()) throw std::runtime_error("config: " + prefix + "." + key + ": expected a string");
    return it->get<std::string>();
}

static void parse_server(const json& s, ServerOptions& out) {
    out.bind = read_string(s, "server", "bind", out.bind);
    int64_t v = 0;
    if (read_int(s, "server", "port", v)) {
        if (v < 0 || v > 65535) throw std::runtime_error("config: server.port: out of range");
        out.port = static_cast<uint16_t>(v);
    }
    if (read_int(s, "server", "rpc_threads", v)) {
        if (v <= 0) throw config_error("server.rpc_threads", errors::DCFG_NON_POSITIVE);
        out.rpc_threads = static_cast<int>(v);
    }
}

static void parse_discovery(const json& d, DiscoveryConfig& out) {
    if (d.contains("sources")) {
        const auto& src = d["sources"];
        if (!src.is_array()) throw std::runtime_error("config: discovery.sources: expected an array");
        out.sources.clear();
        for (const auto& name : src) {
            if (!name.is_string()) throw config_error("discovery.sources", errors::DCFG_UNKNOWN_SOURCE);
            auto n = name.get<std::string>();
            if (n != "mdns" && n != "static") throw config_error("discovery.sources", (std::string(errors::DCFG_UNKNOWN_SOURCE) + " '" + n + "'").c_str());
            out.sources.push_back(n);
        }
    }
    if (out.sources.empty()) throw config_error("discovery.sources", errors::DCFG_NO_SOURCES);

    read_positive_ms(d, "discovery", "scan_interval_s", 1000, out.scan_interval);
    read_positive_ms(d, "discovery", "listen_window_ms", 1, out.listen_window);
    out.mdns_service = read_string(d, "discovery", "mdns_service", out.mdns_service);

    if (d.contains("static_hosts")) {
        const auto& hosts = d["static_hosts"];
        if (!hosts.is_array()) throw std::runtime_error("config: discovery.static_hosts: expected an array");
        out.static_hosts.clear();
        for (const auto& h : hosts) {
            if (!h.is_string()) throw config_error("discovery.static_hosts", errors::DCFG_BAD_HOST);
            auto addr = parse_address(h.get<std::string>());
            if (!addr) throw config_error("discovery.static_hosts", (std::string(errors::DCFG_BAD_HOST) + ": " + h.get<std::string>()).c_str());
            out.static_hosts.push_back(*addr);
        }
    }
    for (const auto& n : out.sources) {
        if (n == "static" && out.static_hosts.empty()) throw config_error("discovery.static_hosts", errors::DCFG_STATIC_EMPTY);
    }
}

static void parse_control(const json& c, ControlConfig& out) {
    read_positive_ms(c, "control", "request_timeout_ms", 1, out.request_timeout);
    read_positive_ms(c, "control", "failure_window_s", 1000, out.failure_window);
    read_positive_ms(c, "control", "probe_interval_s", 1000, out.probe_interval);
    read_positive_ms(c, "control", "backoff_initial_ms", 1, out.backoff_initial);
    read_positive_ms(c, "control", "backoff_max_ms", 1, out.backoff_max);
    read_positive_ms(c, "control", "drain_timeout_ms", 1, out.drain_timeout);

    int64_t v = 0;
    if (read_int(c, "control", "failure_threshold", v)) {
        if (v < 1) throw config_error("control.failure_threshold", errors::DCFG_THRESHOLD);
        out.failure_threshold = static_cast<int>(v);
    }
    if (read_int(c, "control", "queue_depth", v)) {
        if (v < 1) throw config_error("control.queue_depth", errors::DCFG_QUEUE_DEPTH);
        out.queue_depth = static_cast<std::size_t>(v);
    }
    if (out.backoff_initial > out.backoff_max) throw config_error("control.backoff_initial_ms", errors::DCFG_BACKOFF);
}

static void parse_limits(const json& l, LightLimits& out) {
    int64_t v = 0;
    if (read_int(l, "limits", "brightness_min", v)) out.brightness_min = static_cast<int>(v);
    if (read_int(l, "limits", "brightness_max", v)) out.brightness_max = static_cast<int>(v);
    if (read_int(l, "limits", "temperature_min", v)) out.temperature_min = static_cast<int>(v);
    if (read_int(l, "limits", "temperature_max", v)) out.temperature_max = static_cast<int>(v);

    if (out.brightness_min < 0 || out.brightness_max > 100 || out.brightness_min > out.brightness_max) {
        throw config_error("limits", errors::DCFG_BRIGHTNESS_RANGE);
    }
    if (out.temperature_min <= 0 || out.temperature_min > out.temperature_max) {
        throw config_error("limits", errors::DCFG_TEMPERATURE_RANGE);
    }
}

static void parse_log(const json& l, LogLevel& out) {
    auto it = l.find("level");
    if (it == l.end()) return;
    std::optional<LogLevel> level;
    if (it->is_string()) level = parse_log_level(it->get<std::string>());
    if (!level) throw config_error("log.level", errors::DCFG_LOG_LEVEL);
    out = *level;
}

DaemonConfig parse_config(const json& root) {
    if (!root.is_object()) throw std::runtime_error(std::string("config: ") + errors::DCFG_NOT_OBJECT);
    DaemonConfig cfg;
    parse_server(section(root, "server"), cfg.server);
    parse_discovery(section(root, "discovery"), cfg.engine.discovery);
    parse_control(section(root, "control"), cfg.engine.control);
    parse_limits(section(root, "limits"), cfg.engine.limits);
    parse_log(section(root, "log"), cfg.log_level);
    return cfg;
}

DaemonConfig load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error(std::string("config: ") + errors::DCFG_OPEN_FAILED + ": " + path);
    json root;
    try {
        root = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("config: " + path + ": " + e.what());
    }
    return parse_config(root);
}

} // namespace keylightd::config
