#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "WebSocketServer.hpp"
#include "core/Config.hpp"
#include "core/EventSink.hpp"

namespace keylightd::config {

// Everything the daemon reads at startup.
struct DaemonConfig {
    ServerOptions server;
    EngineConfig engine;
    LogLevel log_level = LogLevel::Info;
};

/**
 * @brief Build a DaemonConfig from a parsed JSON document.
 *
 * Missing sections and keys keep their defaults. Invalid values throw
 * std::runtime_error carrying the catalogued message and the offending key.
 */
DaemonConfig parse_config(const nlohmann::json& root);

// Reads and parses a config file; throws std::runtime_error on I/O or parse errors.
DaemonConfig load_config_file(const std::string& path);

} // namespace keylightd::config
