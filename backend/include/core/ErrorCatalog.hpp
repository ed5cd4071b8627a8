#pragma once

#include <string>
#include <string_view>

#include "core/Result.hpp"

namespace keylightd::errors {

// 3100-3199: device client errors
// 3200-3299: registry errors
// 3300-3399: command serializer errors
// 3400-3499: control channel errors

inline constexpr int E3101_DEVICE_UNREACHABLE = 3101;
inline constexpr int E3102_PROTOCOL_ERROR = 3102;
inline constexpr int E3103_DEVICE_REJECTED = 3103;
inline constexpr int E3201_DEVICE_NOT_FOUND = 3201;
inline constexpr int E3301_BACKPRESSURE = 3301;
inline constexpr int E3302_SHUTTING_DOWN = 3302;
inline constexpr int E3400_INVALID_REQUEST = 3400;

inline constexpr const char* MSG_E3101_PREFIX = "Error 3101: Device unreachable: ";
inline constexpr const char* MSG_E3102_PREFIX = "Error 3102: Malformed device response: ";
inline constexpr const char* MSG_E3103_PREFIX = "Error 3103: Device rejected command: ";
inline constexpr const char* MSG_E3201_PREFIX = "Error 3201: Unknown device: ";
inline constexpr const char* MSG_E3301_PREFIX = "Error 3301: Command queue full: ";
inline constexpr const char* MSG_E3302_PREFIX = "Error 3302: Daemon shutting down: ";
inline constexpr const char* MSG_E3400_PREFIX = "Error 3400: Control message rejected: ";

// Catalogued detail strings for E3400.
inline constexpr const char* D3400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D3400_NOT_JSON = "request is not valid json";
inline constexpr const char* D3400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D3400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D3400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D3400_PARAMS_NOT_OBJECT = "params must be object";
inline constexpr const char* D3400_MISSING_DEVICE_ID = "missing params.device_id";
inline constexpr const char* D3400_MISSING_OP = "missing params.op";
inline constexpr const char* D3400_UNKNOWN_OP = "unknown params.op";
inline constexpr const char* D3400_VALUE_NOT_BOOL = "params.value must be boolean";
inline constexpr const char* D3400_VALUE_NOT_INT = "params.value must be integer";
inline constexpr const char* D3400_TRANSITION_INVALID = "params.transition_ms must be an integer in 0..60000";
inline constexpr const char* D3400_TRANSITION_NOT_BRIGHTNESS = "params.transition_ms only applies to set_brightness";
inline constexpr const char* D3400_OLDER_THAN_INVALID = "params.older_than_s must be a non-negative number";

// Configuration details (thrown as std::runtime_error by the config loader).
inline constexpr const char* DCFG_OPEN_FAILED = "failed to open config file";
inline constexpr const char* DCFG_NOT_OBJECT = "config root must be an object";
inline constexpr const char* DCFG_NON_POSITIVE = "value must be > 0";
inline constexpr const char* DCFG_THRESHOLD = "control.failure_threshold must be >= 1";
inline constexpr const char* DCFG_QUEUE_DEPTH = "control.queue_depth must be >= 1";
inline constexpr const char* DCFG_BACKOFF = "control.backoff_initial_ms must not exceed control.backoff_max_ms";
inline constexpr const char* DCFG_BRIGHTNESS_RANGE = "limits.brightness_* must satisfy 0 <= min <= max <= 100";
inline constexpr const char* DCFG_TEMPERATURE_RANGE = "limits.temperature_* must satisfy 0 < min <= max";
inline constexpr const char* DCFG_UNKNOWN_SOURCE = "unknown discovery source";
inline constexpr const char* DCFG_NO_SOURCES = "discovery.sources must not be empty";
inline constexpr const char* DCFG_BAD_HOST = "malformed static host (expected host[:port])";
inline constexpr const char* DCFG_LOG_LEVEL = "log.level must be \"debug\" or \"info\"";
inline constexpr const char* DCFG_STATIC_EMPTY = "discovery source 'static' requires discovery.static_hosts";

inline int code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Unreachable: return E3101_DEVICE_UNREACHABLE;
    case ErrorKind::ProtocolError: return E3102_PROTOCOL_ERROR;
    case ErrorKind::Rejected: return E3103_DEVICE_REJECTED;
    case ErrorKind::NotFound: return E3201_DEVICE_NOT_FOUND;
    case ErrorKind::Backpressure: return E3301_BACKPRESSURE;
    case ErrorKind::ShuttingDown: return E3302_SHUTTING_DOWN;
    case ErrorKind::InvalidRequest: return E3400_INVALID_REQUEST;
    }
    return E3400_INVALID_REQUEST;
}

inline const char* kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Unreachable: return "unreachable";
    case ErrorKind::ProtocolError: return "protocol_error";
    case ErrorKind::Rejected: return "rejected";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Backpressure: return "backpressure";
    case ErrorKind::ShuttingDown: return "shutting_down";
    case ErrorKind::InvalidRequest: return "invalid_request";
    }
    return "invalid_request";
}

inline const char* prefix_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Unreachable: return MSG_E3101_PREFIX;
    case ErrorKind::ProtocolError: return MSG_E3102_PREFIX;
    case ErrorKind::Rejected: return MSG_E3103_PREFIX;
    case ErrorKind::NotFound: return MSG_E3201_PREFIX;
    case ErrorKind::Backpressure: return MSG_E3301_PREFIX;
    case ErrorKind::ShuttingDown: return MSG_E3302_PREFIX;
    case ErrorKind::InvalidRequest: return MSG_E3400_PREFIX;
    }
    return MSG_E3400_PREFIX;
}

// "Error <code>: <summary>: <detail>"
inline std::string format_error(ErrorKind kind, std::string_view detail) {
    const char* prefix = prefix_for(kind);
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    if (detail.empty()) {
        out.append(D3400_INVALID_REQUEST);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline Error make_error(ErrorKind kind, std::string_view detail) {
    return Error{kind, format_error(kind, detail)};
}

} // namespace keylightd::errors
