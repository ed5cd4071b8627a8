#pragma once
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace keylightd {

/**
 * @brief Destination for structured engine events.
 *
 * The engine never decides formatting or destination. main() wires a
 * StreamEventSink; tests wire a recorder.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    /** @brief Emit one event. `fields` is merged into the event object. */
    virtual void emit(const std::string& event, const nlohmann::json& fields) = 0;
};

enum class LogLevel { Debug, Info };

const char* to_string(LogLevel level);
// "debug" or "info"; anything else is rejected.
std::optional<LogLevel> parse_log_level(std::string_view text);

// One JSON object per line: {"ts_ms":..., "event":..., ...fields}
// Events below `threshold` are dropped.
class StreamEventSink : public EventSink {
public:
    explicit StreamEventSink(std::ostream& out = std::cerr, LogLevel threshold = LogLevel::Info);
    void emit(const std::string& event, const nlohmann::json& fields) override;

    // Routine traffic (sightings, scheduled probes, successful probes) is
    // Debug; state changes and failures are Info.
    static LogLevel level_of(const std::string& event, const nlohmann::json& fields);
    static int64_t now_ms();

private:
    std::ostream& out_;
    LogLevel threshold_;
    std::mutex out_m_;
};

class NullEventSink : public EventSink {
public:
    void emit(const std::string&, const nlohmann::json&) override {}
};

} // namespace keylightd
