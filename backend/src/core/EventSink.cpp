#include "core/EventSink.hpp"
#include <chrono>

namespace keylightd {

const char* to_string(LogLevel level) {
    return level == LogLevel::Debug ? "debug" : "info";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    return std::nullopt;
}

StreamEventSink::StreamEventSink(std::ostream& out, LogLevel threshold) : out_(out), threshold_(threshold) {}

LogLevel StreamEventSink::level_of(const std::string& event, const nlohmann::json& fields) {
    if (event == "discovery.observed" || event == "probe.scheduled") return LogLevel::Debug;
    if (event == "command.result" && fields.is_object() && fields.value("origin", "") == "probe" && fields.value("ok", false)) {
        return LogLevel::Debug;
    }
    return LogLevel::Info;
}

int64_t StreamEventSink::now_ms() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

void StreamEventSink::emit(const std::string& event, const nlohmann::json& fields) {
    if (level_of(event, fields) < threshold_) return;
    nlohmann::json line = {
        {"ts_ms", now_ms()},
        {"event", event}
    };
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) line[it.key()] = it.value();
    }
    std::lock_guard<std::mutex> lk(out_m_);
    out_ << line.dump() << std::endl;
}

} // namespace keylightd
