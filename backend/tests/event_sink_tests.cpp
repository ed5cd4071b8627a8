#include <gtest/gtest.h>
#include "core/EventSink.hpp"
#include <sstream>
#include <string>
#include <vector>

using nlohmann::json;
using namespace keylightd;

static std::vector<json> lines_of(const std::string& text) {
    std::vector<json> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) out.push_back(json::parse(line));
    return out;
}

TEST(StreamEventSink, WritesOneJsonObjectPerEvent) {
    std::ostringstream out;
    StreamEventSink sink(out);
    sink.emit("registry.removed", {{"device_id", "dev-1"}});

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["event"], "registry.removed");
    EXPECT_EQ(lines[0]["device_id"], "dev-1");
    EXPECT_TRUE(lines[0]["ts_ms"].is_number_integer());
}

TEST(StreamEventSink, InfoThresholdDropsRoutineTraffic) {
    std::ostringstream out;
    StreamEventSink sink(out, LogLevel::Info);
    sink.emit("discovery.observed", {{"device_id", "dev-1"}});
    sink.emit("probe.scheduled", {{"device_id", "dev-1"}, {"sequence", 3}});
    sink.emit("command.result", {{"device_id", "dev-1"}, {"origin", "probe"}, {"ok", true}});
    sink.emit("command.result", {{"device_id", "dev-1"}, {"origin", "probe"}, {"ok", false}});
    sink.emit("command.result", {{"device_id", "dev-1"}, {"origin", "user"}, {"ok", true}});
    sink.emit("health.transition", {{"device_id", "dev-1"}, {"from", "unknown"}, {"to", "reachable"}});

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["ok"], false);
    EXPECT_EQ(lines[1]["origin"], "user");
    EXPECT_EQ(lines[2]["event"], "health.transition");
}

TEST(StreamEventSink, DebugThresholdKeepsEverything) {
    std::ostringstream out;
    StreamEventSink sink(out, LogLevel::Debug);
    sink.emit("discovery.observed", {{"device_id", "dev-1"}});
    sink.emit("probe.scheduled", json::object());
    sink.emit("engine.shutdown", {{"drained", true}});
    EXPECT_EQ(lines_of(out.str()).size(), 3u);
}

TEST(LogLevel, ParsesKnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_FALSE(parse_log_level("DEBUG").has_value());
    EXPECT_STREQ(to_string(LogLevel::Debug), "debug");
}
