#include <gtest/gtest.h>
#include "ControlService.hpp"
#include "DeviceRegistry.hpp"
#include "engine/ControlEngine.hpp"
#include "test_support.hpp"

using nlohmann::json;
using namespace keylightd;
using namespace keylightd::test;

class ControlServiceTest : public ::testing::Test {
protected:
    ControlServiceTest()
    : registry(sink), engine(EngineConfig{}, registry, client, sink), service(engine) {}

    json rpc(const std::string& method, json params = json::object()) {
        return service.handle({ {"type", "rpc"}, {"id", "req_1"}, {"method", method}, {"params", params} });
    }

    static int error_code(const json& response) { return response["error"]["code"].get<int>(); }

    RecordingEventSink sink;
    DeviceRegistry registry;
    FakeDeviceClient client;
    ControlEngine engine;
    ControlService service;
};

TEST_F(ControlServiceTest, ListsObservedDevices) {
    engine.observe(observation("dev-1", "10.0.0.5"));
    engine.observe(observation("dev-2", "10.0.0.6"));

    auto res = rpc("devices.list");
    EXPECT_EQ(res["type"], "rpc_result");
    EXPECT_EQ(res["id"], "req_1");
    ASSERT_EQ(res["ok"], true);
    ASSERT_EQ(res["result"]["devices"].size(), 2u);
    const auto& d = res["result"]["devices"][0];
    EXPECT_TRUE(d.contains("id"));
    EXPECT_EQ(d["health"], "unknown");
    EXPECT_TRUE(d["state"].is_null());
    EXPECT_EQ(d["address"]["port"], 9123);
}

TEST_F(ControlServiceTest, UnknownDeviceMapsToNotFound) {
    auto res = rpc("device.get", {{"device_id", "ghost"}});
    EXPECT_EQ(res["ok"], false);
    EXPECT_EQ(error_code(res), 3201);
    EXPECT_EQ(res["error"]["kind"], "not_found");

    auto cmd = rpc("device.command", {{"device_id", "ghost"}, {"op", "query"}});
    EXPECT_EQ(error_code(cmd), 3201);
}

TEST_F(ControlServiceTest, CommandReturnsNewState) {
    engine.observe(observation("dev-1", "10.0.0.5"));

    auto res = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 50}});
    ASSERT_EQ(res["ok"], true) << res.dump();
    EXPECT_EQ(res["result"]["sequence"], 1);
    EXPECT_EQ(res["result"]["state"]["power"], "on");
    EXPECT_EQ(res["result"]["state"]["brightness"], 50);

    auto get = rpc("device.get", {{"device_id", "dev-1"}});
    ASSERT_EQ(get["ok"], true);
    EXPECT_EQ(get["result"]["state"]["brightness"], 50);
    EXPECT_EQ(get["result"]["health"], "reachable");

    auto off = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_power"}, {"value", false}});
    ASSERT_EQ(off["ok"], true);
    EXPECT_EQ(off["result"]["state"]["power"], "off");
}

TEST_F(ControlServiceTest, HugeIntegersSaturateBeforeClamping) {
    engine.observe(observation("dev-1", "10.0.0.5"));

    auto high = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 4294967346LL}});
    ASSERT_EQ(high["ok"], true) << high.dump();
    EXPECT_EQ(high["result"]["state"]["brightness"], 100);

    auto low = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", -4294967246LL}});
    ASSERT_EQ(low["ok"], true) << low.dump();
    EXPECT_EQ(low["result"]["state"]["brightness"], 0);

    auto unsigned_high = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 18446744073709551615ULL}});
    ASSERT_EQ(unsigned_high["ok"], true) << unsigned_high.dump();
    EXPECT_EQ(unsigned_high["result"]["state"]["brightness"], 100);

    auto calls = client.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].cmd.value, 100);
    EXPECT_EQ(calls[1].cmd.value, 0);
    EXPECT_EQ(calls[2].cmd.value, 100);
}

TEST_F(ControlServiceTest, BrightnessTransitionFades) {
    engine.observe(observation("dev-1", "10.0.0.5"));

    auto res = rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 24}, {"transition_ms", 40}});
    ASSERT_EQ(res["ok"], true) << res.dump();
    EXPECT_EQ(res["result"]["state"]["brightness"], 24);
    // A read plus two steps (20 -> 22 -> 24).
    auto calls = client.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(res["result"]["sequence"], calls.back().cmd.sequence);

    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 50}, {"transition_ms", -1}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 50}, {"transition_ms", 60001}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", 50}, {"transition_ms", "slow"}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_power"}, {"value", true}, {"transition_ms", 100}})), 3400);
    EXPECT_EQ(client.call_count(), 3u);
}

TEST_F(ControlServiceTest, DeviceErrorsCarryCatalogCodes) {
    engine.observe(observation("dev-1", "10.0.0.5"));
    client.fail_host("10.0.0.5", ErrorKind::Unreachable);

    auto res = rpc("device.command", {{"device_id", "dev-1"}, {"op", "query"}});
    EXPECT_EQ(res["ok"], false);
    EXPECT_EQ(error_code(res), 3101);
    EXPECT_EQ(res["error"]["kind"], "unreachable");
}

TEST_F(ControlServiceTest, MalformedRequestsAreRejected) {
    engine.observe(observation("dev-1", "10.0.0.5"));

    auto not_json = service.handle_text("{nope");
    EXPECT_EQ(not_json["ok"], false);
    EXPECT_TRUE(not_json["id"].is_null());
    EXPECT_EQ(error_code(not_json), 3400);

    EXPECT_EQ(error_code(service.handle({{"type", "rpc"}, {"method", "devices.list"}})), 3400);
    EXPECT_EQ(error_code(service.handle({{"type", "rpc"}, {"id", 3}})), 3400);
    EXPECT_EQ(error_code(service.handle({{"type", "rpc"}, {"id", 3}, {"method", "devices.list"}, {"params", {1, 2}}})), 3400);

    auto unknown = rpc("lights.dance");
    EXPECT_EQ(error_code(unknown), 3400);
    EXPECT_NE(unknown["error"]["message"].get<std::string>().find("lights.dance"), std::string::npos);

    EXPECT_EQ(error_code(rpc("device.command", {{"op", "query"}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "blink"}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_power"}, {"value", 1}})), 3400);
    EXPECT_EQ(error_code(rpc("device.command", {{"device_id", "dev-1"}, {"op", "set_brightness"}, {"value", "50"}})), 3400);
    EXPECT_EQ(error_code(rpc("device.expire", {{"device_id", "dev-1"}, {"older_than_s", -1}})), 3400);

    // None of the rejected requests reached the light.
    EXPECT_EQ(client.call_count(), 0u);
}

TEST_F(ControlServiceTest, NumericIdIsEchoed) {
    auto res = service.handle({{"type", "rpc"}, {"id", 42}, {"method", "daemon.info"}});
    EXPECT_EQ(res["id"], 42);
    ASSERT_EQ(res["ok"], true);
    EXPECT_EQ(res["result"]["name"], "keylightd");
    EXPECT_TRUE(res["result"].contains("version"));
    EXPECT_EQ(res["result"]["devices"], 0);
}

TEST_F(ControlServiceTest, ExpireAndRemove) {
    engine.observe(observation("dev-1", "10.0.0.5"));
    engine.observe(observation("dev-2", "10.0.0.6"));

    auto kept = rpc("device.expire", {{"device_id", "dev-1"}, {"older_than_s", 3600}});
    ASSERT_EQ(kept["ok"], true);
    EXPECT_EQ(kept["result"]["expired"], false);

    auto removed = rpc("device.remove", {{"device_id", "dev-2"}});
    ASSERT_EQ(removed["ok"], true);
    EXPECT_EQ(removed["result"]["removed"], true);
    EXPECT_EQ(error_code(rpc("device.get", {{"device_id", "dev-2"}})), 3201);
    EXPECT_EQ(error_code(rpc("device.remove", {{"device_id", "dev-2"}})), 3201);
}

TEST_F(ControlServiceTest, ExpireWithHugeAgeKeepsFreshDevice) {
    engine.observe(observation("dev-1", "10.0.0.5"));

    auto res = rpc("device.expire", {{"device_id", "dev-1"}, {"older_than_s", 1e19}});
    ASSERT_EQ(res["ok"], true) << res.dump();
    EXPECT_EQ(res["result"]["expired"], false);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ControlServiceTest, ScanReportsSourceCount) {
    auto res = rpc("discovery.scan");
    ASSERT_EQ(res["ok"], true);
    EXPECT_EQ(res["result"]["triggered"], 0);
}
