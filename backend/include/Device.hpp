#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace keylightd {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline constexpr uint16_t DEFAULT_LIGHT_PORT = 9123;

/** @brief Reachable network endpoint of a light. May change via DHCP. */
struct Address {
    std::string host;
    uint16_t port = DEFAULT_LIGHT_PORT;

    std::string to_string() const;
    bool operator==(const Address& o) const { return host == o.host && port == o.port; }
    bool operator!=(const Address& o) const { return !(*this == o); }
};

// Accepts "host" or "host:port"; port must be 1..65535.
std::optional<Address> parse_address(std::string_view text, uint16_t default_port = DEFAULT_LIGHT_PORT);

/** @brief Last observed output of a light. Temperature is in Kelvin. */
struct LightState {
    bool power = false;
    int brightness = 0;
    int temperature = 0;

    bool operator==(const LightState& o) const {
        return power == o.power && brightness == o.brightness && temperature == o.temperature;
    }
};

/** @brief Bounds advertised by (or configured for) a light. */
struct LightLimits {
    int brightness_min = 0;
    int brightness_max = 100;
    int temperature_min = 2900;
    int temperature_max = 7000;
};

enum class Health { Unknown, Reachable, Unreachable };
const char* to_string(Health h);

// Inspectable per-device health state machine. Mutated only through
// HealthTracker, under the registry lock.
struct HealthState {
    Health health = Health::Unknown;
    int consecutive_failures = 0;
    std::optional<TimePoint> first_failure_at;
    std::chrono::milliseconds probe_backoff{0};
    TimePoint next_probe_at{};
};

struct DeviceRecord {
    std::string id;            // hardware derived; immutable once assigned
    Address address;
    std::optional<LightState> state;
    LightLimits limits;
    TimePoint last_seen{};
    HealthState health;
    std::string name;
    std::string model;
};

/** @brief One sighting of a device by a discovery source. Never stored. */
struct Observation {
    std::string id;
    Address address;
    std::optional<LightState> advertised_state;
    std::optional<LightLimits> advertised_limits;
    std::string name;
    std::string model;
    std::string source;
};

enum class Operation { SetPower, SetBrightness, SetTemperature, Query };
const char* to_string(Operation op);
std::optional<Operation> parse_operation(std::string_view text);

enum class CommandOrigin { User, Probe };

struct Command {
    std::string device_id;
    Operation op = Operation::Query;
    int value = 0;             // power: 0/1, brightness: percent, temperature: Kelvin
    uint64_t sequence = 0;     // assigned per device by the serializer
    CommandOrigin origin = CommandOrigin::User;

    static Command set_power(std::string id, bool on);
    static Command set_brightness(std::string id, int percent);
    static Command set_temperature(std::string id, int kelvin);
    static Command query(std::string id);
};

// Clamp brightness/temperature to the device bounds. Power and Query pass through.
Command clamp_to_limits(const Command& cmd, const LightLimits& limits);

/** @brief Identity reported by a light's accessory-info endpoint. */
struct DeviceInfo {
    std::string serial_number;
    std::string mac_address;
    std::string product_name;
    std::string firmware;
    std::string display_name;

    // MAC if present, otherwise serial; lower-cased.
    std::string stable_id() const;
};

std::string normalize_device_id(std::string_view raw);

void to_json(nlohmann::json& j, const Address& a);
void to_json(nlohmann::json& j, const LightState& s);
void to_json(nlohmann::json& j, const LightLimits& l);

} // namespace keylightd
