#include "Device.hpp"
#include <algorithm>
#include <cctype>

namespace keylightd {

std::string Address::to_string() const {
    return host + ":" + std::to_string(port);
}

std::optional<Address> parse_address(std::string_view text, uint16_t default_port) {
    std::string s(text);
    if (s.empty()) return std::nullopt;

    Address out;
    out.port = default_port;
    auto colon = s.rfind(':');
    if (colon == std::string::npos) {
        out.host = s;
    } else {
        out.host = s.substr(0, colon);
        std::string port = s.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(), [](unsigned char c){ return std::isdigit(c); })) {
            return std::nullopt;
        }
        if (port.size() > 5) return std::nullopt;
        int p = std::stoi(port);
        if (p < 1 || p > 65535) return std::nullopt;
        out.port = static_cast<uint16_t>(p);
    }
    if (out.host.empty()) return std::nullopt;
    return out;
}

const char* to_string(Health h) {
    switch (h) {
    case Health::Unknown: return "unknown";
    case Health::Reachable: return "reachable";
    case Health::Unreachable: return "unreachable";
    }
    return "unknown";
}

const char* to_string(Operation op) {
    switch (op) {
    case Operation::SetPower: return "set_power";
    case Operation::SetBrightness: return "set_brightness";
    case Operation::SetTemperature: return "set_temperature";
    case Operation::Query: return "query";
    }
    return "query";
}

std::optional<Operation> parse_operation(std::string_view text) {
    if (text == "set_power") return Operation::SetPower;
    if (text == "set_brightness") return Operation::SetBrightness;
    if (text == "set_temperature") return Operation::SetTemperature;
    if (text == "query") return Operation::Query;
    return std::nullopt;
}

Command Command::set_power(std::string id, bool on) {
    Command c;
    c.device_id = std::move(id);
    c.op = Operation::SetPower;
    c.value = on ? 1 : 0;
    return c;
}

Command Command::set_brightness(std::string id, int percent) {
    Command c;
    c.device_id = std::move(id);
    c.op = Operation::SetBrightness;
    c.value = percent;
    return c;
}

Command Command::set_temperature(std::string id, int kelvin) {
    Command c;
    c.device_id = std::move(id);
    c.op = Operation::SetTemperature;
    c.value = kelvin;
    return c;
}

Command Command::query(std::string id) {
    Command c;
    c.device_id = std::move(id);
    c.op = Operation::Query;
    return c;
}

Command clamp_to_limits(const Command& cmd, const LightLimits& limits) {
    Command out = cmd;
    if (cmd.op == Operation::SetBrightness) {
        out.value = std::clamp(cmd.value, limits.brightness_min, limits.brightness_max);
    } else if (cmd.op == Operation::SetTemperature) {
        out.value = std::clamp(cmd.value, limits.temperature_min, limits.temperature_max);
    }
    return out;
}

std::string normalize_device_id(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string DeviceInfo::stable_id() const {
    if (!mac_address.empty()) return normalize_device_id(mac_address);
    return normalize_device_id(serial_number);
}

void to_json(nlohmann::json& j, const Address& a) {
    j = { {"host", a.host}, {"port", a.port} };
}

void to_json(nlohmann::json& j, const LightState& s) {
    j = {
        {"power", s.power ? "on" : "off"},
        {"brightness", s.brightness},
        {"temperature", s.temperature}
    };
}

void to_json(nlohmann::json& j, const LightLimits& l) {
    j = {
        {"brightness", {l.brightness_min, l.brightness_max}},
        {"temperature", {l.temperature_min, l.temperature_max}}
    };
}

} // namespace keylightd
