#include "net/LightProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace keylightd::protocol {

// Linear fit used by the device firmware: 143 <-> 7000 K, 344 <-> 2900 K.
int kelvin_to_device(int kelvin) {
    double v = (1993300.0 - 201.0 * kelvin) / 4100.0;
    return std::clamp(static_cast<int>(std::lround(v)), DEVICE_TEMPERATURE_MIN, DEVICE_TEMPERATURE_MAX);
}

int device_to_kelvin(int value) {
    value = std::clamp(value, DEVICE_TEMPERATURE_MIN, DEVICE_TEMPERATURE_MAX);
    return static_cast<int>(std::lround((-4100.0 * value + 1993300.0) / 201.0));
}

static std::string url_for(const Address& a, const char* path) {
    return "http://" + a.host + ":" + std::to_string(a.port) + path;
}

std::string lights_url(const Address& a) { return url_for(a, LIGHTS_PATH); }
std::string accessory_info_url(const Address& a) { return url_for(a, ACCESSORY_INFO_PATH); }

json encode_command(const Command& cmd) {
    json light = json::object();
    switch (cmd.op) {
    case Operation::SetPower:
        light["on"] = cmd.value != 0 ? 1 : 0;
        break;
    case Operation::SetBrightness:
        light["brightness"] = cmd.value;
        break;
    case Operation::SetTemperature:
        light["temperature"] = kelvin_to_device(cmd.value);
        break;
    case Operation::Query:
        return nullptr;
    }
    return { {"numberOfLights", 1}, {"lights", json::array({ light })} };
}

static Error malformed(const std::string& detail) {
    return errors::make_error(ErrorKind::ProtocolError, detail);
}

static std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Result<LightState> decode_lights(std::string_view body) {
    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return malformed("response is not a json object");

    auto lights = j.find("lights");
    if (lights == j.end() || !lights->is_array() || lights->empty()) return malformed("missing lights[]");
    const json& l = lights->front();
    if (!l.is_object()) return malformed("lights[0] is not an object");

    for (const char* key : {"on", "brightness", "temperature"}) {
        if (!l.contains(key) || !l[key].is_number_integer()) {
            return malformed(std::string("lights[0].") + key + " missing or not an integer");
        }
    }

    LightState s;
    s.power = l["on"].get<int>() != 0;
    s.brightness = l["brightness"].get<int>();
    s.temperature = device_to_kelvin(l["temperature"].get<int>());
    return s;
}

Result<DeviceInfo> decode_accessory_info(std::string_view body) {
    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return malformed("accessory-info is not a json object");

    DeviceInfo info;
    info.serial_number = string_field(j, "serialNumber");
    info.mac_address = string_field(j, "macAddress");
    info.product_name = string_field(j, "productName");
    info.firmware = string_field(j, "firmwareVersion");
    info.display_name = string_field(j, "displayName");
    if (info.stable_id().empty()) return malformed("accessory-info has neither macAddress nor serialNumber");
    return info;
}

} // namespace keylightd::protocol
