#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "Device.hpp"
#include "core/Result.hpp"

// HTTP+JSON light control API (Elgato Key Light style):
//   GET  /elgato/lights          -> {"numberOfLights":1,"lights":[{"on":1,"brightness":50,"temperature":213}]}
//   PUT  /elgato/lights          <- same shape, only the changed fields
//   GET  /elgato/accessory-info  -> {"serialNumber":..., "macAddress":..., "productName":..., ...}
// Temperature travels in device units (143..344); callers use Kelvin.
namespace keylightd::protocol {

inline constexpr const char* LIGHTS_PATH = "/elgato/lights";
inline constexpr const char* ACCESSORY_INFO_PATH = "/elgato/accessory-info";

inline constexpr int DEVICE_TEMPERATURE_MIN = 143; // 7000 K
inline constexpr int DEVICE_TEMPERATURE_MAX = 344; // 2900 K

int kelvin_to_device(int kelvin);
int device_to_kelvin(int value);

std::string lights_url(const Address& a);
std::string accessory_info_url(const Address& a);

// Body for a PUT; Query has no body.
nlohmann::json encode_command(const Command& cmd);

Result<LightState> decode_lights(std::string_view body);
Result<DeviceInfo> decode_accessory_info(std::string_view body);

} // namespace keylightd::protocol
