#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "Device.hpp"
#include "core/Result.hpp"

namespace keylightd {

class ControlEngine;

/**
 * @brief Transport-independent request/response contract of the daemon.
 *
 * Request:  {"type":"rpc", "id":..., "method":"...", "params":{...}}
 * Response: {"type":"rpc_result", "id":..., "ok":true, "result":{...}}
 *        or {"type":"rpc_result", "id":..., "ok":false, "error":{"code","kind","message"}}
 *
 * Methods: devices.list, device.get, device.command, device.expire,
 * device.remove, discovery.scan, daemon.info. All results are snapshots
 * taken when the request is handled.
 */
class ControlService {
public:
    explicit ControlService(ControlEngine& engine);

    nlohmann::json handle(const nlohmann::json& request);
    // Parses raw text first; malformed JSON gets an error response.
    nlohmann::json handle_text(const std::string& text);

    static nlohmann::json record_json(const DeviceRecord& rec, TimePoint now);
    static nlohmann::json error_json(const Error& err);

private:
    Result<nlohmann::json> dispatch(const std::string& method, const nlohmann::json& params);

    Result<nlohmann::json> list_devices();
    Result<nlohmann::json> get_device(const nlohmann::json& params);
    Result<nlohmann::json> command_device(const nlohmann::json& params);
    Result<nlohmann::json> expire_device(const nlohmann::json& params);
    Result<nlohmann::json> remove_device(const nlohmann::json& params);
    Result<nlohmann::json> scan();
    Result<nlohmann::json> info();

    ControlEngine& engine_;
};

} // namespace keylightd
