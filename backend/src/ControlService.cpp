#include "ControlService.hpp"
#include "DeviceRegistry.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "engine/ControlEngine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace keylightd {

static Error invalid(const char* detail) {
    return errors::make_error(ErrorKind::InvalidRequest, detail);
}

static Result<std::string> device_id_param(const json& params) {
    auto it = params.find("device_id");
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        return invalid(errors::D3400_MISSING_DEVICE_ID);
    }
    return it->get<std::string>();
}

constexpr int64_t MAX_TRANSITION_MS = 60000;

// JSON integers are 64-bit; out-of-range values saturate so limit clamping still applies.
static int saturated_int(const json& value) {
    constexpr int64_t lo = std::numeric_limits<int>::min();
    constexpr int64_t hi = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() > static_cast<uint64_t>(hi) ? static_cast<int>(hi) : static_cast<int>(value.get<uint64_t>());
    }
    const int64_t v = value.get<int64_t>();
    return static_cast<int>(std::clamp(v, lo, hi));
}

static std::chrono::milliseconds seconds_to_ms(double seconds) {
    const double ms = seconds * 1000.0;
    constexpr auto max_ms = std::chrono::milliseconds::max().count();
    if (ms >= static_cast<double>(max_ms)) return std::chrono::milliseconds::max();
    return std::chrono::milliseconds(std::llround(ms));
}

static Result<json> command_reply(const std::string& id, uint64_t sequence, const Result<LightState>& state) {
    if (!state) return state.error();
    return json{
        {"device_id", id},
        {"sequence", sequence},
        {"state", state.value()}
    };
}

ControlService::ControlService(ControlEngine& engine) : engine_(engine) {}

json ControlService::error_json(const Error& err) {
    return {
        {"code", errors::code_for(err.kind)},
        {"kind", errors::kind_name(err.kind)},
        {"message", err.message}
    };
}

json ControlService::record_json(const DeviceRecord& rec, TimePoint now) {
    json j = {
        {"id", rec.id},
        {"address", rec.address},
        {"health", to_string(rec.health.health)},
        {"consecutive_failures", rec.health.consecutive_failures},
        {"last_seen_age_ms", std::chrono::duration_cast<std::chrono::milliseconds>(now - rec.last_seen).count()},
        {"limits", rec.limits},
        {"name", rec.name},
        {"model", rec.model}
    };
    j["state"] = rec.state ? json(*rec.state) : json(nullptr);
    return j;
}

json ControlService::handle_text(const std::string& text) {
    json req = json::parse(text, nullptr, false);
    if (req.is_discarded()) {
        return {
            {"type", "rpc_result"},
            {"id", nullptr},
            {"ok", false},
            {"error", error_json(invalid(errors::D3400_NOT_JSON))}
        };
    }
    return handle(req);
}

json ControlService::handle(const json& request) {
    json response = { {"type", "rpc_result"}, {"id", nullptr} };

    auto fail = [&](const Error& err) {
        response["ok"] = false;
        response["error"] = error_json(err);
        return response;
    };

    if (!request.is_object()) return fail(invalid(errors::D3400_INVALID_REQUEST));
    if (!request.contains("id") || !(request["id"].is_string() || request["id"].is_number())) {
        return fail(invalid(errors::D3400_RPC_MISSING_ID));
    }
    response["id"] = request["id"];

    auto method = request.find("method");
    if (method == request.end() || !method->is_string()) return fail(invalid(errors::D3400_RPC_MISSING_METHOD));

    json params = request.value("params", json::object());
    if (params.is_null()) params = json::object();
    if (!params.is_object()) return fail(invalid(errors::D3400_PARAMS_NOT_OBJECT));

    Result<json> result = invalid(errors::D3400_INVALID_REQUEST);
    try {
        result = dispatch(method->get<std::string>(), params);
    } catch (const std::exception& e) {
        // nlohmann type errors on unexpected param shapes end up here.
        result = errors::make_error(ErrorKind::InvalidRequest, e.what());
    }
    if (!result) return fail(result.error());

    response["ok"] = true;
    response["result"] = std::move(result.value());
    return response;
}

Result<json> ControlService::dispatch(const std::string& method, const json& params) {
    if (method == "devices.list") return list_devices();
    if (method == "device.get") return get_device(params);
    if (method == "device.command") return command_device(params);
    if (method == "device.expire") return expire_device(params);
    if (method == "device.remove") return remove_device(params);
    if (method == "discovery.scan") return scan();
    if (method == "daemon.info") return info();
    return errors::make_error(ErrorKind::InvalidRequest, std::string(errors::D3400_RPC_UNKNOWN_METHOD) + ": " + method);
}

Result<json> ControlService::list_devices() {
    const auto now = Clock::now();
    json devices = json::array();
    for (const auto& rec : engine_.registry().list()) devices.push_back(record_json(rec, now));
    return json{ {"devices", devices} };
}

Result<json> ControlService::get_device(const json& params) {
    auto id = device_id_param(params);
    if (!id) return id.error();
    auto rec = engine_.registry().get(id.value());
    if (!rec) return rec.error();
    return record_json(rec.value(), Clock::now());
}

Result<json> ControlService::command_device(const json& params) {
    auto id = device_id_param(params);
    if (!id) return id.error();

    auto op_it = params.find("op");
    if (op_it == params.end() || !op_it->is_string()) return invalid(errors::D3400_MISSING_OP);
    auto op = parse_operation(op_it->get<std::string>());
    if (!op) return errors::make_error(ErrorKind::InvalidRequest, std::string(errors::D3400_UNKNOWN_OP) + ": " + op_it->get<std::string>());

    Command cmd;
    cmd.device_id = id.value();
    cmd.op = *op;
    auto value = params.find("value");
    if (*op == Operation::SetPower) {
        if (value == params.end() || !value->is_boolean()) return invalid(errors::D3400_VALUE_NOT_BOOL);
        cmd.value = value->get<bool>() ? 1 : 0;
    } else if (*op == Operation::SetBrightness || *op == Operation::SetTemperature) {
        if (value == params.end() || !value->is_number_integer()) return invalid(errors::D3400_VALUE_NOT_INT);
        cmd.value = saturated_int(*value);
    }

    auto transition = params.find("transition_ms");
    if (transition != params.end()) {
        if (*op != Operation::SetBrightness) return invalid(errors::D3400_TRANSITION_NOT_BRIGHTNESS);
        if (!transition->is_number_integer() || transition->get<int64_t>() < 0 || transition->get<int64_t>() > MAX_TRANSITION_MS) {
            return invalid(errors::D3400_TRANSITION_INVALID);
        }
    }

    if (transition != params.end()) {
        uint64_t sequence = 0;
        auto state = engine_.fade_brightness(cmd.device_id, cmd.value,
                                             std::chrono::milliseconds(transition->get<int64_t>()), sequence);
        return command_reply(id.value(), sequence, state);
    }
    CommandTicket ticket = engine_.submit(std::move(cmd));
    return command_reply(id.value(), ticket.sequence, ticket.result.get());
}

Result<json> ControlService::expire_device(const json& params) {
    auto id = device_id_param(params);
    if (!id) return id.error();
    auto older = params.find("older_than_s");
    if (older == params.end() || !older->is_number() || older->get<double>() < 0 || !std::isfinite(older->get<double>())) {
        return invalid(errors::D3400_OLDER_THAN_INVALID);
    }
    auto cutoff = seconds_to_ms(older->get<double>());
    auto removed = engine_.expire_device(id.value(), cutoff);
    if (!removed) return removed.error();
    return json{ {"device_id", id.value()}, {"expired", removed.value()} };
}

Result<json> ControlService::remove_device(const json& params) {
    auto id = device_id_param(params);
    if (!id) return id.error();
    auto removed = engine_.remove_device(id.value());
    if (!removed) return removed.error();
    return json{ {"device_id", id.value()}, {"removed", removed.value()} };
}

Result<json> ControlService::scan() {
    engine_.trigger_discovery();
    return json{ {"triggered", engine_.discovery_source_count()} };
}

Result<json> ControlService::info() {
    return json{
        {"name", "keylightd"},
        {"version", buildinfo::version()},
        {"git_commit", buildinfo::git_commit()},
        {"build_time", buildinfo::build_time_utc_approx()},
        {"devices", engine_.registry().size()},
        {"discovery_sources", engine_.discovery_source_count()}
    };
}

} // namespace keylightd
