#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/EventSink.hpp"
#include <mutex>

namespace keylightd {

static Error not_found(const std::string& id) {
    return errors::make_error(ErrorKind::NotFound, id);
}

DeviceRegistry::DeviceRegistry(EventSink& sink, HealthPolicy policy, LightLimits default_limits)
: sink_(sink), tracker_(policy), default_limits_(default_limits) {}

DeviceRegistry::UpsertOutcome DeviceRegistry::upsert(const Observation& obs, TimePoint now) {
    UpsertOutcome out{UpsertKind::Updated, {}, std::nullopt};
    nlohmann::json event;
    std::string event_name;
    {
        std::unique_lock lock(mutex_);
        auto it = records_.find(obs.id);
        if (it == records_.end()) {
            DeviceRecord rec;
            rec.id = obs.id;
            rec.address = obs.address;
            rec.state = obs.advertised_state;
            rec.limits = obs.advertised_limits.value_or(default_limits_);
            rec.last_seen = now;
            rec.name = obs.name;
            rec.model = obs.model;
            tracker_.init(rec.health, now);
            records_.emplace(obs.id, std::move(rec));

            out.kind = UpsertKind::Created;
            out.previous_address = obs.address;
            event_name = "registry.created";
            event = { {"device_id", obs.id}, {"address", obs.address.to_string()}, {"source", obs.source} };
        } else {
            DeviceRecord& rec = it->second;
            out.previous_address = rec.address;
            if (rec.address != obs.address) {
                // In-flight commands keep their old route and fail on their own.
                out.kind = UpsertKind::AddressChanged;
                event_name = "registry.address_changed";
                event = {
                    {"device_id", obs.id},
                    {"from", rec.address.to_string()},
                    {"to", obs.address.to_string()},
                    {"source", obs.source}
                };
                rec.address = obs.address;
            }
            rec.last_seen = now;
            if (obs.advertised_state) rec.state = obs.advertised_state;
            if (obs.advertised_limits) rec.limits = *obs.advertised_limits;
            if (!obs.name.empty()) rec.name = obs.name;
            if (!obs.model.empty()) rec.model = obs.model;
            out.transition = tracker_.on_observed(rec.health, now);
        }
    }
    if (!event_name.empty()) sink_.emit(event_name, event);
    return out;
}

Result<DeviceRecord> DeviceRegistry::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return not_found(id);
    return it->second;
}

std::vector<DeviceRecord> DeviceRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<DeviceRecord> out;
    out.reserve(records_.size());
    for (const auto& [_, rec] : records_) out.push_back(rec);
    return out;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

Result<DeviceRegistry::MaybeTransition> DeviceRegistry::mark_unreachable(const std::string& id, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return not_found(id);
    return tracker_.force_unreachable(it->second.health, now);
}

Result<bool> DeviceRegistry::expire(const std::string& id, std::chrono::milliseconds older_than, TimePoint now) {
    std::chrono::milliseconds age{0};
    {
        std::unique_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return not_found(id);
        age = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.last_seen);
        if (age <= older_than) return false;
        records_.erase(it);
    }
    sink_.emit("registry.expired", { {"device_id", id}, {"age_ms", age.count()} });
    return true;
}

Result<bool> DeviceRegistry::remove(const std::string& id) {
    {
        std::unique_lock lock(mutex_);
        if (records_.erase(id) == 0) return not_found(id);
    }
    sink_.emit("registry.removed", { {"device_id", id} });
    return true;
}

Result<DeviceRegistry::MaybeTransition> DeviceRegistry::record_success(const std::string& id, const std::optional<LightState>& state, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return not_found(id);
    DeviceRecord& rec = it->second;
    if (state) rec.state = state;
    rec.last_seen = now;
    return tracker_.on_success(rec.health, now);
}

Result<DeviceRegistry::MaybeTransition> DeviceRegistry::record_failure(const std::string& id, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return not_found(id);
    return tracker_.on_failure(it->second.health, now);
}

std::vector<std::string> DeviceRegistry::due_for_probe(TimePoint now) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [id, rec] : records_) {
        if (tracker_.probe_due(rec.health, now)) out.push_back(id);
    }
    return out;
}

} // namespace keylightd
