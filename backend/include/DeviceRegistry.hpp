#pragma once
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Device.hpp"
#include "core/Result.hpp"
#include "engine/HealthTracker.hpp"

namespace keylightd {

class EventSink;

/**
 * @brief Single source of truth for which lights exist and where.
 *
 * Thread safety: reads take a shared lock and return copies; every mutation
 * takes the exclusive lock and touches exactly one record.
 */
class DeviceRegistry {
public:
    enum class UpsertKind { Created, Updated, AddressChanged };

    struct UpsertOutcome {
        UpsertKind kind;
        Address previous_address;
        std::optional<HealthTransition> transition;
    };

    using MaybeTransition = std::optional<HealthTransition>;

    DeviceRegistry(EventSink& sink, HealthPolicy policy = {}, LightLimits default_limits = {});

    // Reconcile one discovery observation with the stored record.
    UpsertOutcome upsert(const Observation& obs, TimePoint now = Clock::now());

    Result<DeviceRecord> get(const std::string& id) const;
    std::vector<DeviceRecord> list() const;
    std::size_t size() const;

    Result<MaybeTransition> mark_unreachable(const std::string& id, TimePoint now = Clock::now());

    // Removes the record when it has not been seen for longer than `older_than`.
    // Returns true if removed, false if still fresh.
    Result<bool> expire(const std::string& id, std::chrono::milliseconds older_than, TimePoint now = Clock::now());
    Result<bool> remove(const std::string& id);

    // Apply one control round-trip outcome. `state` is empty when the device
    // answered without a usable state (e.g. an explicit rejection).
    Result<MaybeTransition> record_success(const std::string& id, const std::optional<LightState>& state, TimePoint now = Clock::now());
    Result<MaybeTransition> record_failure(const std::string& id, TimePoint now = Clock::now());

    std::vector<std::string> due_for_probe(TimePoint now = Clock::now()) const;

private:
    EventSink& sink_;
    HealthTracker tracker_;
    LightLimits default_limits_;

    std::unordered_map<std::string, DeviceRecord> records_;
    mutable std::shared_mutex mutex_;
};

} // namespace keylightd
