#pragma once
#include <chrono>
#include <optional>
#include "Device.hpp"
#include "core/Config.hpp"

namespace keylightd {

struct HealthPolicy {
    int failure_threshold = 3;
    std::chrono::milliseconds failure_window{60000};
    std::chrono::milliseconds probe_interval{10000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
};

HealthPolicy make_health_policy(const ControlConfig& cfg);

struct HealthTransition {
    Health from;
    Health to;
};

/**
 * @brief Per-device health state machine.
 *
 * Unknown -> Reachable on the first successful round-trip.
 * Reachable -> Unreachable after `failure_threshold` consecutive failures,
 * counted within `failure_window` of the first one.
 * Unreachable -> Reachable on any success.
 *
 * Also owns probe scheduling: Reachable devices are probed every
 * `probe_interval`; Unreachable devices back off exponentially from
 * `backoff_initial` up to `backoff_max`.
 */
class HealthTracker {
public:
    explicit HealthTracker(HealthPolicy policy = {});

    // Fresh record: Unknown, probe immediately.
    void init(HealthState& s, TimePoint now) const;

    std::optional<HealthTransition> on_success(HealthState& s, TimePoint now) const;
    std::optional<HealthTransition> on_failure(HealthState& s, TimePoint now) const;
    // Re-observation by discovery of an already known device.
    std::optional<HealthTransition> on_observed(HealthState& s, TimePoint now) const;
    // Administrative override.
    std::optional<HealthTransition> force_unreachable(HealthState& s, TimePoint now) const;

    bool probe_due(const HealthState& s, TimePoint now) const { return s.next_probe_at <= now; }

    const HealthPolicy& policy() const { return policy_; }

private:
    HealthPolicy policy_;
};

} // namespace keylightd
