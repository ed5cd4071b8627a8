#include "engine/HealthTracker.hpp"
#include <algorithm>

namespace keylightd {

HealthPolicy make_health_policy(const ControlConfig& cfg) {
    HealthPolicy p;
    p.failure_threshold = cfg.failure_threshold;
    p.failure_window = cfg.failure_window;
    p.probe_interval = cfg.probe_interval;
    p.backoff_initial = cfg.backoff_initial;
    p.backoff_max = cfg.backoff_max;
    return p;
}

static std::optional<HealthTransition> change(HealthState& s, Health to) {
    if (s.health == to) return std::nullopt;
    HealthTransition t{s.health, to};
    s.health = to;
    return t;
}

HealthTracker::HealthTracker(HealthPolicy policy) : policy_(policy) {}

void HealthTracker::init(HealthState& s, TimePoint now) const {
    s = HealthState{};
    s.next_probe_at = now;
}

std::optional<HealthTransition> HealthTracker::on_success(HealthState& s, TimePoint now) const {
    s.consecutive_failures = 0;
    s.first_failure_at.reset();
    s.probe_backoff = std::chrono::milliseconds(0);
    s.next_probe_at = now + policy_.probe_interval;
    return change(s, Health::Reachable);
}

std::optional<HealthTransition> HealthTracker::on_failure(HealthState& s, TimePoint now) const {
    // A streak whose first failure fell out of the window starts over.
    if (s.first_failure_at && now - *s.first_failure_at > policy_.failure_window) {
        s.consecutive_failures = 0;
        s.first_failure_at.reset();
    }
    if (!s.first_failure_at) s.first_failure_at = now;
    s.consecutive_failures += 1;

    if (s.health == Health::Unreachable) {
        s.probe_backoff = std::min(s.probe_backoff * 2, policy_.backoff_max);
        if (s.probe_backoff.count() == 0) s.probe_backoff = policy_.backoff_initial;
        s.next_probe_at = now + s.probe_backoff;
        return std::nullopt;
    }

    if (s.consecutive_failures >= policy_.failure_threshold) {
        s.probe_backoff = std::min(policy_.backoff_initial, policy_.backoff_max);
        s.next_probe_at = now + s.probe_backoff;
        return change(s, Health::Unreachable);
    }

    // Not yet over the threshold: confirm quickly.
    s.next_probe_at = now + std::min(policy_.backoff_initial, policy_.probe_interval);
    return std::nullopt;
}

std::optional<HealthTransition> HealthTracker::on_observed(HealthState& s, TimePoint now) const {
    s.consecutive_failures = 0;
    s.first_failure_at.reset();
    s.probe_backoff = std::chrono::milliseconds(0);
    s.next_probe_at = std::min(s.next_probe_at, now + policy_.probe_interval);
    return change(s, Health::Reachable);
}

std::optional<HealthTransition> HealthTracker::force_unreachable(HealthState& s, TimePoint now) const {
    if (s.health != Health::Unreachable) {
        s.probe_backoff = std::min(policy_.backoff_initial, policy_.backoff_max);
        s.next_probe_at = now + s.probe_backoff;
    }
    return change(s, Health::Unreachable);
}

} // namespace keylightd
