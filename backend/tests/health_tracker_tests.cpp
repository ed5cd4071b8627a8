#include <gtest/gtest.h>
#include "engine/HealthTracker.hpp"

using namespace keylightd;
using namespace std::chrono_literals;

namespace {

HealthPolicy policy() {
    HealthPolicy p;
    p.failure_threshold = 3;
    p.failure_window = 60s;
    p.probe_interval = 10s;
    p.backoff_initial = 1s;
    p.backoff_max = 30s;
    return p;
}

} // namespace

TEST(HealthTracker, FirstSuccessMakesReachable) {
    HealthTracker t(policy());
    HealthState s;
    const auto now = Clock::now();
    t.init(s, now);
    EXPECT_EQ(s.health, Health::Unknown);
    EXPECT_TRUE(t.probe_due(s, now));

    auto tr = t.on_success(s, now);
    ASSERT_TRUE(tr.has_value());
    EXPECT_EQ(tr->from, Health::Unknown);
    EXPECT_EQ(tr->to, Health::Reachable);
    EXPECT_EQ(s.next_probe_at, now + 10s);

    // Further successes are not transitions.
    EXPECT_FALSE(t.on_success(s, now + 10s).has_value());
}

TEST(HealthTracker, ThreeFailuresInWindowMakeUnreachable) {
    HealthTracker t(policy());
    HealthState s;
    const auto t0 = Clock::now();
    t.init(s, t0);
    t.on_success(s, t0);

    EXPECT_FALSE(t.on_failure(s, t0 + 1s).has_value());
    EXPECT_EQ(s.next_probe_at, t0 + 2s);
    EXPECT_FALSE(t.on_failure(s, t0 + 2s).has_value());
    auto tr = t.on_failure(s, t0 + 3s);
    ASSERT_TRUE(tr.has_value());
    EXPECT_EQ(tr->from, Health::Reachable);
    EXPECT_EQ(tr->to, Health::Unreachable);
    EXPECT_EQ(s.consecutive_failures, 3);
    EXPECT_EQ(s.next_probe_at, t0 + 4s);
}

TEST(HealthTracker, FailuresOutsideWindowStartOver) {
    HealthTracker t(policy());
    HealthState s;
    const auto t0 = Clock::now();
    t.init(s, t0);
    t.on_success(s, t0);

    t.on_failure(s, t0);
    t.on_failure(s, t0 + 30s);
    // First failure is now more than 60 s old.
    EXPECT_FALSE(t.on_failure(s, t0 + 61s).has_value());
    EXPECT_EQ(s.consecutive_failures, 1);
    EXPECT_EQ(s.health, Health::Reachable);
}

TEST(HealthTracker, UnreachableBackoffDoublesAndCaps) {
    HealthTracker t(policy());
    HealthState s;
    auto now = Clock::now();
    t.init(s, now);
    for (int i = 0; i < 3; ++i) t.on_failure(s, now);
    ASSERT_EQ(s.health, Health::Unreachable);
    EXPECT_EQ(s.probe_backoff, 1s);

    const std::chrono::milliseconds expected[] = {2s, 4s, 8s, 16s, 30s, 30s};
    for (auto e : expected) {
        now += 1s;
        EXPECT_FALSE(t.on_failure(s, now).has_value());
        EXPECT_EQ(s.probe_backoff, e);
        EXPECT_EQ(s.next_probe_at, now + e);
    }
}

TEST(HealthTracker, SuccessRecoversFromUnreachable) {
    HealthTracker t(policy());
    HealthState s;
    const auto t0 = Clock::now();
    t.init(s, t0);
    for (int i = 0; i < 5; ++i) t.on_failure(s, t0);
    ASSERT_EQ(s.health, Health::Unreachable);

    auto tr = t.on_success(s, t0 + 1s);
    ASSERT_TRUE(tr.has_value());
    EXPECT_EQ(tr->to, Health::Reachable);
    EXPECT_EQ(s.consecutive_failures, 0);
    EXPECT_EQ(s.probe_backoff, 0ms);
    EXPECT_EQ(s.next_probe_at, t0 + 11s);
}

TEST(HealthTracker, ObservationResetsFailureStreak) {
    HealthTracker t(policy());
    HealthState s;
    const auto t0 = Clock::now();
    t.init(s, t0);
    t.on_success(s, t0);
    t.on_failure(s, t0 + 1s);
    t.on_failure(s, t0 + 2s);

    EXPECT_FALSE(t.on_observed(s, t0 + 3s).has_value());
    EXPECT_EQ(s.consecutive_failures, 0);
    // Two more failures are not enough after the reset.
    t.on_failure(s, t0 + 4s);
    t.on_failure(s, t0 + 5s);
    EXPECT_EQ(s.health, Health::Reachable);
}

TEST(HealthTracker, ForceUnreachableIsIdempotent) {
    HealthTracker t(policy());
    HealthState s;
    const auto t0 = Clock::now();
    t.init(s, t0);

    auto first = t.force_unreachable(s, t0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->from, Health::Unknown);
    EXPECT_FALSE(t.force_unreachable(s, t0).has_value());
    EXPECT_EQ(s.next_probe_at, t0 + 1s);
}

TEST(HealthTracker, PolicyFromControlConfig) {
    ControlConfig cfg;
    cfg.failure_threshold = 5;
    cfg.backoff_initial = 250ms;
    auto p = make_health_policy(cfg);
    EXPECT_EQ(p.failure_threshold, 5);
    EXPECT_EQ(p.backoff_initial, 250ms);
    EXPECT_EQ(p.backoff_max, 30s);
    EXPECT_EQ(p.probe_interval, 10s);
}
