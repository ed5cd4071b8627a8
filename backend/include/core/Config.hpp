#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "Device.hpp"

namespace keylightd {

// Plain configuration objects with documented defaults. The engine receives
// these by value; only config/ConfigLoader reads configuration sources.

struct DiscoveryConfig {
    std::vector<std::string> sources{"mdns"};          // "mdns", "static"
    std::chrono::milliseconds scan_interval{30000};
    std::string mdns_service = "_elg._tcp.local";
    std::chrono::milliseconds listen_window{2000};
    std::vector<Address> static_hosts;
};

struct ControlConfig {
    std::chrono::milliseconds request_timeout{2000};
    int failure_threshold = 3;
    std::chrono::milliseconds failure_window{60000};
    std::size_t queue_depth = 32;
    std::chrono::milliseconds probe_interval{10000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
    std::chrono::milliseconds drain_timeout{5000};
};

struct EngineConfig {
    DiscoveryConfig discovery;
    ControlConfig control;
    LightLimits limits;
};

} // namespace keylightd
