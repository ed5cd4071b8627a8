#pragma once
#include <memory>
#include <vector>
#include "core/Config.hpp"
#include "discovery/DiscoverySource.hpp"

namespace keylightd {

class DeviceClient;
class EventSink;

// Builds the sources named in `cfg.sources`. Throws std::runtime_error on an
// unknown name.
std::vector<std::shared_ptr<DiscoverySource>> make_discovery_sources(const DiscoveryConfig& cfg, DeviceClient& client, EventSink& sink);

} // namespace keylightd
