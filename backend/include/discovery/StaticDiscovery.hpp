#pragma once
#include <vector>
#include "discovery/DiscoverySource.hpp"

namespace keylightd {

class DeviceClient;
class EventSink;

// Probes a fixed list of host:port entries for networks where multicast
// does not reach the lights. Each answering host yields one observation.
class StaticDiscovery : public DiscoverySource {
public:
    StaticDiscovery(std::vector<Address> hosts, DeviceClient& client, EventSink& sink);

    std::string name() const override { return "static"; }
    void scan(const ObservationHandler& emit, const std::atomic<bool>& running) override;

private:
    std::vector<Address> hosts_;
    DeviceClient& client_;
    EventSink& sink_;
};

} // namespace keylightd
