#pragma once
#include <chrono>
#include <string>
#include "discovery/DiscoverySource.hpp"

namespace keylightd {

// Browses a DNS-SD service type over multicast DNS. Each cycle sends one
// PTR query from an ephemeral port (responders answer it unicast) and
// listens for `listen_window`.
class MdnsDiscovery : public DiscoverySource {
public:
    explicit MdnsDiscovery(std::string service = "_elg._tcp.local",
                           std::chrono::milliseconds listen_window = std::chrono::milliseconds(2000));

    std::string name() const override { return "mdns"; }
    void scan(const ObservationHandler& emit, const std::atomic<bool>& running) override;

private:
    std::string service_;
    std::chrono::milliseconds listen_window_;
};

} // namespace keylightd
