#include "discovery/DiscoveryFactory.hpp"
#include "discovery/MdnsDiscovery.hpp"
#include "discovery/StaticDiscovery.hpp"
#include "core/ErrorCatalog.hpp"
#include <stdexcept>

namespace keylightd {

std::vector<std::shared_ptr<DiscoverySource>> make_discovery_sources(const DiscoveryConfig& cfg, DeviceClient& client, EventSink& sink) {
    std::vector<std::shared_ptr<DiscoverySource>> out;
    for (const auto& name : cfg.sources) {
        if (name == "mdns") {
            out.push_back(std::make_shared<MdnsDiscovery>(cfg.mdns_service, cfg.listen_window));
        } else if (name == "static") {
            out.push_back(std::make_shared<StaticDiscovery>(cfg.static_hosts, client, sink));
        } else {
            throw std::runtime_error(std::string(errors::DCFG_UNKNOWN_SOURCE) + ": " + name);
        }
    }
    return out;
}

} // namespace keylightd
