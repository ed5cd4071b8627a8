#include "discovery/StaticDiscovery.hpp"
#include "DeviceClient.hpp"
#include "core/EventSink.hpp"
#include <stdexcept>

namespace keylightd {

StaticDiscovery::StaticDiscovery(std::vector<Address> hosts, DeviceClient& client, EventSink& sink)
: hosts_(std::move(hosts)), client_(client), sink_(sink) {}

void StaticDiscovery::scan(const ObservationHandler& emit, const std::atomic<bool>& running) {
    std::size_t answered = 0;
    std::string last_error;
    for (const auto& host : hosts_) {
        if (!running) return;
        auto info = client_.identify(host);
        if (!info) {
            last_error = info.error().message;
            sink_.emit("discovery.miss", { {"source", name()}, {"address", host.to_string()}, {"error", last_error} });
            continue;
        }
        answered += 1;
        Observation obs;
        obs.id = info.value().stable_id();
        obs.address = host;
        obs.name = info.value().display_name.empty() ? info.value().product_name : info.value().display_name;
        obs.model = info.value().product_name;
        obs.source = name();
        emit(obs);
    }
    // A cycle where nobody answered is a failed cycle; the runner backs off.
    if (!hosts_.empty() && answered == 0) {
        throw std::runtime_error("no configured host answered (last error: " + last_error + ")");
    }
}

} // namespace keylightd
