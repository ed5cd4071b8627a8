#pragma once
#include <atomic>
#include <functional>
#include <string>
#include "Device.hpp"

namespace keylightd {

using ObservationHandler = std::function<void(const Observation&)>;

/**
 * @brief Pluggable discovery transport.
 *
 * To add a new transport:
 *  1. Inherit from DiscoverySource and implement scan().
 *  2. Give it a name and construct it in make_discovery_sources().
 *
 * scan() performs one discovery cycle and hands each sighting to `emit` as
 * soon as it arrives. It should return promptly once `running` turns false.
 * Errors are reported by throwing; DiscoveryRunner logs them and retries.
 */
class DiscoverySource {
public:
    virtual ~DiscoverySource() = default;
    virtual std::string name() const = 0;
    virtual void scan(const ObservationHandler& emit, const std::atomic<bool>& running) = 0;
};

} // namespace keylightd
