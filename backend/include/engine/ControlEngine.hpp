#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "Device.hpp"
#include "core/Config.hpp"
#include "core/Result.hpp"
#include "engine/CommandSerializer.hpp"

namespace keylightd {

class DeviceClient;
class DeviceRegistry;
class DiscoveryRunner;
class DiscoverySource;
class EventSink;

/**
 * @brief Ties discovery, the registry, the serializer and the device client
 * together.
 *
 * - Discovery runners feed observe(), which reconciles into the registry.
 * - submit()/execute() route user commands through the per-device lanes.
 * - A probe scheduler thread enqueues Query commands for devices whose
 *   health state says a probe is due. Probe outcomes come back through the
 *   same lanes and are applied to the registry like any other outcome.
 */
class ControlEngine {
public:
    ControlEngine(EngineConfig config, DeviceRegistry& registry, DeviceClient& client, EventSink& sink);
    ~ControlEngine();

    ControlEngine(const ControlEngine&) = delete;
    ControlEngine& operator=(const ControlEngine&) = delete;

    // Must be called before start().
    void add_discovery_source(std::shared_ptr<DiscoverySource> source);

    void start();
    // Stop discovery and probes, then drain in-flight commands for at most
    // control.drain_timeout. Idempotent.
    void shutdown();

    // Reconcile one observation (discovery runners call this).
    void observe(const Observation& obs);

    // Non-blocking: an unknown device resolves immediately with NotFound.
    CommandTicket submit(Command cmd);
    // Blocking convenience wrapper around submit().
    Result<LightState> execute(Command cmd);

    /**
     * @brief Step brightness from its current value to `target` over `duration`.
     *
     * Reads the light first, then sends evenly spaced SetBrightness commands
     * through the device lane, at least 20 ms apart and at most one per
     * percent. Stops at the first failed step. `last_sequence` receives the
     * sequence of the last command submitted.
     */
    Result<LightState> fade_brightness(const std::string& id, int target,
                                       std::chrono::milliseconds duration, uint64_t& last_sequence);

    // Enqueue a probe for every device whose probe is due. Returns the
    // number of probes enqueued. Called by the scheduler thread; public so
    // tests can drive it deterministically.
    std::size_t probe_due_devices();

    void trigger_discovery();

    // Administrative removal; retires the device's lane as well.
    Result<bool> remove_device(const std::string& id);
    Result<bool> expire_device(const std::string& id, std::chrono::milliseconds older_than);

    DeviceRegistry& registry() { return registry_; }
    std::size_t discovery_source_count() const { return runners_.size(); }

private:
    Result<LightState> dispatch(const Command& cmd);
    void apply_outcome(const Command& cmd, const Result<LightState>& result);
    void probe_loop();

    EngineConfig config_;
    DeviceRegistry& registry_;
    DeviceClient& client_;
    EventSink& sink_;

    std::vector<std::unique_ptr<DiscoveryRunner>> runners_;
    std::unique_ptr<CommandSerializer> serializer_;

    std::mutex probes_m_;
    std::unordered_set<std::string> probes_in_flight_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
    std::thread probe_thread_;
    // Woken by shutdown(); the probe loop and fades sleep on it.
    std::mutex wait_m_;
    std::condition_variable wait_cv_;
};

} // namespace keylightd
