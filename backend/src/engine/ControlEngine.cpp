#include "engine/ControlEngine.hpp"
#include "DeviceClient.hpp"
#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/EventSink.hpp"
#include "discovery/DiscoveryRunner.hpp"
#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

namespace keylightd {

static CommandTicket resolved(Error err) {
    std::promise<Result<LightState>> p;
    p.set_value(std::move(err));
    return CommandTicket{0, p.get_future()};
}

constexpr std::chrono::milliseconds FADE_MIN_STEP{20};

static const char* origin_name(CommandOrigin o) {
    return o == CommandOrigin::Probe ? "probe" : "user";
}

ControlEngine::ControlEngine(EngineConfig config, DeviceRegistry& registry, DeviceClient& client, EventSink& sink)
: config_(std::move(config)), registry_(registry), client_(client), sink_(sink) {
    serializer_ = std::make_unique<CommandSerializer>(
        [this](const Command& cmd) { return dispatch(cmd); },
        config_.control.queue_depth);
}

ControlEngine::~ControlEngine() {
    shutdown();
}

void ControlEngine::add_discovery_source(std::shared_ptr<DiscoverySource> source) {
    runners_.push_back(std::make_unique<DiscoveryRunner>(
        std::move(source),
        [this](const Observation& obs) { observe(obs); },
        sink_,
        config_.discovery.scan_interval));
}

void ControlEngine::start() {
    if (running_ || shut_down_) return;
    running_ = true;
    for (auto& r : runners_) r->start();
    probe_thread_ = std::thread([this]() { probe_loop(); });
}

void ControlEngine::shutdown() {
    if (shut_down_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (probe_thread_.joinable()) probe_thread_.join();
    for (auto& r : runners_) r->stop();

    const auto started = Clock::now();
    const bool drained = serializer_->drain(config_.control.drain_timeout);
    sink_.emit("engine.shutdown", {
        {"drained", drained},
        {"elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count()}
    });
}

void ControlEngine::observe(const Observation& obs) {
    auto outcome = registry_.upsert(obs);
    sink_.emit("discovery.observed", {
        {"device_id", obs.id},
        {"address", obs.address.to_string()},
        {"source", obs.source}
    });
    if (outcome.transition) {
        sink_.emit("health.transition", {
            {"device_id", obs.id},
            {"from", to_string(outcome.transition->from)},
            {"to", to_string(outcome.transition->to)},
            {"cause", "discovery"}
        });
    }
}

CommandTicket ControlEngine::submit(Command cmd) {
    if (shut_down_) return resolved(errors::make_error(ErrorKind::ShuttingDown, "engine stopped"));
    auto rec = registry_.get(cmd.device_id);
    if (!rec) return resolved(rec.error());
    return serializer_->submit(std::move(cmd));
}

Result<LightState> ControlEngine::execute(Command cmd) {
    CommandTicket ticket = submit(std::move(cmd));
    return ticket.result.get();
}

Result<LightState> ControlEngine::dispatch(const Command& cmd) {
    // Route at dispatch time: the address is whatever the registry holds now.
    auto rec = registry_.get(cmd.device_id);
    if (!rec) {
        if (cmd.origin == CommandOrigin::Probe) {
            std::lock_guard<std::mutex> lk(probes_m_);
            probes_in_flight_.erase(cmd.device_id);
        }
        return rec.error();
    }

    Command sent = clamp_to_limits(cmd, rec.value().limits);
    if (sent.value != cmd.value) {
        sink_.emit("command.clamped", {
            {"device_id", cmd.device_id},
            {"sequence", cmd.sequence},
            {"op", to_string(cmd.op)},
            {"requested", cmd.value},
            {"sent", sent.value}
        });
    }

    Result<LightState> result = client_.send(rec.value().address, sent);
    apply_outcome(sent, result);

    if (cmd.origin == CommandOrigin::Probe) {
        std::lock_guard<std::mutex> lk(probes_m_);
        probes_in_flight_.erase(cmd.device_id);
    }
    return result;
}

void ControlEngine::apply_outcome(const Command& cmd, const Result<LightState>& result) {
    const auto now = Clock::now();
    // A rejection is still a round-trip: the device is alive.
    const bool answered = result.ok() || result.error().kind == ErrorKind::Rejected;
    auto transition = answered
        ? registry_.record_success(cmd.device_id, result.ok() ? std::optional<LightState>(result.value()) : std::nullopt, now)
        : registry_.record_failure(cmd.device_id, now);

    if (transition && transition.value()) {
        sink_.emit("health.transition", {
            {"device_id", cmd.device_id},
            {"from", to_string(transition.value()->from)},
            {"to", to_string(transition.value()->to)},
            {"cause", origin_name(cmd.origin)}
        });
    }

    json ev = {
        {"device_id", cmd.device_id},
        {"sequence", cmd.sequence},
        {"op", to_string(cmd.op)},
        {"origin", origin_name(cmd.origin)},
        {"ok", result.ok()}
    };
    if (cmd.op != Operation::Query) ev["value"] = cmd.value;
    if (!result.ok()) {
        ev["error"] = errors::kind_name(result.error().kind);
        ev["message"] = result.error().message;
    }
    sink_.emit("command.result", ev);
}

Result<LightState> ControlEngine::fade_brightness(const std::string& id, int target,
                                                 std::chrono::milliseconds duration, uint64_t& last_sequence) {
    auto rec = registry_.get(id);
    if (!rec) return rec.error();
    const LightLimits& limits = rec.value().limits;
    target = std::clamp(target, limits.brightness_min, limits.brightness_max);

    CommandTicket current = submit(Command::query(id));
    last_sequence = current.sequence;
    Result<LightState> state = current.result.get();
    if (!state) return state;

    const int start = state.value().brightness;
    const int delta = target - start;
    if (delta == 0) return state;

    const int span = std::abs(delta);
    const int steps = std::clamp(static_cast<int>(duration / FADE_MIN_STEP), 1, span);
    const auto interval = duration / steps;
    for (int i = 1; i <= steps; ++i) {
        if (interval.count() > 0) {
            std::unique_lock<std::mutex> lk(wait_m_);
            if (wait_cv_.wait_for(lk, interval, [this]() { return shut_down_.load(); })) {
                return errors::make_error(ErrorKind::ShuttingDown, "fade interrupted for " + id);
            }
        }
        CommandTicket step = submit(Command::set_brightness(id, start + delta * i / steps));
        if (step.sequence != 0) last_sequence = step.sequence;
        state = step.result.get();
        if (!state) return state;
    }
    sink_.emit("command.faded", {
        {"device_id", id},
        {"from", start},
        {"to", target},
        {"steps", steps},
        {"duration_ms", duration.count()}
    });
    return state;
}

std::size_t ControlEngine::probe_due_devices() {
    std::size_t enqueued = 0;
    for (const auto& id : registry_.due_for_probe(Clock::now())) {
        {
            std::lock_guard<std::mutex> lk(probes_m_);
            if (!probes_in_flight_.insert(id).second) continue;
        }
        Command probe = Command::query(id);
        probe.origin = CommandOrigin::Probe;
        CommandTicket ticket = serializer_->submit(std::move(probe));
        if (ticket.sequence == 0) {
            // Refused (queue full or shutting down); try again next tick.
            std::lock_guard<std::mutex> lk(probes_m_);
            probes_in_flight_.erase(id);
            continue;
        }
        sink_.emit("probe.scheduled", { {"device_id", id}, {"sequence", ticket.sequence} });
        enqueued += 1;
    }
    return enqueued;
}

void ControlEngine::probe_loop() {
    const auto tick = std::min(std::chrono::milliseconds(250), config_.control.backoff_initial);
    while (running_) {
        probe_due_devices();
        std::unique_lock<std::mutex> lk(wait_m_);
        wait_cv_.wait_for(lk, tick, [this]() { return !running_; });
    }
}

void ControlEngine::trigger_discovery() {
    for (auto& r : runners_) r->trigger();
}

Result<bool> ControlEngine::remove_device(const std::string& id) {
    auto removed = registry_.remove(id);
    if (removed && removed.value()) serializer_->close_lane(id);
    return removed;
}

Result<bool> ControlEngine::expire_device(const std::string& id, std::chrono::milliseconds older_than) {
    auto removed = registry_.expire(id, older_than);
    if (removed && removed.value()) serializer_->close_lane(id);
    return removed;
}

} // namespace keylightd
