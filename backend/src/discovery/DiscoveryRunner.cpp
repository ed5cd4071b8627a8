#include "discovery/DiscoveryRunner.hpp"
#include "core/EventSink.hpp"
#include <algorithm>

namespace keylightd {

DiscoveryRunner::DiscoveryRunner(std::shared_ptr<DiscoverySource> source, ObservationHandler on_observation,
                                 EventSink& sink, std::chrono::milliseconds scan_interval)
: source_(std::move(source)), on_observation_(std::move(on_observation)), sink_(sink),
  scan_interval_(scan_interval), name_(source_->name()) {}

DiscoveryRunner::~DiscoveryRunner() {
    stop();
}

void DiscoveryRunner::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

void DiscoveryRunner::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void DiscoveryRunner::trigger() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        triggered_ = true;
    }
    wait_cv_.notify_all();
}

bool DiscoveryRunner::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(wait_m_);
    wait_cv_.wait_for(lk, d, [this]() { return !running_ || triggered_; });
    triggered_ = false;
    return running_;
}

void DiscoveryRunner::run_loop() {
    const std::chrono::milliseconds backoff_start(1000);
    std::chrono::milliseconds backoff = std::min(backoff_start, scan_interval_);

    while (running_) {
        std::chrono::milliseconds next = scan_interval_;
        try {
            source_->scan(on_observation_, running_);
            cycles_ += 1;
            backoff = std::min(backoff_start, scan_interval_);
        } catch (const std::exception& e) {
            failures_ += 1;
            sink_.emit("discovery.error", {
                {"source", name_},
                {"error", e.what()},
                {"retry_in_ms", backoff.count()}
            });
            next = backoff;
            backoff = std::min(backoff * 2, scan_interval_);
        }
        if (!wait_for(next)) break;
    }
}

} // namespace keylightd
