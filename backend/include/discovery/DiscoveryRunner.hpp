#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "discovery/DiscoverySource.hpp"

namespace keylightd {

class EventSink;

// Runs one DiscoverySource forever on its own thread: scan, wait
// `scan_interval`, scan again. A failed cycle is retried after a backoff
// (1s doubling, capped at the scan interval).
class DiscoveryRunner {
public:
    DiscoveryRunner(std::shared_ptr<DiscoverySource> source, ObservationHandler on_observation,
                    EventSink& sink, std::chrono::milliseconds scan_interval);
    ~DiscoveryRunner();

    void start();
    void stop();
    // Cut the current wait short and scan now.
    void trigger();

    uint64_t cycles_completed() const { return cycles_.load(); }
    uint64_t cycles_failed() const { return failures_.load(); }
    const std::string& name() const { return name_; }

private:
    void run_loop();
    // Returns false once stopped.
    bool wait_for(std::chrono::milliseconds d);

    std::shared_ptr<DiscoverySource> source_;
    ObservationHandler on_observation_;
    EventSink& sink_;
    std::chrono::milliseconds scan_interval_;
    std::string name_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> failures_{0};
    std::thread worker_;
    std::mutex wait_m_;
    std::condition_variable wait_cv_;
    bool triggered_ = false;
};

} // namespace keylightd
