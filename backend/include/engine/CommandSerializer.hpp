#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "Device.hpp"
#include "core/Result.hpp"

namespace keylightd {

using CommandFuture = std::future<Result<LightState>>;

struct CommandTicket {
    uint64_t sequence = 0;   // 0 when the submission was refused
    CommandFuture result;
};

/**
 * @brief Per-device FIFO lanes with at most one command in flight per device.
 *
 * Each device gets a lane with its own worker thread, so a slow light only
 * delays its own queue. A lane holds at most `max_depth` outstanding
 * commands (queued plus in flight); beyond that submit() resolves
 * immediately with Backpressure.
 */
class CommandSerializer {
public:
    // Executes one command; called on the lane thread.
    using Dispatch = std::function<Result<LightState>(const Command&)>;

    CommandSerializer(Dispatch dispatch, std::size_t max_depth);
    ~CommandSerializer();

    CommandSerializer(const CommandSerializer&) = delete;
    CommandSerializer& operator=(const CommandSerializer&) = delete;

    CommandTicket submit(Command cmd);

    // Outstanding commands for one device (queued + in flight).
    std::size_t depth(const std::string& device_id) const;

    // Let the lane finish what it has, then retire its thread. A later
    // submit for the same device resumes the retired lane if its worker is
    // still running, and continues its sequence numbers either way.
    void close_lane(const std::string& device_id);

    // Stop accepting work and wait up to `timeout` for every lane to go idle.
    // Whatever is still queued afterwards resolves with ShuttingDown.
    // Returns true if everything drained in time.
    bool drain(std::chrono::milliseconds timeout);

private:
    struct Pending {
        Command cmd;
        std::promise<Result<LightState>> promise;
    };

    struct Lane {
        std::string device_id;
        mutable std::mutex m;
        std::condition_variable cv;
        std::deque<Pending> queue;
        bool busy = false;
        bool stopping = false;
        bool exited = false;
        uint64_t next_sequence = 1;
        std::thread worker;
    };

    Lane& open_lane(const std::string& device_id);
    void reap_retired();
    void run_lane(Lane& lane);
    Result<LightState> execute(const Command& cmd);
    bool all_idle() const;
    static CommandTicket refused(Error err);

    Dispatch dispatch_;
    std::size_t max_depth_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> abandon_{false};

    mutable std::mutex lanes_m_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
    std::unordered_map<std::string, std::unique_ptr<Lane>> retired_;
    std::unordered_map<std::string, uint64_t> next_sequence_;
};

} // namespace keylightd
