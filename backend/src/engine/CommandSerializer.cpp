#include "engine/CommandSerializer.hpp"
#include "core/ErrorCatalog.hpp"

namespace keylightd {

CommandSerializer::CommandSerializer(Dispatch dispatch, std::size_t max_depth)
: dispatch_(std::move(dispatch)), max_depth_(max_depth) {}

CommandSerializer::~CommandSerializer() {
    drain(std::chrono::milliseconds(0));
}

CommandTicket CommandSerializer::refused(Error err) {
    std::promise<Result<LightState>> p;
    p.set_value(std::move(err));
    return CommandTicket{0, p.get_future()};
}

CommandTicket CommandSerializer::submit(Command cmd) {
    if (!accepting_) {
        return refused(errors::make_error(ErrorKind::ShuttingDown, "not accepting commands"));
    }

    Lane* lane = nullptr;
    {
        std::lock_guard<std::mutex> lk(lanes_m_);
        if (!accepting_) {
            return refused(errors::make_error(ErrorKind::ShuttingDown, "not accepting commands"));
        }
        lane = &open_lane(cmd.device_id);

        // Sequence assignment and enqueue happen under the lane lock, so the
        // order of sequence numbers is the order of execution.
        std::lock_guard<std::mutex> llk(lane->m);
        if (lane->stopping) {
            return refused(errors::make_error(ErrorKind::ShuttingDown, "lane closed for " + cmd.device_id));
        }
        const std::size_t outstanding = lane->queue.size() + (lane->busy ? 1 : 0);
        if (outstanding >= max_depth_) {
            return refused(errors::make_error(ErrorKind::Backpressure,
                cmd.device_id + " has " + std::to_string(outstanding) + " outstanding commands"));
        }
        cmd.sequence = lane->next_sequence++;
        Pending p;
        p.cmd = std::move(cmd);
        CommandTicket ticket{p.cmd.sequence, p.promise.get_future()};
        lane->queue.push_back(std::move(p));
        lane->cv.notify_one();
        return ticket;
    }
}

// Called with lanes_m_ held.
CommandSerializer::Lane& CommandSerializer::open_lane(const std::string& device_id) {
    auto& slot = lanes_[device_id];
    if (slot) return *slot;

    reap_retired();
    auto old = retired_.find(device_id);
    if (old != retired_.end()) {
        Lane& prev = *old->second;
        bool resumed = false;
        {
            std::lock_guard<std::mutex> llk(prev.m);
            if (!prev.exited) {
                prev.stopping = false;
                resumed = true;
            }
        }
        if (resumed) {
            slot = std::move(old->second);
            retired_.erase(old);
            return *slot;
        }
        if (prev.worker.joinable()) prev.worker.join();
        next_sequence_[device_id] = prev.next_sequence;
        retired_.erase(old);
    }

    slot = std::make_unique<Lane>();
    slot->device_id = device_id;
    auto seq = next_sequence_.find(device_id);
    if (seq != next_sequence_.end()) {
        slot->next_sequence = seq->second;
        next_sequence_.erase(seq);
    }
    Lane* raw = slot.get();
    raw->worker = std::thread([this, raw]() { run_lane(*raw); });
    return *slot;
}

// Joins retired lanes whose worker has returned. Called with lanes_m_ held.
void CommandSerializer::reap_retired() {
    for (auto it = retired_.begin(); it != retired_.end();) {
        Lane& lane = *it->second;
        bool exited = false;
        {
            std::lock_guard<std::mutex> llk(lane.m);
            exited = lane.exited;
        }
        if (!exited) {
            ++it;
            continue;
        }
        if (lane.worker.joinable()) lane.worker.join();
        next_sequence_[it->first] = lane.next_sequence;
        it = retired_.erase(it);
    }
}

std::size_t CommandSerializer::depth(const std::string& device_id) const {
    std::lock_guard<std::mutex> lk(lanes_m_);
    auto it = lanes_.find(device_id);
    if (it == lanes_.end()) return 0;
    std::lock_guard<std::mutex> llk(it->second->m);
    return it->second->queue.size() + (it->second->busy ? 1 : 0);
}

Result<LightState> CommandSerializer::execute(const Command& cmd) {
    if (abandon_) {
        return errors::make_error(ErrorKind::ShuttingDown, "abandoned queued " + std::string(to_string(cmd.op)));
    }
    try {
        return dispatch_(cmd);
    } catch (const std::exception& e) {
        return errors::make_error(ErrorKind::ProtocolError, std::string("dispatch failed: ") + e.what());
    }
}

void CommandSerializer::run_lane(Lane& lane) {
    for (;;) {
        Pending p;
        {
            std::unique_lock<std::mutex> lk(lane.m);
            lane.cv.wait(lk, [&]() { return !lane.queue.empty() || lane.stopping; });
            if (lane.queue.empty()) {
                lane.exited = true;
                return;
            }
            p = std::move(lane.queue.front());
            lane.queue.pop_front();
            lane.busy = true;
        }

        p.promise.set_value(execute(p.cmd));

        {
            std::lock_guard<std::mutex> lk(lane.m);
            lane.busy = false;
        }
        // Taking lanes_m_ orders this notify after any waiter's predicate check.
        { std::lock_guard<std::mutex> g(lanes_m_); }
        idle_cv_.notify_all();
    }
}

void CommandSerializer::close_lane(const std::string& device_id) {
    std::lock_guard<std::mutex> lk(lanes_m_);
    auto it = lanes_.find(device_id);
    if (it == lanes_.end()) return;
    {
        std::lock_guard<std::mutex> llk(it->second->m);
        it->second->stopping = true;
    }
    it->second->cv.notify_all();
    auto lane = std::move(it->second);
    lanes_.erase(it);
    reap_retired();
    retired_[device_id] = std::move(lane);
}

bool CommandSerializer::all_idle() const {
    auto idle = [](const Lane& lane) {
        std::lock_guard<std::mutex> llk(lane.m);
        return !lane.busy && lane.queue.empty();
    };
    for (const auto& [_, lane] : lanes_) {
        if (!idle(*lane)) return false;
    }
    for (const auto& [_, lane] : retired_) {
        if (!idle(*lane)) return false;
    }
    return true;
}

bool CommandSerializer::drain(std::chrono::milliseconds timeout) {
    accepting_ = false;

    bool drained = false;
    std::vector<std::unique_ptr<Lane>> lanes;
    {
        std::unique_lock<std::mutex> lk(lanes_m_);
        drained = idle_cv_.wait_for(lk, timeout, [this]() { return all_idle(); });
        if (!drained) abandon_ = true;

        for (auto& [_, lane] : lanes_) lanes.push_back(std::move(lane));
        lanes_.clear();
        for (auto& [_, lane] : retired_) lanes.push_back(std::move(lane));
        retired_.clear();
    }

    for (auto& lane : lanes) {
        {
            std::lock_guard<std::mutex> llk(lane->m);
            lane->stopping = true;
        }
        lane->cv.notify_all();
    }
    // In-flight requests finish within the client timeout; queued ones
    // resolve immediately once abandon_ is set.
    for (auto& lane : lanes) {
        if (lane->worker.joinable()) lane->worker.join();
    }
    return drained;
}

} // namespace keylightd
