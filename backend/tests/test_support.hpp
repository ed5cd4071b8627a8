#pragma once
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "DeviceClient.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/EventSink.hpp"

namespace keylightd::test {

// Polls `pred` until it holds or `timeout` elapses.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

class RecordingEventSink : public EventSink {
public:
    void emit(const std::string& event, const nlohmann::json& fields) override {
        std::lock_guard<std::mutex> lk(m_);
        events_.emplace_back(event, fields);
    }

    std::size_t count(const std::string& event) const {
        std::lock_guard<std::mutex> lk(m_);
        std::size_t n = 0;
        for (const auto& e : events_) if (e.first == event) ++n;
        return n;
    }

    std::vector<nlohmann::json> named(const std::string& event) const {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<nlohmann::json> out;
        for (const auto& e : events_) if (e.first == event) out.push_back(e.second);
        return out;
    }

private:
    mutable std::mutex m_;
    std::vector<std::pair<std::string, nlohmann::json>> events_;
};

/**
 * @brief Scripted in-memory light.
 *
 * Every send() is recorded before it runs. hold() parks senders until
 * release(); fail_host() makes a host answer with the given error.
 */
class FakeDeviceClient : public DeviceClient {
public:
    struct Call {
        Address address;
        Command cmd;
    };

    Result<LightState> send(const Address& address, const Command& cmd) override {
        std::unique_lock<std::mutex> lk(m_);
        calls_.push_back(Call{address, cmd});
        cv_.notify_all();
        cv_.wait(lk, [this]() { return !held_; });

        auto failing = failing_.find(address.host);
        if (failing != failing_.end()) {
            return errors::make_error(failing->second, "scripted failure at " + address.to_string());
        }
        LightState& s = state_for(cmd.device_id);
        switch (cmd.op) {
        case Operation::SetPower: s.power = cmd.value != 0; break;
        case Operation::SetBrightness: s.brightness = cmd.value; break;
        case Operation::SetTemperature: s.temperature = cmd.value; break;
        case Operation::Query: break;
        }
        return s;
    }

    Result<DeviceInfo> identify(const Address& address) override {
        std::lock_guard<std::mutex> lk(m_);
        auto it = identities_.find(address.host);
        if (it == identities_.end()) {
            return errors::make_error(ErrorKind::Unreachable, "no light at " + address.to_string());
        }
        return it->second;
    }

    void fail_host(const std::string& host, ErrorKind kind) {
        std::lock_guard<std::mutex> lk(m_);
        failing_[host] = kind;
    }
    void heal_host(const std::string& host) {
        std::lock_guard<std::mutex> lk(m_);
        failing_.erase(host);
    }
    void set_identity(const std::string& host, DeviceInfo info) {
        std::lock_guard<std::mutex> lk(m_);
        identities_[host] = std::move(info);
    }

    void hold() {
        std::lock_guard<std::mutex> lk(m_);
        held_ = true;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lk(m_);
            held_ = false;
        }
        cv_.notify_all();
    }

    bool wait_for_calls(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&]() { return calls_.size() >= n; });
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lk(m_);
        return calls_;
    }

    std::size_t call_count() const {
        std::lock_guard<std::mutex> lk(m_);
        return calls_.size();
    }

private:
    LightState& state_for(const std::string& id) {
        auto it = states_.find(id);
        if (it == states_.end()) it = states_.emplace(id, LightState{true, 20, 4000}).first;
        return it->second;
    }

    mutable std::mutex m_;
    std::condition_variable cv_;
    bool held_ = false;
    std::vector<Call> calls_;
    std::map<std::string, ErrorKind> failing_;
    std::map<std::string, LightState> states_;
    std::map<std::string, DeviceInfo> identities_;
};

inline Observation observation(const std::string& id, const std::string& host, uint16_t port = DEFAULT_LIGHT_PORT) {
    Observation obs;
    obs.id = id;
    obs.address = Address{host, port};
    obs.source = "test";
    return obs;
}

} // namespace keylightd::test
