#pragma once
#include <chrono>
#include <string>
#include "DeviceClient.hpp"

namespace keylightd {

// DeviceClient over libcurl. One easy handle per request, so concurrent
// calls from different device lanes never share state.
class HttpDeviceClient : public DeviceClient {
public:
    explicit HttpDeviceClient(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    ~HttpDeviceClient() override;

    HttpDeviceClient(const HttpDeviceClient&) = delete;
    HttpDeviceClient& operator=(const HttpDeviceClient&) = delete;

    Result<LightState> send(const Address& address, const Command& cmd) override;
    Result<DeviceInfo> identify(const Address& address) override;

private:
    struct HttpResult {
        bool transport_ok = false;
        std::string transport_error;
        long code = 0;
        std::string body;
    };

    HttpResult perform(const std::string& method, const std::string& url, const std::string* payload) const;
    // Maps transport and HTTP status failures; empty optional means "decode the body".
    static std::optional<Error> classify(const HttpResult& r, const std::string& url);

    std::chrono::milliseconds timeout_;
};

} // namespace keylightd
