#pragma once
#include "Device.hpp"
#include "core/Result.hpp"

namespace keylightd {

/**
 * @brief Talks to one light at a given address.
 *
 * Implementations must bound every call by a timeout and report:
 *  - ErrorKind::Unreachable   connection failure or timeout
 *  - ErrorKind::ProtocolError malformed response
 *  - ErrorKind::Rejected      explicit error returned by the device
 * Commands arrive already clamped to the device limits.
 */
class DeviceClient {
public:
    virtual ~DeviceClient() = default;
    /** @brief Apply (or query) and return the state the device reports back. */
    virtual Result<LightState> send(const Address& address, const Command& cmd) = 0;
    /** @brief Fetch hardware identity; used by discovery. */
    virtual Result<DeviceInfo> identify(const Address& address) = 0;
};

} // namespace keylightd
