#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Device.hpp"

// Minimal DNS-SD over mDNS message codec (RFC 1035 / 6762 / 6763): builds a
// PTR query and decodes the PTR, SRV, TXT and A records of a response.
namespace keylightd::mdns {

inline constexpr const char* MULTICAST_ADDRESS = "224.0.0.251";
inline constexpr uint16_t MULTICAST_PORT = 5353;

inline constexpr uint16_t TYPE_A = 1;
inline constexpr uint16_t TYPE_PTR = 12;
inline constexpr uint16_t TYPE_TXT = 16;
inline constexpr uint16_t TYPE_AAAA = 28;
inline constexpr uint16_t TYPE_SRV = 33;
inline constexpr uint16_t CLASS_IN = 1;
inline constexpr uint16_t CLASS_QU = 0x8000; // "unicast response" bit

struct SrvRecord {
    std::string target;
    uint16_t port = 0;
};

// Names are lower-cased and stored without the trailing dot.
struct Message {
    uint16_t id = 0;
    bool is_response = false;
    std::multimap<std::string, std::string> ptr;            // service -> instance
    std::map<std::string, SrvRecord> srv;                   // instance -> target:port
    std::map<std::string, std::map<std::string, std::string>> txt; // instance -> key=value
    std::map<std::string, std::string> a;                   // host -> dotted quad
};

std::vector<uint8_t> build_query(const std::string& service, uint16_t id = 0);

// nullopt when the packet is truncated or otherwise malformed.
std::optional<Message> parse(const uint8_t* data, std::size_t len);

// Turn the records describing `service` into observations. `sender` is used
// as the address when the response carries no A record for the SRV target.
std::vector<Observation> to_observations(const Message& msg, const std::string& service, const std::string& sender);

std::string lower(std::string s);

} // namespace keylightd::mdns
