#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace masterlist::net {

constexpr int kMinPort = 0;
constexpr int kMaxPort = 65535;

// Port is kept wide so out-of-range values can be reported instead of wrapping.
struct Endpoint {
    std::string ip;
    int port = 0;

    bool operator==(const Endpoint &other) const {
        return ip == other.ip && port == other.port;
    }
};

inline bool IsValidPort(long long port) {
    return port >= kMinPort && port <= kMaxPort;
}

// "servers:<ip>:<port>", the primary key of a listing.
std::string RegistryKey(const Endpoint &endpoint);

// Inverse of RegistryKey. The ip part may itself contain ':' (IPv6 literal).
std::optional<Endpoint> ParseRegistryKey(const std::string &key);

// "<ip>:<port>"
std::string AddressKey(const Endpoint &endpoint);

} // namespace masterlist::net
