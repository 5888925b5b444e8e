#include "net/endpoint.hpp"

#include <string_view>

namespace masterlist::net {

namespace {
constexpr std::string_view kKeyPrefix = "servers:";
}

std::string RegistryKey(const Endpoint &endpoint) {
    return std::string(kKeyPrefix) + AddressKey(endpoint);
}

std::optional<Endpoint> ParseRegistryKey(const std::string &key) {
    if (key.size() <= kKeyPrefix.size() || key.compare(0, kKeyPrefix.size(), kKeyPrefix) != 0) {
        return std::nullopt;
    }
    const auto separator = key.rfind(':');
    if (separator == std::string::npos || separator < kKeyPrefix.size()) {
        return std::nullopt;
    }

    Endpoint endpoint;
    endpoint.ip = key.substr(kKeyPrefix.size(), separator - kKeyPrefix.size());
    const std::string portText = key.substr(separator + 1);
    if (endpoint.ip.empty() || portText.empty()) {
        return std::nullopt;
    }
    for (char ch : portText) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }
    try {
        const long long port = std::stoll(portText);
        if (!IsValidPort(port)) {
            return std::nullopt;
        }
        endpoint.port = static_cast<int>(port);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return endpoint;
}

std::string AddressKey(const Endpoint &endpoint) {
    return endpoint.ip + ":" + std::to_string(endpoint.port);
}

} // namespace masterlist::net
