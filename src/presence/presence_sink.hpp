#pragma once

#include "net/endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace masterlist::presence {

// What the tracker knows about a server when it announces it. For servers that
// went offline this comes from the stored meta and may be empty.
struct ServerIdentity {
    net::Endpoint endpoint;
    std::string name;
    std::string map;
    std::string playlist;
    std::vector<std::string> requiredMods;
};

// Receiver of presence events. Called from the scheduler's thread; implementations
// must not block on network I/O.
class PresenceSink {
public:
    virtual ~PresenceSink() = default;

    virtual void onServerOnline(const ServerIdentity &server) = 0;
    virtual void onServerOffline(const ServerIdentity &server) = 0;
    virtual void onCounts(std::size_t servers, int64_t players) = 0;
    virtual void onSummary(const std::string &summary) = 0;
};

} // namespace masterlist::presence
