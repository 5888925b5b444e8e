#include "presence/log_presence_sink.hpp"

#include "spdlog/spdlog.h"

namespace masterlist::presence {

namespace {

std::string modsLabel(const std::vector<std::string> &mods) {
    if (mods.empty()) {
        return "none";
    }
    std::string joined;
    for (const auto &mod : mods) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += mod;
    }
    return joined;
}

} // namespace

void LogPresenceSink::onServerOnline(const ServerIdentity &server) {
    spdlog::info("Presence: '{}' online ({} / {}, mods: {})",
                 server.name, server.map, server.playlist, modsLabel(server.requiredMods));
    spdlog::debug("Presence: online endpoint {}", net::AddressKey(server.endpoint));
}

void LogPresenceSink::onServerOffline(const ServerIdentity &server) {
    if (server.name.empty()) {
        spdlog::info("Presence: Unknown server went offline");
    } else {
        spdlog::info("Presence: '{}' offline", server.name);
    }
    spdlog::debug("Presence: offline endpoint {}", net::AddressKey(server.endpoint));
}

void LogPresenceSink::onCounts(std::size_t servers, int64_t players) {
    spdlog::info("Presence: {} public server(s), {} player(s)", servers, players);
}

void LogPresenceSink::onSummary(const std::string &summary) {
    spdlog::debug("Presence: Summary\n{}", summary);
}

} // namespace masterlist::presence
