#include "presence/summary_renderer.hpp"

#include <cstdint>

namespace masterlist::presence {

namespace {

constexpr const char *kLock = "\xF0\x9F\x94\x92"; // U+1F512
constexpr const char *kBullet = "\xE2\x80\xA2";   // U+2022
constexpr const char *kDash = "\xE2\x80\x94";     // U+2014
constexpr const char *kEllipsis = "\xE2\x80\xA6"; // U+2026

std::string truncateCodePoints(const std::string &text, std::size_t limit) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        if (count == limit) {
            return text.substr(0, i);
        }
        ++count;
    }
    return text;
}

std::string renderLine(const registry::Listing &server) {
    std::string label;
    auto append = [&label](const std::string &part) {
        if (part.empty()) {
            return;
        }
        if (!label.empty()) {
            label += ' ';
        }
        label += part;
    };
    append(RegionFlag(server.region.empty() ? std::string(registry::kUnknownRegion) : server.region));
    append(server.hasPassword ? kLock : "");
    append(server.name.empty() ? std::string("Unnamed") : server.name);

    const std::string mode = server.playlist.empty() ? std::string("unknown") : server.playlist;
    const std::string separator = std::string(" ") + kDash + " ";
    return std::string(kBullet) + " " + label + separator +
           std::to_string(server.playerCount) + "/" + std::to_string(server.maxPlayers) +
           separator + mode + separator + server.map;
}

} // namespace

std::string RegionFlag(const std::string &region) {
    if (region.size() != 2) {
        return {};
    }
    std::string flag;
    for (char c : region) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
        if (c < 'A' || c > 'Z') {
            return {};
        }
        // U+1F1E6 + (c - 'A') encodes as F0 9F 87 (A6 + offset).
        flag += "\xF0\x9F\x87";
        flag += static_cast<char>(0xA6 + (c - 'A'));
    }
    return flag;
}

std::string RenderServerSummary(const std::vector<registry::Listing> &servers) {
    int64_t players = 0;
    for (const auto &server : servers) {
        players += server.playerCount;
    }

    std::string text = servers.empty()
        ? std::string("No servers online")
        : "Servers: " + std::to_string(servers.size()) + " | Players: " + std::to_string(players);
    text += "\n";

    const std::size_t shown = servers.size() < kSummaryMaxLines ? servers.size() : kSummaryMaxLines;
    for (std::size_t i = 0; i < shown; ++i) {
        text += "\n" + renderLine(servers[i]);
    }
    if (servers.size() > kSummaryMaxLines) {
        text += "\n" + std::string(kEllipsis) + " and " + std::to_string(servers.size() - kSummaryMaxLines) + " more";
    }
    return truncateCodePoints(text, kSummaryMaxLength);
}

} // namespace masterlist::presence
