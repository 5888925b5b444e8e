#include "registry/listing_validation.hpp"

#include "crypto/packet_cipher.hpp"
#include "net/endpoint.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <regex>

namespace masterlist::registry {

namespace {

ValidationResult reject(std::string message) {
    ValidationResult result;
    result.error = std::move(message);
    return result;
}

std::optional<std::string> stringValue(const json::Value &body, const char *key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string stringOrEmpty(const json::Value &body, const char *key) {
    return stringValue(body, key).value_or(std::string());
}

} // namespace

std::optional<long long> ReadIntegerField(const json::Value &body, const char *key) {
    const auto it = body.find(key);
    if (it == body.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<unsigned long long>();
        if (value > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(value);
    }
    if (it->is_number_integer()) {
        return it->get<long long>();
    }
    if (it->is_number_float()) {
        // 2^63 is exact as a double; anything at or beyond it does not fit.
        constexpr double kLimit = 9223372036854775808.0;
        const double value = it->get<double>();
        if (!std::isfinite(value) || value != std::floor(value) || value < -kLimit || value >= kLimit) {
            return std::nullopt;
        }
        return static_cast<long long>(value);
    }
    if (it->is_string()) {
        const std::string text = TrimCopy(it->get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const long long value = std::stoll(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

namespace {

bool flagValue(const json::Value &body, const char *key) {
    const auto it = body.find(key);
    if (it == body.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const std::string text = it->get<std::string>();
        return text == "true" || text == "1";
    }
    if (it->is_number_integer()) {
        return it->get<long long>() != 0;
    }
    return false;
}

bool lengthWithin(const std::string &text, std::size_t min, std::size_t max) {
    const std::size_t length = Utf8Length(text);
    return length >= min && length <= max;
}

const std::vector<std::regex> &linkPatterns() {
    static const std::vector<std::regex> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"((https?://|ftp://))", flags),
            std::regex(R"(\bwww\.[^\s]+)", flags),
            std::regex(R"(\bdiscord\.(gg|com/invite)\b)", flags),
            std::regex(R"(\b(?:\d{1,3}\.){3}\d{1,3}(?::\d+)?\b)", std::regex::ECMAScript),
            std::regex(R"(\[[0-9a-f:]+\])", flags),
            std::regex(R"(\b[a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?\.(?:[a-z]{2,24})(?:\b|/))", flags)
        };
    }();
    return patterns;
}

bool isValidPlaylist(const std::string &playlist) {
    static const std::regex pattern(R"(^[a-zA-Z0-9_]+$)");
    return std::regex_match(playlist, pattern);
}

} // namespace

std::size_t Utf8Length(const std::string &text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool ContainsLink(const std::string &name) {
    for (const auto &pattern : linkPatterns()) {
        if (std::regex_search(name, pattern)) {
            return true;
        }
    }
    return false;
}

ValidationResult ValidateRegistration(const json::Value &body,
                                      const RequestOrigin &origin,
                                      const VersionCatalog &catalog) {
    if (!body.is_object()) {
        return reject("Missing required fields.");
    }

    const std::string name = stringOrEmpty(body, "name");
    const std::string map = stringOrEmpty(body, "map");
    const std::string version = stringOrEmpty(body, "version");
    const std::string playlist = stringOrEmpty(body, "playlist");
    const std::string key = stringOrEmpty(body, "key");
    if (name.empty() || map.empty() || version.empty() || playlist.empty() || key.empty()) {
        return reject("Missing required fields.");
    }

    const std::string password = stringOrEmpty(body, "password");
    const std::string description = stringOrEmpty(body, "description");

    if (!lengthWithin(name, 1, kMaxNameLength)) {
        return reject("Name must be between 1 and 256 characters.");
    }
    if (ContainsLink(name)) {
        return reject("Server name cannot contain URLs or invite links.");
    }
    if (!lengthWithin(description, 0, kMaxDescriptionLength)) {
        return reject("Description must be below 256 characters.");
    }
    if (!lengthWithin(map, 1, kMaxMapLength)) {
        return reject("Map must be between 1 and 32 characters.");
    }

    const auto maxPlayers = ReadIntegerField(body, "maxPlayers");
    if (!maxPlayers || *maxPlayers < kMinMaxPlayers || *maxPlayers > kMaxMaxPlayers) {
        return reject("Max players must be between 1 and 128 players.");
    }
    if (origin.ip.empty()) {
        return reject("Couldn't retrieve an IP address.");
    }
    const auto port = ReadIntegerField(body, "port");
    if (!port || !net::IsValidPort(*port)) {
        return reject("Port must be in the range 0-65535");
    }
    if (!isValidPlaylist(playlist)) {
        return reject("Playlist must be composed of latin letters, numbers, and underscores.");
    }
    if (!crypto::DecodeKey(key)) {
        return reject("Invalid encryption key.");
    }

    Listing listing;
    listing.ip = origin.ip;
    listing.port = static_cast<int>(*port);
    listing.name = name;
    listing.description = description;
    listing.map = map;
    listing.playlist = playlist;
    listing.version = version;
    listing.key = key;
    listing.maxPlayers = static_cast<int>(*maxPlayers);
    listing.playerCount = static_cast<int>(std::clamp(ReadIntegerField(body, "numPlayers").value_or(0), 0LL,
                                                      static_cast<long long>(kMaxMaxPlayers)));
    listing.checksum = ReadIntegerField(body, "checksum").value_or(0);
    listing.hidden = flagValue(body, "hidden");
    listing.hasPassword = !password.empty();
    if (listing.hasPassword) {
        listing.password = password;
    }
    listing.region = origin.region.empty() ? std::string(kUnknownRegion) : origin.region;

    const auto required = body.find("requiredMods");
    if (required != body.end()) {
        listing.requiredMods = NormalizeRequiredMods(*required);
    }
    const auto enabled = body.find("enabledMods");
    if (enabled != body.end()) {
        listing.enabledMods = NormalizeEnabledMods(*enabled);
    }
    if (!listing.enabledMods.empty() && listing.requiredMods.empty()) {
        listing.requiredMods = ModIds(listing.enabledMods);
    }

    if (!listing.hidden && !catalog.isSupported(version)) {
        return reject("Please update to the latest version of the SDK to host a public server.");
    }
    if (catalog.checksumsEnabled(version) && !catalog.isChecksumSupported(listing.checksum, version)) {
        return reject("Your remote functions checksum does not match the server checksum.\nChecksum: " +
                      std::to_string(listing.checksum) + "\nVersion: " + version);
    }

    ValidationResult result;
    result.ok = true;
    result.listing = std::move(listing);
    return result;
}

} // namespace masterlist::registry
