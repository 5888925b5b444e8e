#pragma once

#include "common/json.hpp"
#include "net/endpoint.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace masterlist::registry {

constexpr int kDefaultListingPort = 37015;
constexpr const char *kUnknownRegion = "XX";

struct ModInfo {
    std::string id;
    std::string name;
    std::string author;
    std::string version;
    std::string thunderstoreId;
    std::string description;

    bool operator==(const ModInfo &other) const = default;
};

// A registered game server. The endpoint (ip, port) is the primary key.
struct Listing {
    std::string ip;
    int port = 0;
    std::string name;
    std::string description;
    std::string map;
    std::string playlist;
    int playerCount = 0;
    int maxPlayers = 0;
    bool hasPassword = false;
    std::string password;
    std::vector<std::string> requiredMods;
    std::vector<ModInfo> enabledMods;
    std::string version;
    int64_t checksum = 0;
    std::string region = kUnknownRegion;
    bool hidden = false;
    std::optional<std::string> token;
    std::string key;

    net::Endpoint endpoint() const { return net::Endpoint{ip, port}; }
};

using StorageFields = std::map<std::string, std::string>;

// Flat string form written to the registry backend. Mod lists are compact JSON arrays.
StorageFields ToStorageFields(const Listing &listing);

// Lenient inverse of ToStorageFields: missing port becomes kDefaultListingPort,
// unparsable numbers become 0 and hasPassword follows the stored password.
Listing FromStorageFields(const StorageFields &fields);

// Client-facing JSON. The password is always blanked. With realTypes numbers and
// booleans are native JSON values and mod lists are arrays; otherwise every
// scalar is a string and mod lists are JSON-encoded strings.
json::Value ToJson(const Listing &listing, bool realTypes);

json::Value ToJson(const ModInfo &mod);

// Accepts an array or a JSON-encoded array. Non-string entries are dropped,
// strings are trimmed, empties removed and duplicates collapsed.
std::vector<std::string> NormalizeRequiredMods(const json::Value &value);

// Accepts an array or a JSON-encoded array of objects. String fields are trimmed;
// entries without id or name are dropped and ids deduplicated (first wins).
std::vector<ModInfo> NormalizeEnabledMods(const json::Value &value);

std::vector<std::string> ModIds(const std::vector<ModInfo> &mods);

std::string TrimCopy(const std::string &text);

} // namespace masterlist::registry
