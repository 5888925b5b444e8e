#include "registry/listing.hpp"

#include <charconv>
#include <unordered_set>

namespace masterlist::registry {

namespace {

constexpr const char *kWhitespace = " \t\r\n\f\v";

template <typename T>
std::optional<T> parseNumber(const std::string &text) {
    const std::string trimmed = TrimCopy(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    T value{};
    const char *begin = trimmed.data();
    const char *end = begin + trimmed.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::string fieldOr(const StorageFields &fields, const char *name, const std::string &fallback = {}) {
    const auto it = fields.find(name);
    return it == fields.end() ? fallback : it->second;
}

const char *boolString(bool value) {
    return value ? "true" : "false";
}

std::string stringMember(const json::Value &object, const char *name) {
    const auto it = object.find(name);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return TrimCopy(it->get<std::string>());
}

// Mod lists arrive either as arrays or as JSON text of an array.
std::optional<json::Value> arrayFrom(const json::Value &value) {
    if (value.is_array()) {
        return value;
    }
    if (value.is_string()) {
        auto parsed = json::TryParse(value.get<std::string>());
        if (parsed && parsed->is_array()) {
            return parsed;
        }
    }
    return std::nullopt;
}

json::Value requiredModsJson(const std::vector<std::string> &mods) {
    json::Value array = json::Array();
    for (const auto &mod : mods) {
        array.push_back(mod);
    }
    return array;
}

json::Value enabledModsJson(const std::vector<ModInfo> &mods) {
    json::Value array = json::Array();
    for (const auto &mod : mods) {
        array.push_back(ToJson(mod));
    }
    return array;
}

} // namespace

std::string TrimCopy(const std::string &text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

json::Value ToJson(const ModInfo &mod) {
    return json::Value{
        {"id", mod.id},
        {"name", mod.name},
        {"author", mod.author},
        {"version", mod.version},
        {"thunderstore_id", mod.thunderstoreId},
        {"description", mod.description}
    };
}

std::vector<std::string> NormalizeRequiredMods(const json::Value &value) {
    std::vector<std::string> mods;
    const auto array = arrayFrom(value);
    if (!array) {
        return mods;
    }

    std::unordered_set<std::string> seen;
    for (const auto &entry : *array) {
        if (!entry.is_string()) {
            continue;
        }
        std::string id = TrimCopy(entry.get<std::string>());
        if (id.empty() || !seen.insert(id).second) {
            continue;
        }
        mods.push_back(std::move(id));
    }
    return mods;
}

std::vector<ModInfo> NormalizeEnabledMods(const json::Value &value) {
    std::vector<ModInfo> mods;
    const auto array = arrayFrom(value);
    if (!array) {
        return mods;
    }

    std::unordered_set<std::string> seen;
    for (const auto &entry : *array) {
        if (!entry.is_object()) {
            continue;
        }
        ModInfo mod;
        mod.id = stringMember(entry, "id");
        mod.name = stringMember(entry, "name");
        mod.author = stringMember(entry, "author");
        mod.version = stringMember(entry, "version");
        mod.thunderstoreId = stringMember(entry, "thunderstore_id");
        mod.description = stringMember(entry, "description");
        if (mod.id.empty() || mod.name.empty() || !seen.insert(mod.id).second) {
            continue;
        }
        mods.push_back(std::move(mod));
    }
    return mods;
}

std::vector<std::string> ModIds(const std::vector<ModInfo> &mods) {
    std::vector<std::string> ids;
    ids.reserve(mods.size());
    for (const auto &mod : mods) {
        ids.push_back(mod.id);
    }
    return ids;
}

StorageFields ToStorageFields(const Listing &listing) {
    StorageFields fields;
    fields["ip"] = listing.ip;
    fields["port"] = std::to_string(listing.port);
    fields["name"] = listing.name;
    fields["description"] = listing.description;
    fields["map"] = listing.map;
    fields["playlist"] = listing.playlist;
    fields["key"] = listing.key;
    fields["hidden"] = boolString(listing.hidden);
    fields["numPlayers"] = std::to_string(listing.playerCount);
    fields["playerCount"] = std::to_string(listing.playerCount);
    fields["maxPlayers"] = std::to_string(listing.maxPlayers);
    fields["version"] = listing.version;
    fields["checksum"] = std::to_string(listing.checksum);
    fields["region"] = listing.region;
    fields["hasPassword"] = boolString(listing.hasPassword);
    fields["requiredMods"] = json::Dump(requiredModsJson(listing.requiredMods));
    fields["enabledMods"] = json::Dump(enabledModsJson(listing.enabledMods));
    if (listing.token) {
        fields["token"] = *listing.token;
    }
    if (listing.hasPassword) {
        fields["password"] = listing.password;
    }
    return fields;
}

Listing FromStorageFields(const StorageFields &fields) {
    Listing listing;
    listing.ip = fieldOr(fields, "ip");
    listing.port = parseNumber<int>(fieldOr(fields, "port")).value_or(kDefaultListingPort);
    listing.name = fieldOr(fields, "name");
    listing.description = fieldOr(fields, "description");
    listing.map = fieldOr(fields, "map");
    listing.playlist = fieldOr(fields, "playlist");
    listing.key = fieldOr(fields, "key");
    listing.hidden = fieldOr(fields, "hidden") == "true";
    listing.playerCount = parseNumber<int>(fieldOr(fields, "playerCount")).value_or(0);
    listing.maxPlayers = parseNumber<int>(fieldOr(fields, "maxPlayers")).value_or(0);
    listing.version = fieldOr(fields, "version");
    listing.checksum = parseNumber<int64_t>(fieldOr(fields, "checksum")).value_or(0);
    listing.region = fieldOr(fields, "region", kUnknownRegion);
    listing.password = fieldOr(fields, "password");
    listing.hasPassword = !listing.password.empty();

    const auto token = fields.find("token");
    if (token != fields.end() && !token->second.empty()) {
        listing.token = token->second;
    }

    listing.requiredMods = NormalizeRequiredMods(json::Value(fieldOr(fields, "requiredMods", "[]")));
    listing.enabledMods = NormalizeEnabledMods(json::Value(fieldOr(fields, "enabledMods", "[]")));
    if (listing.requiredMods.empty() && !listing.enabledMods.empty()) {
        listing.requiredMods = ModIds(listing.enabledMods);
    }
    return listing;
}

json::Value ToJson(const Listing &listing, bool realTypes) {
    json::Value out = json::Object();
    out["ip"] = listing.ip;
    out["name"] = listing.name;
    out["description"] = listing.description;
    out["map"] = listing.map;
    out["playlist"] = listing.playlist;
    out["key"] = listing.key;
    out["version"] = listing.version;
    out["region"] = listing.region;
    out["password"] = "";
    if (listing.token) {
        out["token"] = *listing.token;
    }

    if (realTypes) {
        out["port"] = listing.port;
        out["hidden"] = listing.hidden;
        out["hasPassword"] = listing.hasPassword;
        out["playerCount"] = listing.playerCount;
        out["numPlayers"] = listing.playerCount;
        out["maxPlayers"] = listing.maxPlayers;
        out["checksum"] = listing.checksum;
        out["requiredMods"] = requiredModsJson(listing.requiredMods);
        out["enabledMods"] = enabledModsJson(listing.enabledMods);
    } else {
        out["port"] = std::to_string(listing.port);
        out["hidden"] = boolString(listing.hidden);
        out["hasPassword"] = boolString(listing.hasPassword);
        out["playerCount"] = std::to_string(listing.playerCount);
        out["numPlayers"] = std::to_string(listing.playerCount);
        out["maxPlayers"] = std::to_string(listing.maxPlayers);
        out["checksum"] = std::to_string(listing.checksum);
        out["requiredMods"] = json::Dump(requiredModsJson(listing.requiredMods));
        out["enabledMods"] = json::Dump(enabledModsJson(listing.enabledMods));
    }
    return out;
}

} // namespace masterlist::registry
