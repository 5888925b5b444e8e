#include "registry/registry_store.hpp"

#include "spdlog/spdlog.h"

#include <stdexcept>

namespace masterlist::registry {

namespace {

json::Value requiredModsJson(const std::vector<std::string> &mods) {
    json::Value array = json::Array();
    for (const auto &mod : mods) {
        array.push_back(mod);
    }
    return array;
}

std::string stringField(const json::Value &object, const char *key) {
    const auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

} // namespace

ServerMeta MetaFromListing(const Listing &listing) {
    ServerMeta meta;
    meta.name = listing.name;
    meta.map = listing.map;
    meta.playlist = listing.playlist;
    meta.requiredMods = listing.requiredMods;
    meta.enabledMods = listing.enabledMods;
    return meta;
}

RegistryStore::RegistryStore(RegistryBackend &backend) : store(backend) {}

void RegistryStore::put(const Listing &listing, std::chrono::seconds ttl) {
    if (listing.ip.empty()) {
        throw std::invalid_argument("RegistryStore: listing has no ip");
    }
    const std::string key = net::RegistryKey(listing.endpoint());
    store.writeHash(key, ToStorageFields(listing), ttl);
    spdlog::debug("RegistryStore: Stored {} for {}s", key, ttl.count());
}

std::vector<Listing> RegistryStore::fetchListings() {
    std::vector<Listing> result;
    for (const auto &key : store.scanKeys(kListingKeyPrefix)) {
        if (!net::ParseRegistryKey(key)) {
            continue;
        }
        // The entry may expire between the scan and the read.
        const auto fields = store.readHash(key);
        if (!fields) {
            continue;
        }
        result.push_back(FromStorageFields(*fields));
    }
    return result;
}

std::vector<Listing> RegistryStore::listings() {
    try {
        return fetchListings();
    } catch (const RegistryUnavailable &ex) {
        spdlog::warn("RegistryStore: Listing query degraded to empty: {}", ex.what());
        return {};
    }
}

json::Value RegistryStore::getAll(bool realTypes) {
    json::Value array = json::Array();
    for (const auto &listing : listings()) {
        array.push_back(ToJson(listing, realTypes));
    }
    return array;
}

std::optional<Listing> RegistryStore::getByEndpoint(const std::string &ip, int port) {
    const auto fields = store.readHash(net::RegistryKey(net::Endpoint{ip, port}));
    if (!fields || fields->empty()) {
        return std::nullopt;
    }
    return FromStorageFields(*fields);
}

std::optional<Listing> RegistryStore::getByToken(const std::string &token) {
    if (token.empty()) {
        return std::nullopt;
    }
    for (auto &listing : fetchListings()) {
        if (listing.token && *listing.token == token) {
            return std::move(listing);
        }
    }
    return std::nullopt;
}

std::set<std::string> RegistryStore::allKeys() {
    std::set<std::string> keys;
    for (auto &key : store.scanKeys(kListingKeyPrefix)) {
        if (net::ParseRegistryKey(key)) {
            keys.insert(std::move(key));
        }
    }
    return keys;
}

std::set<std::string> RegistryStore::knownKeys() {
    return store.readSet(kKnownKeysSetKey);
}

void RegistryStore::replaceKnownKeys(const std::set<std::string> &keys) {
    store.replaceSet(kKnownKeysSetKey, keys);
}

void RegistryStore::upsertMeta(const net::Endpoint &endpoint, const ServerMeta &meta) {
    json::Value enabled = json::Array();
    for (const auto &mod : meta.enabledMods) {
        enabled.push_back(ToJson(mod));
    }
    const json::Value stored{
        {"name", meta.name},
        {"map", meta.map},
        {"playlist", meta.playlist},
        {"requiredMods", json::Dump(requiredModsJson(meta.requiredMods))},
        {"enabledMods", json::Dump(enabled)}
    };
    store.writeField(kServerMetaHashKey, net::AddressKey(endpoint), json::Dump(stored));
}

std::optional<ServerMeta> RegistryStore::getMeta(const net::Endpoint &endpoint) {
    const auto raw = store.readField(kServerMetaHashKey, net::AddressKey(endpoint));
    if (!raw) {
        return std::nullopt;
    }
    const auto parsed = json::TryParse(*raw);
    if (!parsed || !parsed->is_object()) {
        spdlog::debug("RegistryStore: Discarding unreadable meta for {}", net::AddressKey(endpoint));
        return std::nullopt;
    }

    ServerMeta meta;
    meta.name = stringField(*parsed, "name");
    meta.map = stringField(*parsed, "map");
    meta.playlist = stringField(*parsed, "playlist");
    meta.requiredMods = NormalizeRequiredMods(json::Value(stringField(*parsed, "requiredMods")));
    meta.enabledMods = NormalizeEnabledMods(json::Value(stringField(*parsed, "enabledMods")));
    return meta;
}

void RegistryStore::removeMeta(const net::Endpoint &endpoint) {
    store.deleteField(kServerMetaHashKey, net::AddressKey(endpoint));
}

} // namespace masterlist::registry
