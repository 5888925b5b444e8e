#pragma once

#include "common/json.hpp"
#include "net/endpoint.hpp"
#include "registry/listing.hpp"
#include "registry/registry_backend.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace masterlist::registry {

constexpr const char *kListingKeyPrefix = "servers:";
constexpr const char *kKnownKeysSetKey = "ms:servers:known";
constexpr const char *kServerMetaHashKey = "ms:servers:meta";

// Last known identity of an announced server, kept after its listing expires.
struct ServerMeta {
    std::string name;
    std::string map;
    std::string playlist;
    std::vector<std::string> requiredMods;
    std::vector<ModInfo> enabledMods;
};

ServerMeta MetaFromListing(const Listing &listing);

// Typed view of the registry on top of a RegistryBackend.
class RegistryStore {
public:
    explicit RegistryStore(RegistryBackend &backend);

    // Upsert by endpoint key; the TTL restarts on every call. Throws RegistryUnavailable.
    void put(const Listing &listing, std::chrono::seconds ttl);

    // Listing queries. A backend failure is logged and yields an empty result.
    json::Value getAll(bool realTypes);
    std::vector<Listing> listings();

    // Throw RegistryUnavailable.
    std::vector<Listing> fetchListings();
    std::optional<Listing> getByEndpoint(const std::string &ip, int port);
    std::optional<Listing> getByToken(const std::string &token);
    std::set<std::string> allKeys();
    std::set<std::string> knownKeys();
    void replaceKnownKeys(const std::set<std::string> &keys);

    void upsertMeta(const net::Endpoint &endpoint, const ServerMeta &meta);
    std::optional<ServerMeta> getMeta(const net::Endpoint &endpoint);
    void removeMeta(const net::Endpoint &endpoint);

    RegistryBackend &backend() { return store; }

private:
    RegistryBackend &store;
};

} // namespace masterlist::registry
