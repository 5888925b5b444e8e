#pragma once

#include "common/json.hpp"
#include "registry/registration_handler.hpp"
#include "registry/registry_store.hpp"
#include "registry/version_catalog.hpp"

#include <string>

namespace masterlist::server {

struct ForwardingHeaders {
    std::string pseudoIPv4;    // Cf-Pseudo-IPv4
    std::string connectingIp;  // cf-connecting-ip
    std::string forwardedFor;  // x-forwarded-for
    std::string country;       // cf-ipcountry
};

struct RequestContext {
    std::string clientIp;
    std::string region = registry::kUnknownRegion;
};

// Proxy headers win over the socket peer; only the first x-forwarded-for hop is used.
RequestContext ResolveRequestContext(const ForwardingHeaders &headers, const std::string &peerAddress);

struct ApiResponse {
    int status = 200;
    json::Value body;
};

ApiResponse ErrorResponse(int status, const std::string &message);

struct ApiSettings {
    // Callers presenting this key see every listing unfiltered. Empty disables it.
    std::string adminKey;
    // Shown to clients running an unsupported version.
    std::string updateUrl;
};

// Transport-independent handlers for the /api/servers endpoints.
class ServerApi {
public:
    ServerApi(registry::RegistryStore &store,
              registry::RegistrationHandler &registration,
              const registry::VersionCatalog &catalog,
              ApiSettings settings);

    // POST /api/servers/add
    ApiResponse addServer(const json::Value &body, const RequestContext &context);
    // POST /api/servers
    ApiResponse listServers(const json::Value &body);
    // POST /api/servers/verifyPassword
    ApiResponse verifyPassword(const json::Value &body);
    // POST /api/servers/token
    ApiResponse findByToken(const json::Value &body);

private:
    json::Value updateRequiredListings() const;

    registry::RegistryStore &store;
    registry::RegistrationHandler &registration;
    const registry::VersionCatalog &catalog;
    ApiSettings settings;
};

} // namespace masterlist::server
