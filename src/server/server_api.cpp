#include "server/server_api.hpp"

#include "registry/listing_validation.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace masterlist::server {

namespace {

constexpr const char *kMappedIPv4Prefix = "::ffff:";

std::string stringField(const json::Value &body, const char *key) {
    const auto it = body.find(key);
    return (it != body.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::string firstHop(const std::string &header) {
    return registry::TrimCopy(header.substr(0, header.find(',')));
}

long long playerCountOf(const json::Value &listing) {
    return registry::ReadIntegerField(listing, "playerCount").value_or(0);
}

bool isHidden(const json::Value &listing) {
    const auto it = listing.find("hidden");
    if (it == listing.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    return !(it->is_string() && it->get<std::string>() == "false");
}

ApiResponse internalError() {
    return ErrorResponse(500, registry::kInternalErrorMessage);
}

} // namespace

RequestContext ResolveRequestContext(const ForwardingHeaders &headers, const std::string &peerAddress) {
    RequestContext context;
    if (!headers.pseudoIPv4.empty()) {
        context.clientIp = firstHop(headers.pseudoIPv4);
    } else if (!headers.connectingIp.empty()) {
        context.clientIp = firstHop(headers.connectingIp);
    } else if (!headers.forwardedFor.empty()) {
        context.clientIp = firstHop(headers.forwardedFor);
    } else {
        context.clientIp = peerAddress;
    }

    if (context.clientIp.rfind(kMappedIPv4Prefix, 0) == 0) {
        context.clientIp.erase(0, std::char_traits<char>::length(kMappedIPv4Prefix));
    }

    const std::string country = registry::TrimCopy(headers.country);
    if (!country.empty()) {
        context.region = country;
    }
    return context;
}

ApiResponse ErrorResponse(int status, const std::string &message) {
    return ApiResponse{status, json::Value{{"success", false}, {"error", message}}};
}

ServerApi::ServerApi(registry::RegistryStore &store,
                     registry::RegistrationHandler &registration,
                     const registry::VersionCatalog &catalog,
                     ApiSettings settings)
    : store(store),
      registration(registration),
      catalog(catalog),
      settings(std::move(settings)) {}

ApiResponse ServerApi::addServer(const json::Value &body, const RequestContext &context) {
    registry::RequestOrigin origin;
    origin.ip = context.clientIp;
    origin.region = context.region;

    registry::ValidationResult validation = registry::ValidateRegistration(body, origin, catalog);
    if (!validation.ok) {
        spdlog::debug("ServerApi: Rejected registration from {}: {}", origin.ip, validation.error);
        return ErrorResponse(400, validation.error);
    }

    const registry::RegistrationResult result = registration.registerServer(std::move(validation.listing));
    switch (result.error) {
        case registry::RegistrationError::None:
            break;
        case registry::RegistrationError::VerificationTimedOut:
            return ErrorResponse(400, result.message);
        case registry::RegistrationError::StoreUnavailable:
        case registry::RegistrationError::Internal:
            return internalError();
    }

    json::Value response{
        {"success", true},
        {"token", result.token ? json::Value(*result.token) : json::Value(nullptr)},
        {"ip", result.ip},
        {"port", result.port}
    };
    return ApiResponse{200, std::move(response)};
}

ApiResponse ServerApi::listServers(const json::Value &body) {
    const std::string version = stringField(body, "version");
    const std::string password = stringField(body, "password");
    const bool privileged = !settings.adminKey.empty() && password == settings.adminKey;

    json::Value servers = store.getAll(catalog.usesRealTypes(version));
    if (!servers.is_array()) {
        return internalError();
    }

    if (!privileged) {
        json::Value visible = json::Array();
        for (auto &server : servers) {
            if (!version.empty() && stringField(server, "version") != version) {
                continue;
            }
            if (isHidden(server)) {
                continue;
            }
            server.erase("version");
            visible.push_back(std::move(server));
        }
        servers = std::move(visible);
    }

    auto &ordered = servers.get_ref<json::Value::array_t &>();
    std::stable_sort(ordered.begin(), ordered.end(), [](const json::Value &a, const json::Value &b) {
        return playerCountOf(a) > playerCountOf(b);
    });

    if (!version.empty() && !catalog.isSupported(version)) {
        return ApiResponse{200, json::Value{{"success", true}, {"servers", updateRequiredListings()}}};
    }
    return ApiResponse{200, json::Value{{"success", true}, {"servers", std::move(servers)}}};
}

ApiResponse ServerApi::verifyPassword(const json::Value &body) {
    const std::string ip = stringField(body, "ip");
    const auto port = registry::ReadIntegerField(body, "port");
    const std::string password = stringField(body, "password");
    if (ip.empty() || !port || *port == 0 || password.empty()) {
        return ErrorResponse(400, "Missing required fields.");
    }
    if (!net::IsValidPort(*port)) {
        return ErrorResponse(404, "Server not found.");
    }

    try {
        const auto listing = store.getByEndpoint(ip, static_cast<int>(*port));
        if (!listing) {
            return ErrorResponse(404, "Server not found.");
        }
        if (!listing->hasPassword) {
            return ErrorResponse(400, "Server is not password protected.");
        }
        if (listing->password != password) {
            return ErrorResponse(401, "Incorrect password.");
        }
        return ApiResponse{200, json::Value{{"success", true}}};
    } catch (const registry::RegistryUnavailable &ex) {
        spdlog::error("ServerApi: verifyPassword failed: {}", ex.what());
        return internalError();
    }
}

ApiResponse ServerApi::findByToken(const json::Value &body) {
    const std::string token = stringField(body, "token");
    if (token.empty()) {
        return ErrorResponse(400, "Missing token.");
    }

    try {
        const auto listing = store.getByToken(token);
        if (!listing) {
            return ErrorResponse(404, "Server not found.");
        }
        const bool realTypes = catalog.usesRealTypes(stringField(body, "version"));
        return ApiResponse{200, json::Value{{"success", true}, {"server", registry::ToJson(*listing, realTypes)}}};
    } catch (const registry::RegistryUnavailable &ex) {
        spdlog::error("ServerApi: Token lookup failed: {}", ex.what());
        return internalError();
    }
}

json::Value ServerApi::updateRequiredListings() const {
    auto placeholder = [](const std::string &name, const std::string &description, const std::string &playlist) {
        return json::Value{
            {"name", name},
            {"description", description},
            {"playlist", playlist},
            {"map", ""},
            {"ip", "::1"},
            {"port", 0},
            {"key", ""},
            {"hidden", false},
            {"playerCount", 0},
            {"maxPlayers", 0},
            {"checksum", 0},
            {"hasPassword", false}
        };
    };

    const std::string link = settings.updateUrl.empty() ? std::string("the official site") : settings.updateUrl;
    json::Value listings = json::Array();
    listings.push_back(placeholder("--- UPDATE REQUIRED ---",
                                   "Your version is no longer supported. Please update to continue playing.",
                                   "Visit: " + link));
    listings.push_back(placeholder("Get the New Version Here",
                                   "The download link is available at " + link + ".",
                                   link));
    return listings;
}

} // namespace masterlist::server
