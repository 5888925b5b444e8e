#pragma once

#include "common/json.hpp"
#include "registry/listing.hpp"
#include "registry/version_catalog.hpp"

#include <optional>
#include <string>

namespace masterlist::registry {

constexpr std::size_t kMaxNameLength = 256;
constexpr std::size_t kMaxDescriptionLength = 256;
constexpr std::size_t kMaxMapLength = 32;
constexpr int kMinMaxPlayers = 1;
constexpr int kMaxMaxPlayers = 128;

// Where a registration request came from, as seen by the HTTP layer.
struct RequestOrigin {
    std::string ip;
    std::string region = kUnknownRegion;
};

struct ValidationResult {
    bool ok = false;
    std::string error;
    Listing listing;
};

// Checks a registration body field by field and builds the normalized listing.
// Stops at the first failing rule; performs no I/O.
ValidationResult ValidateRegistration(const json::Value &body,
                                      const RequestOrigin &origin,
                                      const VersionCatalog &catalog);

// True if a server name carries a URL, host name, invite link or IP literal.
bool ContainsLink(const std::string &name);

// Integer field given as a JSON number or a numeric string.
std::optional<long long> ReadIntegerField(const json::Value &object, const char *key);

// Length in code points of a UTF-8 string.
std::size_t Utf8Length(const std::string &text);

} // namespace masterlist::registry
