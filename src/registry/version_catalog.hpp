#pragma once

#include "common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace masterlist::registry {

struct VersionInfo {
    std::string name;
    bool supported = false;
    // Clients of this version expect native JSON types in listings.
    bool realTypes = false;
    bool checksumsEnabled = false;
    std::vector<int64_t> checksums;
};

// Read-only lookup of game client versions. Unknown versions are unsupported.
class VersionCatalog {
public:
    VersionCatalog() = default;
    explicit VersionCatalog(std::vector<VersionInfo> versions);

    // Builds from the "versions" config array; malformed entries are skipped.
    static VersionCatalog FromJson(const json::Value &versions);

    const VersionInfo *find(const std::string &name) const;

    bool isSupported(const std::string &name) const;
    bool usesRealTypes(const std::string &name) const;
    bool checksumsEnabled(const std::string &name) const;
    bool isChecksumSupported(int64_t checksum, const std::string &name) const;

    // Highest dotted version number, compared numerically per component.
    std::optional<std::string> latestVersion() const;

    std::size_t size() const { return versions.size(); }

private:
    std::vector<VersionInfo> versions;
};

} // namespace masterlist::registry
