#include "registry/version_catalog.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace masterlist::registry {

namespace {

bool readBool(const json::Value &object, const char *key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>() != 0;
    }
    return false;
}

std::vector<long long> versionParts(const std::string &name) {
    std::vector<long long> parts;
    std::stringstream stream(name);
    std::string part;
    while (std::getline(stream, part, '.')) {
        std::string digits;
        for (char c : part) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits.push_back(c);
            }
        }
        parts.push_back(digits.empty() ? 0 : std::stoll(digits.substr(0, 18)));
    }
    return parts;
}

bool olderThan(const std::string &lhs, const std::string &rhs) {
    const auto a = versionParts(lhs);
    const auto b = versionParts(rhs);
    const std::size_t count = std::max(a.size(), b.size());
    for (std::size_t i = 0; i < count; ++i) {
        const long long left = i < a.size() ? a[i] : 0;
        const long long right = i < b.size() ? b[i] : 0;
        if (left != right) {
            return left < right;
        }
    }
    return false;
}

} // namespace

VersionCatalog::VersionCatalog(std::vector<VersionInfo> versions) : versions(std::move(versions)) {}

VersionCatalog VersionCatalog::FromJson(const json::Value &entries) {
    std::vector<VersionInfo> parsed;
    if (!entries.is_array()) {
        spdlog::warn("VersionCatalog: 'versions' is not an array; no versions are supported");
        return VersionCatalog(std::move(parsed));
    }

    for (const auto &entry : entries) {
        if (!entry.is_object()) {
            spdlog::warn("VersionCatalog: Skipping non-object version entry");
            continue;
        }
        const auto nameIt = entry.find("name");
        if (nameIt == entry.end() || !nameIt->is_string() || nameIt->get<std::string>().empty()) {
            spdlog::warn("VersionCatalog: Skipping version entry without a name");
            continue;
        }

        VersionInfo info;
        info.name = nameIt->get<std::string>();
        info.supported = readBool(entry, "supported");
        info.realTypes = readBool(entry, "realTypes");
        info.checksumsEnabled = readBool(entry, "checksumsEnabled");
        const auto checksums = entry.find("checksums");
        if (checksums != entry.end() && checksums->is_array()) {
            for (const auto &checksum : *checksums) {
                if (checksum.is_number_integer()) {
                    info.checksums.push_back(checksum.get<int64_t>());
                }
            }
        }
        parsed.push_back(std::move(info));
    }

    spdlog::debug("VersionCatalog: Loaded {} version(s)", parsed.size());
    return VersionCatalog(std::move(parsed));
}

const VersionInfo *VersionCatalog::find(const std::string &name) const {
    const auto it = std::find_if(versions.begin(), versions.end(),
                                 [&](const VersionInfo &info) { return info.name == name; });
    return it == versions.end() ? nullptr : &*it;
}

bool VersionCatalog::isSupported(const std::string &name) const {
    const VersionInfo *info = find(name);
    return info && info->supported;
}

bool VersionCatalog::usesRealTypes(const std::string &name) const {
    const VersionInfo *info = find(name);
    return info && info->realTypes;
}

bool VersionCatalog::checksumsEnabled(const std::string &name) const {
    const VersionInfo *info = find(name);
    return info && info->checksumsEnabled;
}

bool VersionCatalog::isChecksumSupported(int64_t checksum, const std::string &name) const {
    const VersionInfo *info = find(name);
    if (!info) {
        return false;
    }
    return std::find(info->checksums.begin(), info->checksums.end(), checksum) != info->checksums.end();
}

std::optional<std::string> VersionCatalog::latestVersion() const {
    if (versions.empty()) {
        return std::nullopt;
    }
    const auto it = std::max_element(versions.begin(), versions.end(),
                                     [](const VersionInfo &a, const VersionInfo &b) {
                                         return olderThan(a.name, b.name);
                                     });
    return it->name;
}

} // namespace masterlist::registry
