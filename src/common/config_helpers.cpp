#include "common/config_helpers.hpp"

#include "common/config_store.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace masterlist::config {

bool ReadBoolConfig(std::initializer_list<const char*> paths, bool defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ConfigStore::Get(path)) {
            if (value->is_boolean()) {
                return value->get<bool>();
            }
            if (value->is_number_integer()) {
                return value->get<long long>() != 0;
            }
            if (value->is_number_float()) {
                return value->get<double>() != 0.0;
            }
            if (value->is_string()) {
                std::string text = value->get<std::string>();
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (text == "true" || text == "1" || text == "yes" || text == "on") {
                    return true;
                }
                if (text == "false" || text == "0" || text == "no" || text == "off") {
                    return false;
                }
            }
            spdlog::warn("Config '{}' cannot be interpreted as boolean", path);
        }
    }
    return defaultValue;
}

uint16_t ReadUInt16Config(std::initializer_list<const char*> paths, uint16_t defaultValue) {
    for (const char* path : paths) {
        const auto* value = ConfigStore::Get(path);
        if (!value) {
            continue;
        }

        if (value->is_number_integer()) {
            const auto raw = value->get<long long>();
            if (raw > 0 && raw <= std::numeric_limits<uint16_t>::max()) {
                return static_cast<uint16_t>(raw);
            }
            spdlog::warn("Config '{}' must be in 1-65535; falling back", path);
            return defaultValue;
        }

        if (value->is_string()) {
            try {
                const auto parsed = std::stoul(value->get<std::string>());
                if (parsed > 0 && parsed <= std::numeric_limits<uint16_t>::max()) {
                    return static_cast<uint16_t>(parsed);
                }
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid uint16", path);
            }
            return defaultValue;
        }
    }
    return defaultValue;
}

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue) {
    for (const char* path : paths) {
        const auto* value = ConfigStore::Get(path);
        if (!value) {
            continue;
        }
        if (value->is_number_integer()) {
            return value->get<int>();
        }
        if (value->is_number_float()) {
            return static_cast<int>(value->get<double>());
        }
        if (value->is_string()) {
            try {
                return std::stoi(value->get<std::string>());
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid integer", path);
            }
        } else {
            spdlog::warn("Config '{}' cannot be interpreted as integer", path);
        }
    }
    return defaultValue;
}

uint64_t ReadUInt64Config(const char *path, uint64_t defaultValue) {
    const auto* value = ConfigStore::Get(path);
    if (!value) {
        return defaultValue;
    }
    if (value->is_number_unsigned()) {
        return value->get<uint64_t>();
    }
    if (value->is_string()) {
        try {
            return std::stoull(value->get<std::string>());
        } catch (const std::exception &) {
            spdlog::warn("Config '{}' string value is not a valid uint64", path);
        }
    } else {
        spdlog::warn("Config '{}' cannot be interpreted as uint64", path);
    }
    return defaultValue;
}

std::string ReadStringConfig(const char *path, const std::string &defaultValue) {
    if (const auto* value = ConfigStore::Get(path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
    }
    return defaultValue;
}

} // namespace masterlist::config
