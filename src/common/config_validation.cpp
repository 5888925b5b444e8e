#include "common/config_validation.hpp"

#include "common/config_store.hpp"
#include "common/json.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

using masterlist::config::RequiredKey;
using masterlist::config::RequiredType;

bool IsBoolLike(const masterlist::json::Value& value) {
    if (value.is_boolean() || value.is_number_integer()) {
        return true;
    }
    if (!value.is_string()) {
        return false;
    }
    std::string text = value.get<std::string>();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text == "true" || text == "false" || text == "1" || text == "0"
        || text == "yes" || text == "no" || text == "on" || text == "off";
}

bool IsUInt16Like(const masterlist::json::Value& value) {
    if (value.is_number_integer()) {
        const auto raw = value.get<long long>();
        return raw >= 0 && raw <= std::numeric_limits<uint16_t>::max();
    }
    return false;
}

bool IsValidType(const masterlist::json::Value& value, RequiredType type) {
    switch (type) {
    case RequiredType::Bool:
        return IsBoolLike(value);
    case RequiredType::UInt16:
        return IsUInt16Like(value);
    case RequiredType::Integer:
        return value.is_number_integer();
    case RequiredType::String:
        return value.is_string();
    case RequiredType::Array:
        return value.is_array();
    }
    return false;
}

const char* TypeLabel(RequiredType type) {
    switch (type) {
    case RequiredType::Bool:
        return "bool";
    case RequiredType::UInt16:
        return "uint16";
    case RequiredType::Integer:
        return "integer";
    case RequiredType::String:
        return "string";
    case RequiredType::Array:
        return "array";
    }
    return "unknown";
}

} // namespace

namespace masterlist::config {

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys) {
    std::vector<ValidationIssue> issues;
    for (const auto& entry : keys) {
        const auto* value = ConfigStore::Get(entry.path);
        if (!value) {
            issues.push_back({entry.path, "missing required config"});
            continue;
        }
        if (!IsValidType(*value, entry.type)) {
            issues.push_back({entry.path, std::string("invalid type (expected ") + TypeLabel(entry.type) + ")"});
        }
    }
    return issues;
}

std::vector<RequiredKey> ServerRequiredKeys() {
    return {
        {"http.Host", RequiredType::String},
        {"http.Port", RequiredType::UInt16},
        {"registry.Backend", RequiredType::String},
        {"registry.ServerTtlSeconds", RequiredType::Integer},
        {"verification.TimeoutMs", RequiredType::Integer},
        {"presence.Enabled", RequiredType::Bool},
        {"presence.DiffIntervalSeconds", RequiredType::Integer},
        {"presence.CountIntervalSeconds", RequiredType::Integer},
        {"presence.SummaryIntervalSeconds", RequiredType::Integer},
        {"versions", RequiredType::Array}
    };
}

} // namespace masterlist::config
