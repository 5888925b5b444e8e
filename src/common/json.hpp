#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace masterlist::json {

using Value = nlohmann::json;

inline Value Parse(std::string_view text) {
    return Value::parse(text);
}

// Returns nullopt instead of throwing on malformed input.
inline std::optional<Value> TryParse(std::string_view text) {
    Value parsed = Value::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

inline Value Object() {
    return Value::object();
}

inline Value Array() {
    return Value::array();
}

template <typename T>
inline Value Array(std::initializer_list<T> values) {
    return Value(values);
}

inline std::string Dump(const Value& value, int indent = -1) {
    return value.dump(indent);
}

} // namespace masterlist::json
