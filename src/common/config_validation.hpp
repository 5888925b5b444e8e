#pragma once

#include <string>
#include <vector>

namespace masterlist::config {

enum class RequiredType {
    Bool,
    UInt16,
    Integer,
    String,
    Array
};

struct RequiredKey {
    const char* path;
    RequiredType type;
};

struct ValidationIssue {
    std::string path;
    std::string message;
};

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys);

std::vector<RequiredKey> ServerRequiredKeys();

} // namespace masterlist::config
