#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace masterlist::data {

// Resolve paths located under the runtime data directory.
std::filesystem::path Resolve(const std::filesystem::path &relativePath);

// Overrides the detected data directory. Must be called before the first Resolve/DataRoot invocation.
void SetDataRootOverride(const std::filesystem::path &path);

std::optional<masterlist::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                    const std::string &label,
                                                    spdlog::level::level_enum missingLevel);

// Returns the detected runtime data directory.
const std::filesystem::path &DataRoot();

} // namespace masterlist::data
