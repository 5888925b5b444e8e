#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace masterlist::config {

struct ConfigFileSpec {
    std::filesystem::path path;
    std::string label;
    spdlog::level::level_enum missingLevel = spdlog::level::warn;
    bool required = false;
    bool resolveRelativeToDataRoot = true;
};

// Process-wide layered JSON configuration. File layers merge in the order given;
// runtime layers (command line overrides) merge on top of all files.
//
// Paths are dotted with optional array indices: "versions[0].name".
// Get() returns a pointer into the merged tree; it stays valid until the next
// Initialize/Reset or runtime layer change, which in the server only happen
// during startup.
class ConfigStore {
public:
    static void Initialize(const std::vector<ConfigFileSpec> &fileSpecs);
    static void Reset();
    static bool Initialized();
    // Bumped on every change to the merged tree.
    static uint64_t Revision();

    static const masterlist::json::Value *Get(std::string_view path);
    static std::optional<masterlist::json::Value> GetCopy(std::string_view path);

    // Replaces an existing runtime layer with the same label.
    static bool AddRuntimeLayer(const std::string &label, const masterlist::json::Value &layerJson);
    static bool RemoveRuntimeLayer(const std::string &label);
    static const masterlist::json::Value *LayerByLabel(const std::string &label);
};

// Deep merge: objects merge key by key, anything else in source replaces destination.
void MergeJsonObjects(masterlist::json::Value &destination, const masterlist::json::Value &source);

} // namespace masterlist::config
