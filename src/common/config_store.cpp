#include "common/config_store.hpp"

#include "common/data_path_resolver.hpp"

#include <algorithm>
#include <charconv>
#include <mutex>

namespace masterlist::config {

namespace {

struct Layer {
    std::string label;
    masterlist::json::Value json;
    bool runtime = false;
};

struct StoreState {
    std::mutex mutex;
    bool initialized = false;
    uint64_t revision = 0;
    std::vector<Layer> layers;
    masterlist::json::Value merged = masterlist::json::Object();
};

StoreState &state() {
    static StoreState instance;
    return instance;
}

// Splits "name[3]" into its key and index. A bare "[3]" has an empty key.
bool parseSegment(std::string_view segment, std::string_view &key, std::optional<std::size_t> &index) {
    index.reset();
    const auto open = segment.find('[');
    if (open == std::string_view::npos) {
        key = segment;
        return !key.empty();
    }
    if (segment.back() != ']' || open + 2 > segment.size() - 1) {
        return false;
    }
    key = segment.substr(0, open);
    const std::string_view digits = segment.substr(open + 1, segment.size() - open - 2);
    std::size_t value = 0;
    const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size()) {
        return false;
    }
    index = value;
    return true;
}

const masterlist::json::Value *walk(const masterlist::json::Value &root, std::string_view path) {
    const masterlist::json::Value *current = &root;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const std::string_view segment = path.substr(0, dot);
        path = dot == std::string_view::npos ? std::string_view() : path.substr(dot + 1);

        std::string_view key;
        std::optional<std::size_t> index;
        if (!parseSegment(segment, key, index)) {
            return nullptr;
        }
        if (!key.empty()) {
            if (!current->is_object()) {
                return nullptr;
            }
            const auto it = current->find(std::string(key));
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        }
        if (index) {
            if (!current->is_array() || *index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[*index];
        }
    }
    return current;
}

std::optional<Layer> loadFileLayer(const ConfigFileSpec &spec) {
    std::filesystem::path path = spec.path;
    if (spec.resolveRelativeToDataRoot && path.is_relative()) {
        path = masterlist::data::Resolve(path);
    }
    const std::string label = spec.label.empty() ? path.string() : spec.label;
    spdlog::trace("ConfigStore: Loading '{}' from {}", label, path.string());

    auto json = masterlist::data::LoadJsonFile(path, label, spec.missingLevel);
    if (!json) {
        if (spec.required) {
            spdlog::error("ConfigStore: Required config missing: {}", path.string());
        }
        return std::nullopt;
    }
    if (!json->is_object()) {
        spdlog::warn("ConfigStore: {} is not a JSON object, skipping", path.string());
        return std::nullopt;
    }
    return Layer{label, std::move(*json), false};
}

// Caller holds the state mutex.
void rebuild(StoreState &s) {
    s.merged = masterlist::json::Object();
    for (const bool runtime : {false, true}) {
        for (const auto &layer : s.layers) {
            if (layer.runtime == runtime) {
                MergeJsonObjects(s.merged, layer.json);
            }
        }
    }
    ++s.revision;
}

} // namespace

void MergeJsonObjects(masterlist::json::Value &destination, const masterlist::json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto &key = it.key();
        const auto &value = it.value();
        auto existing = destination.find(key);
        if (value.is_object() && existing != destination.end() && existing->is_object()) {
            MergeJsonObjects(*existing, value);
        } else {
            destination[key] = value;
        }
    }
}

void ConfigStore::Initialize(const std::vector<ConfigFileSpec> &fileSpecs) {
    std::vector<Layer> loaded;
    for (const auto &spec : fileSpecs) {
        if (auto layer = loadFileLayer(spec)) {
            loaded.push_back(std::move(*layer));
        }
    }

    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.layers = std::move(loaded);
    s.initialized = true;
    rebuild(s);
    spdlog::debug("ConfigStore: {} file layer(s) loaded", s.layers.size());
}

void ConfigStore::Reset() {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.layers.clear();
    s.initialized = false;
    rebuild(s);
}

bool ConfigStore::Initialized() {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.initialized;
}

uint64_t ConfigStore::Revision() {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.revision;
}

const masterlist::json::Value *ConfigStore::Get(std::string_view path) {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.initialized || path.empty()) {
        return nullptr;
    }
    return walk(s.merged, path);
}

std::optional<masterlist::json::Value> ConfigStore::GetCopy(std::string_view path) {
    if (const auto *value = Get(path)) {
        return *value;
    }
    return std::nullopt;
}

bool ConfigStore::AddRuntimeLayer(const std::string &label, const masterlist::json::Value &layerJson) {
    if (!layerJson.is_object()) {
        spdlog::warn("ConfigStore: Runtime layer '{}' ignored, not a JSON object", label);
        return false;
    }
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.initialized) {
        return false;
    }
    auto it = std::find_if(s.layers.begin(), s.layers.end(),
                           [&](const Layer &layer) { return layer.runtime && layer.label == label; });
    if (it != s.layers.end()) {
        it->json = layerJson;
    } else {
        s.layers.push_back(Layer{label, layerJson, true});
    }
    rebuild(s);
    return true;
}

bool ConfigStore::RemoveRuntimeLayer(const std::string &label) {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    const auto removed = std::remove_if(s.layers.begin(), s.layers.end(),
                                        [&](const Layer &layer) { return layer.runtime && layer.label == label; });
    if (removed == s.layers.end()) {
        return false;
    }
    s.layers.erase(removed, s.layers.end());
    rebuild(s);
    return true;
}

const masterlist::json::Value *ConfigStore::LayerByLabel(const std::string &label) {
    StoreState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto &layer : s.layers) {
        if (layer.label == label) {
            return &layer.json;
        }
    }
    return nullptr;
}

} // namespace masterlist::config
