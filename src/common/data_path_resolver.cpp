#include "common/data_path_resolver.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include <limits.h>
#include <unistd.h>

namespace {

constexpr const char *kDataDirEnvVar = "MASTERLIST_DATA_DIR";

std::filesystem::path TryCanonical(const std::filesystem::path &path) {
    std::error_code ec;
    auto result = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return result;
    }

    result = std::filesystem::absolute(path, ec);
    if (!ec) {
        return result;
    }

    return path;
}

std::filesystem::path executableDirectory() {
    std::array<char, PATH_MAX> buffer{};
    const ssize_t length = ::readlink("/proc/self/exe", buffer.data(), buffer.size());
    if (length <= 0 || static_cast<size_t>(length) >= buffer.size()) {
        return std::filesystem::current_path();
    }
    return TryCanonical(std::filesystem::path(buffer.data(), buffer.data() + length)).parent_path();
}

std::mutex g_dataRootMutex;
std::optional<std::filesystem::path> g_dataRootOverride;
bool g_dataRootInitialized = false;

std::filesystem::path ValidateDataRootCandidate(const std::filesystem::path &path) {
    const auto canonical = TryCanonical(path);
    std::error_code ec;
    if (!std::filesystem::exists(canonical, ec) || !std::filesystem::is_directory(canonical, ec)) {
        throw std::runtime_error("data_path_resolver: Data directory is invalid: " + canonical.string());
    }
    return canonical;
}

std::filesystem::path DetectDataRoot(const std::optional<std::filesystem::path> &overridePath) {
    if (overridePath) {
        return ValidateDataRootCandidate(*overridePath);
    }

    const char *envDataDir = std::getenv(kDataDirEnvVar);
    if (envDataDir && *envDataDir != '\0') {
        return ValidateDataRootCandidate(envDataDir);
    }

    const auto besideExecutable = executableDirectory() / "data";
    std::error_code ec;
    if (std::filesystem::is_directory(besideExecutable, ec)) {
        return TryCanonical(besideExecutable);
    }

    return ValidateDataRootCandidate(std::filesystem::current_path() / "data");
}

} // namespace

namespace masterlist::data {

const std::filesystem::path &DataRoot() {
    static std::once_flag initFlag;
    static std::filesystem::path root;

    std::call_once(initFlag, [] {
        std::optional<std::filesystem::path> overrideCopy;
        {
            std::lock_guard<std::mutex> lock(g_dataRootMutex);
            overrideCopy = g_dataRootOverride;
        }

        root = DetectDataRoot(overrideCopy);

        std::lock_guard<std::mutex> lock(g_dataRootMutex);
        g_dataRootInitialized = true;
    });

    return root;
}

void SetDataRootOverride(const std::filesystem::path &path) {
    std::lock_guard<std::mutex> lock(g_dataRootMutex);
    if (g_dataRootInitialized) {
        throw std::runtime_error("data_path_resolver: Data root already initialized; override must be set earlier");
    }

    g_dataRootOverride = ValidateDataRootCandidate(path);
}

std::filesystem::path Resolve(const std::filesystem::path &relativePath) {
    if (relativePath.is_absolute()) {
        return TryCanonical(relativePath);
    }
    return TryCanonical(DataRoot() / relativePath);
}

std::optional<masterlist::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                    const std::string &label,
                                                    spdlog::level::level_enum missingLevel) {
    if (!std::filesystem::exists(path)) {
        spdlog::log(missingLevel, "data_path_resolver: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("data_path_resolver: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        masterlist::json::Value json;
        stream >> json;
        return json;
    } catch (const std::exception &e) {
        spdlog::error("data_path_resolver: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

} // namespace masterlist::data
