#include "spdlog/spdlog.h"
#include "common/clock.hpp"
#include "common/config_helpers.hpp"
#include "common/config_store.hpp"
#include "common/config_validation.hpp"
#include "common/data_path_resolver.hpp"
#include "common/scheduler.hpp"
#include "presence/log_presence_sink.hpp"
#include "presence/presence_tracker.hpp"
#include "presence/webhook_presence_sink.hpp"
#include "registry/memory_backend.hpp"
#include "registry/redis_backend.hpp"
#include "registry/registration_handler.hpp"
#include "registry/registry_store.hpp"
#include "registry/version_catalog.hpp"
#include "server/http_api.hpp"
#include "server/server_api.hpp"
#include "server/server_cli_options.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using namespace masterlist;

namespace {

constexpr auto kMaxIdleSleep = std::chrono::milliseconds(200);

std::atomic<bool> g_running{true};

void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp) {
    spdlog::set_level(level);
    if (includeTimestamp) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } else {
        spdlog::set_pattern("[%^%l%$] %v");
    }
}

/**
 * Signal handler for graceful shutdown.
 *
 * @param signum The signal number.
 */
void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

std::unique_ptr<registry::RegistryBackend> CreateBackend(const std::string &kind, const Clock &clock) {
    if (kind == "memory") {
        spdlog::info("main: Using in-process registry backend");
        return std::make_unique<registry::MemoryBackend>(clock);
    }
    if (kind == "redis") {
        registry::RedisSettings redis;
        redis.host = config::ReadStringConfig("registry.RedisHost", redis.host);
        redis.port = config::ReadUInt16Config({"registry.RedisPort"}, redis.port);
        redis.password = config::ReadStringConfig("registry.RedisPassword", "");
        if (const char *envPassword = std::getenv("MASTERLIST_REDIS_PASSWORD")) {
            redis.password = envPassword;
        }
        auto backend = std::make_unique<registry::RedisBackend>(redis);
        if (!backend->ping()) {
            spdlog::warn("main: Redis at {}:{} is not reachable yet; registrations will fail until it is",
                         redis.host, redis.port);
        }
        return backend;
    }
    return nullptr;
}

} // namespace

int main(int argc, char *argv[]) {
    ConfigureLogging(spdlog::level::info, false);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    server::ServerCLIOptions cliOptions;
    try {
        cliOptions = server::ParseServerCLIOptions(argc, argv);
    } catch (const std::exception &ex) {
        spdlog::error("Failed to parse server command line options: {}", ex.what());
        return 1;
    }

    spdlog::level::level_enum logLevel = spdlog::level::info;
    if (cliOptions.verbose) {
        logLevel = spdlog::level::trace;
    } else if (cliOptions.logLevelExplicit) {
        logLevel = spdlog::level::from_str(cliOptions.logLevel);
    }
    ConfigureLogging(logLevel, cliOptions.timestampLogging);

    try {
        if (cliOptions.dataDirExplicit) {
            data::SetDataRootOverride(cliOptions.dataDir);
        }
        spdlog::debug("main: Data directory {}", data::DataRoot().string());
    } catch (const std::exception &ex) {
        spdlog::error("main: {}", ex.what());
        return 1;
    }

    std::vector<config::ConfigFileSpec> configSpecs = {
        {"config.json", "data/config.json", spdlog::level::err, true, true}
    };
    if (cliOptions.userConfigExplicit) {
        configSpecs.push_back({cliOptions.userConfigPath, "user config", spdlog::level::warn, false, false});
    }
    config::ConfigStore::Initialize(configSpecs);

    json::Value cliLayer = json::Object();
    if (cliOptions.httpPortExplicit) {
        cliLayer["http"]["Port"] = cliOptions.httpPort;
    }
    if (cliOptions.backendExplicit) {
        cliLayer["registry"]["Backend"] = cliOptions.backend;
    }
    if (!cliLayer.empty()) {
        config::ConfigStore::AddRuntimeLayer("command line", cliLayer);
    }

    const auto issues = config::ValidateRequiredKeys(config::ServerRequiredKeys());
    if (!issues.empty()) {
        for (const auto &issue : issues) {
            spdlog::error("main: Config '{}' {}", issue.path, issue.message);
        }
        return 1;
    }

    SteadyClock clock;
    const std::string backendKind = config::ReadStringConfig("registry.Backend", "memory");
    std::unique_ptr<registry::RegistryBackend> backend = CreateBackend(backendKind, clock);
    if (!backend) {
        spdlog::error("main: Unknown registry backend '{}'", backendKind);
        return 1;
    }

    const registry::VersionCatalog catalog =
        registry::VersionCatalog::FromJson(config::ConfigStore::GetCopy("versions").value_or(json::Array()));
    if (const auto latest = catalog.latestVersion()) {
        spdlog::info("main: {} client version(s) known, latest {}", catalog.size(), *latest);
    } else {
        spdlog::warn("main: No client versions configured; only hidden servers can register");
    }

    registry::RegistryStore store(*backend);

    registry::RegistrationSettings registrationSettings;
    registrationSettings.verificationTimeout = std::chrono::milliseconds(
        std::max(1, config::ReadIntConfig({"verification.TimeoutMs"}, 800)));
    registrationSettings.serverTtl = std::chrono::seconds(
        std::max(1, config::ReadIntConfig({"registry.ServerTtlSeconds"}, 30)));
    registrationSettings.challengeUid =
        config::ReadUInt64Config("verification.ChallengeUid", registry::kDefaultChallengeUid);
    registry::RegistrationHandler registration(store, registrationSettings);

    Scheduler scheduler(clock);

    presence::PresenceSettings presenceSettings;
    presenceSettings.diffInterval = std::chrono::seconds(
        config::ReadIntConfig({"presence.DiffIntervalSeconds"}, 15));
    presenceSettings.countInterval = std::chrono::seconds(
        std::max(1, config::ReadIntConfig({"presence.CountIntervalSeconds"}, 600)));
    presenceSettings.summaryInterval = std::chrono::seconds(
        std::max(1, config::ReadIntConfig({"presence.SummaryIntervalSeconds"}, 300)));
    presence::PresenceTracker tracker(store, presenceSettings);
    if (config::ReadBoolConfig({"presence.Enabled"}, true)) {
        tracker.addSink(std::make_unique<presence::LogPresenceSink>());
        const std::string webhookUrl = config::ReadStringConfig("presence.WebhookUrl", "");
        if (!webhookUrl.empty()) {
            tracker.addSink(std::make_unique<presence::WebhookPresenceSink>(webhookUrl));
        }
        tracker.start(scheduler);
    }

    server::ApiSettings apiSettings;
    apiSettings.adminKey = config::ReadStringConfig("api.AdminKey", "");
    if (const char *envKey = std::getenv("MASTERLIST_ADMIN_KEY")) {
        apiSettings.adminKey = envKey;
    }
    apiSettings.updateUrl = config::ReadStringConfig("api.UpdateUrl", "");
    server::ServerApi api(store, registration, catalog, apiSettings);

    server::HttpSettings httpSettings;
    httpSettings.host = config::ReadStringConfig("http.Host", httpSettings.host);
    httpSettings.port = config::ReadUInt16Config({"http.Port"}, httpSettings.port);
    httpSettings.threads = static_cast<std::size_t>(
        std::max(1, config::ReadIntConfig({"http.Threads"}, static_cast<int>(httpSettings.threads))));
    server::HttpApi http(api, httpSettings);
    if (!http.start()) {
        return 1;
    }

    spdlog::trace("Starting main loop");
    while (g_running) {
        scheduler.update();

        auto sleepFor = kMaxIdleSleep;
        if (const auto due = scheduler.nextDue()) {
            const auto untilDue = std::chrono::duration_cast<std::chrono::milliseconds>(*due - clock.now());
            sleepFor = std::clamp(untilDue, std::chrono::milliseconds(1), kMaxIdleSleep);
        }
        std::this_thread::sleep_for(sleepFor);
    }

    spdlog::info("Interrupt received. Shutting down...");
    http.stop();
    tracker.stop();
    spdlog::info("Server shutdown complete");
    return 0;
}
