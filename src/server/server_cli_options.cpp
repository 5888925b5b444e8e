#include "server/server_cli_options.hpp"

#include "cxxopts.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cstdlib>
#include <iostream>

namespace masterlist::server {

ServerCLIOptions ParseServerCLIOptions(int argc, char *argv[]) {
    cxxopts::Options options("masterlist-server", "Game server master list");
    options.add_options()
        ("p,port", "HTTP listen port (overrides http.Port)", cxxopts::value<uint16_t>())
        ("b,backend", "Registry backend: memory or redis (overrides registry.Backend)", cxxopts::value<std::string>())
        ("d,data-dir", "Data directory (overrides MASTERLIST_DATA_DIR)", cxxopts::value<std::string>())
        ("c,config", "User config file path", cxxopts::value<std::string>())
        ("L,log-level", "Log level: trace, debug, info, warn, err, critical, off", cxxopts::value<std::string>())
        ("v,verbose", "Enable verbose logging (same as --log-level trace)")
        ("T,timestamp-logging", "Prefix log lines with timestamps")
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    ServerCLIOptions parsed;
    if (result.count("port")) {
        parsed.httpPort = result["port"].as<uint16_t>();
        parsed.httpPortExplicit = true;
    }
    if (result.count("backend")) {
        parsed.backend = result["backend"].as<std::string>();
        parsed.backendExplicit = true;
        if (parsed.backend != "memory" && parsed.backend != "redis") {
            throw std::runtime_error("Unknown backend '" + parsed.backend + "' (expected memory or redis)");
        }
    }
    if (result.count("log-level")) {
        parsed.logLevel = result["log-level"].as<std::string>();
        parsed.logLevelExplicit = true;
        const auto level = spdlog::level::from_str(parsed.logLevel);
        if (level == spdlog::level::off && parsed.logLevel != "off") {
            throw std::runtime_error("Unknown log level '" + parsed.logLevel + "'");
        }
    }

    parsed.dataDir = result.count("data-dir") ? result["data-dir"].as<std::string>() : std::string();
    parsed.userConfigPath = result.count("config") ? result["config"].as<std::string>() : std::string();
    parsed.dataDirExplicit = result.count("data-dir") > 0;
    parsed.userConfigExplicit = result.count("config") > 0;
    parsed.verbose = result.count("verbose") > 0;
    parsed.timestampLogging = result.count("timestamp-logging") > 0;
    return parsed;
}

} // namespace masterlist::server
