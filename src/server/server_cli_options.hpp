#pragma once

#include <cstdint>
#include <string>

namespace masterlist::server {

struct ServerCLIOptions {
    uint16_t httpPort = 0;
    bool httpPortExplicit = false;
    std::string backend;
    bool backendExplicit = false;
    std::string dataDir;
    std::string userConfigPath;
    bool dataDirExplicit = false;
    bool userConfigExplicit = false;
    bool verbose = false;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

ServerCLIOptions ParseServerCLIOptions(int argc, char *argv[]);

} // namespace masterlist::server
