#pragma once

#include "server/server_api.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace masterlist::server {

struct HttpSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    std::size_t threads = 8;
};

// Serves ServerApi over HTTP on a listener thread with its own worker pool.
class HttpApi {
public:
    HttpApi(ServerApi &api, HttpSettings settings);
    ~HttpApi();

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    // Binds the listening socket and starts serving. False if the bind fails.
    bool start();
    void stop();

private:
    void registerRoutes();

    ServerApi &api;
    HttpSettings settings;
    std::unique_ptr<httplib::Server> server;
    std::thread listener;
};

} // namespace masterlist::server
