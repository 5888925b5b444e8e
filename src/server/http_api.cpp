#include "server/http_api.hpp"

#include "httplib.h"
#include "spdlog/spdlog.h"

#include <functional>

namespace masterlist::server {

namespace {

constexpr const char *kJsonContentType = "application/json";

void writeResponse(httplib::Response &res, const ApiResponse &response) {
    res.status = response.status;
    res.set_content(json::Dump(response.body), kJsonContentType);
}

using JsonHandler = std::function<ApiResponse(const json::Value &, const httplib::Request &)>;

httplib::Server::Handler jsonRoute(const char *route, JsonHandler handler) {
    return [route, handler = std::move(handler)](const httplib::Request &req, httplib::Response &res) {
        const auto body = json::TryParse(req.body);
        if (!body || !body->is_object()) {
            writeResponse(res, ErrorResponse(400, "Request body must be a JSON object."));
            return;
        }
        try {
            writeResponse(res, handler(*body, req));
        } catch (const std::exception &ex) {
            spdlog::error("HttpApi: {} failed: {}", route, ex.what());
            writeResponse(res, ErrorResponse(500, "An internal server error occurred."));
        }
    };
}

RequestContext contextFor(const httplib::Request &req) {
    ForwardingHeaders headers;
    headers.pseudoIPv4 = req.get_header_value("Cf-Pseudo-IPv4");
    headers.connectingIp = req.get_header_value("cf-connecting-ip");
    headers.forwardedFor = req.get_header_value("x-forwarded-for");
    headers.country = req.get_header_value("cf-ipcountry");
    return ResolveRequestContext(headers, req.remote_addr);
}

} // namespace

HttpApi::HttpApi(ServerApi &api, HttpSettings settings)
    : api(api), settings(std::move(settings)), server(std::make_unique<httplib::Server>()) {
    const std::size_t threads = this->settings.threads == 0 ? 1 : this->settings.threads;
    server->new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };
    registerRoutes();
}

HttpApi::~HttpApi() {
    stop();
}

void HttpApi::registerRoutes() {
    server->Post("/api/servers/add", jsonRoute("/api/servers/add",
        [this](const json::Value &body, const httplib::Request &req) {
            return api.addServer(body, contextFor(req));
        }));
    server->Post("/api/servers", jsonRoute("/api/servers",
        [this](const json::Value &body, const httplib::Request &) {
            return api.listServers(body);
        }));
    server->Post("/api/servers/verifyPassword", jsonRoute("/api/servers/verifyPassword",
        [this](const json::Value &body, const httplib::Request &) {
            return api.verifyPassword(body);
        }));
    server->Post("/api/servers/token", jsonRoute("/api/servers/token",
        [this](const json::Value &body, const httplib::Request &) {
            return api.findByToken(body);
        }));

    server->set_logger([](const httplib::Request &req, const httplib::Response &res) {
        spdlog::debug("HttpApi: {} {} -> {}", req.method, req.path, res.status);
    });
}

bool HttpApi::start() {
    if (listener.joinable()) {
        return true;
    }
    if (!server->bind_to_port(settings.host, settings.port)) {
        spdlog::error("HttpApi: Failed to bind {}:{}", settings.host, settings.port);
        return false;
    }
    listener = std::thread([this]() {
        if (!server->listen_after_bind()) {
            spdlog::error("HttpApi: Listener stopped unexpectedly");
        }
    });
    spdlog::info("HttpApi: Listening on {}:{} ({} worker threads)", settings.host, settings.port, settings.threads);
    return true;
}

void HttpApi::stop() {
    if (!listener.joinable()) {
        return;
    }
    server->stop();
    listener.join();
    spdlog::info("HttpApi: Stopped");
}

} // namespace masterlist::server
