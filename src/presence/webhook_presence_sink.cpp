#include "presence/webhook_presence_sink.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "common/curl_global.hpp"

namespace masterlist::presence {

namespace {

constexpr int kSummaryColor = 0x5865F2;

size_t AppendResponse(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<std::string *>(userdata);
    const size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

bool performPost(const std::string &url, const std::string &payload, long &statusOut, std::string &errorOut) {
    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        errorOut = "curl_easy_init failed";
        return false;
    }

    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';
    std::string body;
    curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, AppendResponse);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &body);

    const CURLcode result = curl_easy_perform(curlHandle);
    long status = 0;
    if (result == CURLE_OK) {
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curlHandle);

    statusOut = status;
    if (result != CURLE_OK) {
        errorOut = errorBuffer[0] != '\0' ? std::string(errorBuffer) : std::string(curl_easy_strerror(result));
        return false;
    }
    if (status < 200 || status >= 300) {
        if (const auto parsed = json::TryParse(body); parsed && parsed->is_object()) {
            const auto message = parsed->find("message");
            if (message != parsed->end() && message->is_string()) {
                errorOut = message->get<std::string>();
            }
        }
        return false;
    }
    return true;
}

std::string displayName(const ServerIdentity &server) {
    return server.name.empty() ? std::string("Unknown server") : server.name;
}

} // namespace

json::Value OnlineMessage(const ServerIdentity &server) {
    std::string content = "\xF0\x9F\x9F\xA2 **" + displayName(server) + "** is online";
    if (!server.map.empty() || !server.playlist.empty()) {
        content += " (" + server.map;
        if (!server.playlist.empty()) {
            content += (server.map.empty() ? "" : " / ") + server.playlist;
        }
        content += ")";
    }
    return json::Value{{"content", content}};
}

json::Value OfflineMessage(const ServerIdentity &server) {
    return json::Value{{"content", "\xF0\x9F\x94\xB4 **" + displayName(server) + "** went offline"}};
}

json::Value CountsMessage(std::size_t servers, int64_t players) {
    return json::Value{{"content", "Servers online: " + std::to_string(servers) +
                                   " | Players: " + std::to_string(players)}};
}

json::Value SummaryMessage(const std::string &summary) {
    json::Value embed{
        {"title", "Active Servers"},
        {"description", summary},
        {"color", kSummaryColor},
        {"footer", json::Value{{"text", "Updated"}}}
    };
    return json::Value{{"embeds", json::Value::array({embed})}};
}

WebhookPresenceSink::WebhookPresenceSink(std::string url) : url(std::move(url)) {
    if (!net::EnsureCurlGlobalInit()) {
        spdlog::warn("WebhookPresenceSink: Failed to initialize cURL");
    }
}

WebhookPresenceSink::~WebhookPresenceSink() {
    stopWorker();
}

void WebhookPresenceSink::onServerOnline(const ServerIdentity &server) {
    enqueue(OnlineMessage(server));
}

void WebhookPresenceSink::onServerOffline(const ServerIdentity &server) {
    enqueue(OfflineMessage(server));
}

void WebhookPresenceSink::onCounts(std::size_t servers, int64_t players) {
    enqueue(CountsMessage(servers, players));
}

void WebhookPresenceSink::onSummary(const std::string &summary) {
    enqueue(SummaryMessage(summary));
}

void WebhookPresenceSink::enqueue(json::Value message) {
    if (url.empty()) {
        return;
    }

    startWorker();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (messages.size() >= kMaxQueuedMessages) {
            spdlog::warn("WebhookPresenceSink: Queue full, dropping oldest message");
            messages.pop_front();
        }
        messages.push_back(json::Dump(message));
    }
    cv.notify_one();
}

void WebhookPresenceSink::startWorker() {
    if (worker.joinable()) {
        return;
    }
    stopRequested = false;
    worker = std::thread(&WebhookPresenceSink::workerProc, this);
}

void WebhookPresenceSink::stopWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
        messages.clear();
    }
    cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

void WebhookPresenceSink::workerProc() {
    while (true) {
        std::string payload;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&]() { return stopRequested || !messages.empty(); });
            if (stopRequested) {
                return;
            }
            payload = std::move(messages.front());
            messages.pop_front();
        }

        if (!net::EnsureCurlGlobalInit()) {
            spdlog::warn("WebhookPresenceSink: Failed to initialize cURL");
            continue;
        }

        long status = 0;
        std::string error;
        if (!performPost(url, payload, status, error)) {
            std::string reason = error;
            if (status > 0 && (status < 200 || status >= 300)) {
                if (!reason.empty()) {
                    reason += ", ";
                }
                reason += "http_status=" + std::to_string(status);
            }
            if (reason.empty()) {
                reason = "request failed";
            }
            spdlog::warn("WebhookPresenceSink: Failed to deliver message: {}", reason);
        } else {
            spdlog::debug("WebhookPresenceSink: Delivered message");
        }
    }
}

} // namespace masterlist::presence
