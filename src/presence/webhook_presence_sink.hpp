#pragma once

#include "common/json.hpp"
#include "presence/presence_sink.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace masterlist::presence {

// Message bodies in the Discord webhook format. Endpoints are never included.
json::Value OnlineMessage(const ServerIdentity &server);
json::Value OfflineMessage(const ServerIdentity &server);
json::Value CountsMessage(std::size_t servers, int64_t players);
json::Value SummaryMessage(const std::string &summary);

// Posts presence events to a webhook URL from a worker thread.
class WebhookPresenceSink final : public PresenceSink {
public:
    static constexpr std::size_t kMaxQueuedMessages = 64;

    explicit WebhookPresenceSink(std::string url);
    ~WebhookPresenceSink() override;

    void onServerOnline(const ServerIdentity &server) override;
    void onServerOffline(const ServerIdentity &server) override;
    void onCounts(std::size_t servers, int64_t players) override;
    void onSummary(const std::string &summary) override;

private:
    void enqueue(json::Value message);
    void startWorker();
    void stopWorker();
    void workerProc();

    std::string url;
    std::deque<std::string> messages;
    std::mutex mutex;
    std::condition_variable cv;
    std::thread worker;
    bool stopRequested = false;
};

} // namespace masterlist::presence
