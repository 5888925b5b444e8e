#pragma once

#include "presence/presence_sink.hpp"

namespace masterlist::presence {

class LogPresenceSink final : public PresenceSink {
public:
    void onServerOnline(const ServerIdentity &server) override;
    void onServerOffline(const ServerIdentity &server) override;
    void onCounts(std::size_t servers, int64_t players) override;
    void onSummary(const std::string &summary) override;
};

} // namespace masterlist::presence
