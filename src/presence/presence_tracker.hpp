#pragma once

#include "common/scheduler.hpp"
#include "presence/presence_sink.hpp"
#include "registry/registry_store.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace masterlist::presence {

constexpr std::chrono::seconds kMinDiffInterval{5};

struct PresenceSettings {
    std::chrono::seconds diffInterval{15};
    std::chrono::seconds countInterval{600};
    std::chrono::seconds summaryInterval{300};
};

// Watches the registry for servers appearing and disappearing and reports them,
// together with periodic totals and a digest, to the attached sinks.
class PresenceTracker {
public:
    PresenceTracker(registry::RegistryStore &store, PresenceSettings settings);
    ~PresenceTracker();

    PresenceTracker(const PresenceTracker&) = delete;
    PresenceTracker& operator=(const PresenceTracker&) = delete;

    void addSink(std::unique_ptr<PresenceSink> sink);

    // Schedules the three ticks; each runs once right away. No-op if already started.
    void start(Scheduler &scheduler);
    void stop();
    bool running() const { return !tasks.empty(); }

    // Return false when the store was unavailable and the tick was skipped.
    bool tickDiff();
    bool tickCounts();
    bool tickSummary();

private:
    std::vector<registry::Listing> publicListings();

    registry::RegistryStore &store;
    PresenceSettings settings;
    std::vector<std::unique_ptr<PresenceSink>> sinks;
    std::vector<TaskHandle> tasks;
};

} // namespace masterlist::presence
