#include "presence/presence_tracker.hpp"

#include "presence/summary_renderer.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <set>

namespace masterlist::presence {

namespace {

ServerIdentity identityFrom(const net::Endpoint &endpoint, const registry::ServerMeta &meta) {
    ServerIdentity identity;
    identity.endpoint = endpoint;
    identity.name = meta.name;
    identity.map = meta.map;
    identity.playlist = meta.playlist;
    identity.requiredMods = meta.requiredMods;
    return identity;
}

} // namespace

PresenceTracker::PresenceTracker(registry::RegistryStore &store, PresenceSettings settings)
    : store(store), settings(settings) {
    if (this->settings.diffInterval < kMinDiffInterval) {
        this->settings.diffInterval = kMinDiffInterval;
    }
}

PresenceTracker::~PresenceTracker() {
    stop();
}

void PresenceTracker::addSink(std::unique_ptr<PresenceSink> sink) {
    if (sink) {
        sinks.push_back(std::move(sink));
    }
}

void PresenceTracker::start(Scheduler &scheduler) {
    if (running()) {
        return;
    }
    tasks.push_back(scheduler.scheduleEvery("presence-diff", settings.diffInterval, [this]() { tickDiff(); }));
    tasks.push_back(scheduler.scheduleEvery("presence-counts", settings.countInterval, [this]() { tickCounts(); }));
    tasks.push_back(scheduler.scheduleEvery("presence-summary", settings.summaryInterval, [this]() { tickSummary(); }));
    spdlog::info("PresenceTracker: Started (diff {}s, counts {}s, summary {}s)",
                 settings.diffInterval.count(), settings.countInterval.count(), settings.summaryInterval.count());
}

void PresenceTracker::stop() {
    for (auto &task : tasks) {
        task.cancel();
    }
    tasks.clear();
}

bool PresenceTracker::tickDiff() {
    std::vector<ServerIdentity> online;
    std::vector<ServerIdentity> offline;
    std::size_t tracked = 0;
    try {
        const std::set<std::string> current = store.allKeys();
        const std::set<std::string> previous = store.knownKeys();
        tracked = current.size();

        std::vector<std::string> added;
        std::set_difference(current.begin(), current.end(), previous.begin(), previous.end(),
                            std::back_inserter(added));
        std::vector<std::string> removed;
        std::set_difference(previous.begin(), previous.end(), current.begin(), current.end(),
                            std::back_inserter(removed));

        for (const auto &key : added) {
            const auto endpoint = net::ParseRegistryKey(key);
            if (!endpoint) {
                continue;
            }
            const auto listing = store.getByEndpoint(endpoint->ip, endpoint->port);
            if (!listing) {
                continue;
            }
            const registry::ServerMeta meta = registry::MetaFromListing(*listing);
            store.upsertMeta(*endpoint, meta);
            online.push_back(identityFrom(*endpoint, meta));
        }

        for (const auto &key : removed) {
            const auto endpoint = net::ParseRegistryKey(key);
            if (!endpoint) {
                continue;
            }
            const auto meta = store.getMeta(*endpoint);
            ServerIdentity identity = meta ? identityFrom(*endpoint, *meta) : ServerIdentity{};
            identity.endpoint = *endpoint;
            offline.push_back(std::move(identity));
        }

        // Events go out only once the new snapshot is committed, so a failed tick
        // never reports a change twice.
        store.replaceKnownKeys(current);
    } catch (const registry::RegistryUnavailable &ex) {
        spdlog::warn("PresenceTracker: Skipping diff tick: {}", ex.what());
        return false;
    }

    for (const auto &identity : online) {
        for (auto &sink : sinks) {
            sink->onServerOnline(identity);
        }
    }
    for (const auto &identity : offline) {
        for (auto &sink : sinks) {
            sink->onServerOffline(identity);
        }
    }

    for (const auto &identity : offline) {
        try {
            store.removeMeta(identity.endpoint);
        } catch (const registry::RegistryUnavailable &ex) {
            spdlog::warn("PresenceTracker: Leaving stale meta for {}: {}", net::AddressKey(identity.endpoint), ex.what());
        }
    }

    if (!online.empty() || !offline.empty()) {
        spdlog::debug("PresenceTracker: {} joined, {} left, {} tracked", online.size(), offline.size(), tracked);
    }
    return true;
}

std::vector<registry::Listing> PresenceTracker::publicListings() {
    std::vector<registry::Listing> listings = store.fetchListings();
    listings.erase(std::remove_if(listings.begin(), listings.end(),
                                  [](const registry::Listing &listing) { return listing.hidden; }),
                   listings.end());
    return listings;
}

bool PresenceTracker::tickCounts() {
    try {
        const auto listings = publicListings();
        int64_t players = 0;
        for (const auto &listing : listings) {
            players += listing.playerCount;
        }
        for (auto &sink : sinks) {
            sink->onCounts(listings.size(), players);
        }
        return true;
    } catch (const registry::RegistryUnavailable &ex) {
        spdlog::warn("PresenceTracker: Skipping counts tick: {}", ex.what());
        return false;
    }
}

bool PresenceTracker::tickSummary() {
    try {
        auto listings = publicListings();
        std::stable_sort(listings.begin(), listings.end(),
                         [](const registry::Listing &a, const registry::Listing &b) {
                             return a.playerCount > b.playerCount;
                         });
        const std::string summary = RenderServerSummary(listings);
        for (auto &sink : sinks) {
            sink->onSummary(summary);
        }
        return true;
    } catch (const registry::RegistryUnavailable &ex) {
        spdlog::warn("PresenceTracker: Skipping summary tick: {}", ex.what());
        return false;
    }
}

} // namespace masterlist::presence
