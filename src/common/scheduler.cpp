#include "common/scheduler.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace masterlist {

void TaskHandle::cancel() {
    if (cancelled) {
        cancelled->store(true);
    }
}

bool TaskHandle::active() const {
    return cancelled && !cancelled->load();
}

Scheduler::Scheduler(const Clock &clock) : clock(clock) {}

TaskHandle Scheduler::scheduleEvery(std::string name,
                                    std::chrono::milliseconds interval,
                                    Task task,
                                    bool runImmediately) {
    if (interval <= std::chrono::milliseconds::zero()) {
        interval = std::chrono::milliseconds(1);
    }

    Entry entry;
    entry.name = std::move(name);
    entry.interval = interval;
    entry.nextRun = runImmediately ? clock.now() : clock.now() + interval;
    entry.task = std::move(task);
    entry.cancelled = std::make_shared<std::atomic<bool>>(false);

    TaskHandle handle(entry.cancelled);
    spdlog::debug("Scheduler: '{}' every {} ms", entry.name, interval.count());
    entries.push_back(std::move(entry));
    return handle;
}

std::size_t Scheduler::update() {
    pruneCancelled();

    const TimePoint now = clock.now();
    std::size_t ran = 0;
    // Index loop: a task may schedule further tasks while running.
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].cancelled->load() || now < entries[i].nextRun) {
            continue;
        }

        // Missed intervals collapse into a single run.
        entries[i].nextRun = now + entries[i].interval;
        Task task = entries[i].task;
        const std::string name = entries[i].name;
        try {
            task();
        } catch (const std::exception &ex) {
            spdlog::error("Scheduler: task '{}' failed: {}", name, ex.what());
        }
        ++ran;
    }
    return ran;
}

std::optional<TimePoint> Scheduler::nextDue() const {
    std::optional<TimePoint> earliest;
    for (const auto &entry : entries) {
        if (entry.cancelled->load()) {
            continue;
        }
        if (!earliest || entry.nextRun < *earliest) {
            earliest = entry.nextRun;
        }
    }
    return earliest;
}

std::size_t Scheduler::activeTaskCount() const {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [](const Entry &entry) { return !entry.cancelled->load(); }));
}

void Scheduler::pruneCancelled() {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const Entry &entry) { return entry.cancelled->load(); }),
                  entries.end());
}

} // namespace masterlist
