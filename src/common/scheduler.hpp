#pragma once

#include "common/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace masterlist {

// Cancellation handle for a scheduled task. Copies share the same task.
class TaskHandle {
public:
    TaskHandle() = default;

    void cancel();
    bool active() const;

private:
    friend class Scheduler;
    explicit TaskHandle(std::shared_ptr<std::atomic<bool>> cancelled)
        : cancelled(std::move(cancelled)) {}

    std::shared_ptr<std::atomic<bool>> cancelled;
};

// Repeating timers driven from the owner's loop. Nothing runs on its own thread;
// update() executes every task that is due at the clock's current time.
class Scheduler {
public:
    using Task = std::function<void()>;

    explicit Scheduler(const Clock &clock);

    TaskHandle scheduleEvery(std::string name,
                             std::chrono::milliseconds interval,
                             Task task,
                             bool runImmediately = true);

    // Returns the number of task invocations performed.
    std::size_t update();

    std::optional<TimePoint> nextDue() const;
    std::size_t activeTaskCount() const;

private:
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval{0};
        TimePoint nextRun{};
        Task task;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    void pruneCancelled();

    const Clock &clock;
    std::vector<Entry> entries;
};

} // namespace masterlist
