#pragma once

#include <chrono>
#include <mutex>

namespace masterlist {

using TimePoint = std::chrono::steady_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock final : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

// Clock that only moves when told to. Used to drive expiry and timers in tests.
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(1))
        : current(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }

    void advance(std::chrono::steady_clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex);
        current += delta;
    }

private:
    mutable std::mutex mutex;
    TimePoint current;
};

} // namespace masterlist
