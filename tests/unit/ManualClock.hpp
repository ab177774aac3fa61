#pragma once

#include "proxygate/util/Clock.hpp"

#include <chrono>
#include <mutex>

namespace proxygate::testing {

class ManualClock : public util::Clock {
public:
    ManualClock()
        : now_(std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50)) {}

    time_point now() const override {
        std::scoped_lock lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::scoped_lock lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    time_point now_;
};

} // namespace proxygate::testing
