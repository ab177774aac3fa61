#pragma once

#include <chrono>

namespace proxygate::util {

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

} // namespace proxygate::util
