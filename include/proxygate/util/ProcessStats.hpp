#pragma once

#include <chrono>
#include <cstdint>

namespace proxygate::util {

struct ProcessStats {
    std::chrono::duration<double> uptime{};
    std::uint64_t residentBytes{};
    std::uint64_t virtualBytes{};
};

// Uptime is measured from the first call, which main makes at startup.
ProcessStats sampleProcessStats();

} // namespace proxygate::util
