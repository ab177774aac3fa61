#include "proxygate/util/ProcessStats.hpp"

#include <fstream>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace proxygate::util {
namespace {

std::chrono::steady_clock::time_point processStart() {
    static const auto start = std::chrono::steady_clock::now();
    return start;
}

} // namespace

ProcessStats sampleProcessStats() {
    ProcessStats stats;
    stats.uptime = std::chrono::steady_clock::now() - processStart();

#if !defined(_WIN32)
    std::ifstream statm("/proc/self/statm");
    std::uint64_t sizePages = 0;
    std::uint64_t residentPages = 0;
    if (statm >> sizePages >> residentPages) {
        const auto pageSize = static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
        stats.virtualBytes = sizePages * pageSize;
        stats.residentBytes = residentPages * pageSize;
    }
#endif
    return stats;
}

} // namespace proxygate::util
