#pragma once

#include "proxygate/util/Errors.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace proxygate::util {

inline std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timePoint);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - seconds).count();
    const std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

inline std::string makeIsoTimestamp() {
    return formatIsoTimestamp(std::chrono::system_clock::now());
}

inline boost::json::object makeErrorBody(std::string_view error, std::string_view message) {
    boost::json::object body;
    body["error"] = error;
    if (!message.empty()) {
        body["message"] = message;
    }
    body["timestamp"] = makeIsoTimestamp();
    return body;
}

inline boost::json::object makeErrorBody(const GatewayError& error) {
    auto body = makeErrorBody(errorCodeName(error.code()), error.what());
    if (auto remaining = error.remaining()) {
        const auto ms = remaining->count();
        body["remainingMs"] = ms;
        body["cooldownSeconds"] = (ms + 999) / 1000;
    }
    return body;
}

} // namespace proxygate::util
