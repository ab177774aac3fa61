#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxygate::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
// Lets callers skip building messages the current level would drop.
bool isLogEnabled(LogLevel level);
void log(LogLevel level, const std::string& message);

std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace proxygate::util
