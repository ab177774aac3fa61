#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace proxygate::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

std::optional<std::string> getString(const boost::json::object& object, const char* key);
// Accepts integers and numeric strings; anything else is nullopt.
std::optional<std::int64_t> getInteger(const boost::json::object& object, const char* key);

} // namespace proxygate::util
