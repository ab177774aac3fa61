#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxygate::util {

std::string base64Encode(std::string_view input);

// Returns nullopt on characters outside the standard alphabet or bad padding.
std::optional<std::string> base64Decode(std::string_view input);

} // namespace proxygate::util
