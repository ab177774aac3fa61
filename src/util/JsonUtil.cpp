#include "proxygate/util/JsonUtil.hpp"

#include <charconv>

namespace proxygate::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<std::string> getString(const boost::json::object& object, const char* key) {
    if (auto it = object.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string().c_str());
    }
    return std::nullopt;
}

std::optional<std::int64_t> getInteger(const boost::json::object& object, const char* key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_int64()) {
        return it->as_int64();
    }
    if (it->is_uint64()) {
        return static_cast<std::int64_t>(it->as_uint64());
    }
    if (it->is_string()) {
        const auto& text = it->as_string();
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size() && !text.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace proxygate::util
