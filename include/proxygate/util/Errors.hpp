#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace proxygate::util {

enum class ErrorCode {
    unauthenticated,
    admin_unauthorized,
    no_proxies_available,
    rotation_cooldown_active,
    rotation_in_progress,
    proxy_not_found,
    duplicate_proxy,
    invalid_proxy_spec,
    invalid_request,
    method_not_allowed,
    upstream_forwarding_error,
    internal_error,
};

const char* errorCodeName(ErrorCode code) noexcept;
int httpStatusFor(ErrorCode code) noexcept;

class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    GatewayError(ErrorCode code, const std::string& message, std::chrono::milliseconds remaining)
        : std::runtime_error(message)
        , code_(code)
        , remaining_(remaining) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int status() const noexcept { return httpStatusFor(code_); }

    // Set only for rotation denials.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const noexcept { return remaining_; }

private:
    ErrorCode code_;
    std::optional<std::chrono::milliseconds> remaining_;
};

} // namespace proxygate::util
