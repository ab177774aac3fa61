#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace proxygate::rotation {

struct RotationState {
    // Reduced against the pool size seen at the last rotation. The pool may
    // shrink since, so readers take it modulo the current size at use time.
    std::size_t index{};
    std::optional<std::chrono::system_clock::time_point> lastRotationAt;
    bool locked{false};
    // Unset while a rotation is in flight; set once it settles.
    std::optional<std::chrono::system_clock::time_point> lockHeldUntil;
};

} // namespace proxygate::rotation
