#include "proxygate/rotation/RotationGuard.hpp"
#include "proxygate/util/Errors.hpp"

#include <string>

namespace proxygate::rotation {

RotationGuard::RotationGuard(Policy policy)
    : policy_(policy) {}

void RotationGuard::acquire(RotationState& state, time_point now) const {
    auto remaining = remainingCooldown(state, now);
    if (remaining.count() > 0) {
        const auto seconds = (remaining.count() + 999) / 1000;
        throw util::GatewayError(util::ErrorCode::rotation_cooldown_active,
                                 "Rotation cooldown active. Wait " + std::to_string(seconds) + "s",
                                 remaining);
    }

    if (isLocked(state, now)) {
        auto wait = policy_.settleDelay;
        if (state.lockHeldUntil) {
            wait = std::chrono::ceil<std::chrono::milliseconds>(*state.lockHeldUntil - now);
        }
        throw util::GatewayError(util::ErrorCode::rotation_in_progress,
                                 "Rotation already in progress for this user",
                                 wait);
    }

    state.locked = true;
    state.lockHeldUntil.reset();
    state.lastRotationAt = now;
}

void RotationGuard::settle(RotationState& state, time_point now) const {
    if (!state.locked) {
        return;
    }
    state.lockHeldUntil = now + policy_.settleDelay;
}

void RotationGuard::abort(RotationState& state) const {
    state.locked = false;
    state.lockHeldUntil.reset();
}

bool RotationGuard::isLocked(const RotationState& state, time_point now) const {
    if (!state.locked) {
        return false;
    }
    return !state.lockHeldUntil || now < *state.lockHeldUntil;
}

bool RotationGuard::canRotate(const RotationState& state, time_point now) const {
    return remainingCooldown(state, now).count() <= 0 && !isLocked(state, now);
}

std::chrono::milliseconds RotationGuard::remainingCooldown(const RotationState& state, time_point now) const {
    if (!state.lastRotationAt) {
        return std::chrono::milliseconds::zero();
    }
    auto elapsed = now - *state.lastRotationAt;
    if (elapsed >= policy_.cooldown) {
        return std::chrono::milliseconds::zero();
    }
    return std::chrono::ceil<std::chrono::milliseconds>(policy_.cooldown - elapsed);
}

} // namespace proxygate::rotation
