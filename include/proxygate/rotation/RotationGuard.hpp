#pragma once

#include "proxygate/rotation/RotationState.hpp"

#include <chrono>

namespace proxygate::rotation {

// Cooldown and single-flight gates over a RotationState. The caller holds the
// identity's mutex around every call, so check-and-set is one critical section.
//
// Idle -> acquire() -> Locked -> settle() + settleDelay elapsed -> Idle
//                             -> abort()                      -> Idle
class RotationGuard {
public:
    using time_point = std::chrono::system_clock::time_point;

    struct Policy {
        std::chrono::milliseconds cooldown{6000};
        std::chrono::milliseconds settleDelay{1000};
    };

    explicit RotationGuard(Policy policy);

    // Throws rotation_cooldown_active or rotation_in_progress. On success the
    // state is locked and stamped with now.
    void acquire(RotationState& state, time_point now) const;
    // Starts the minimum lock hold after a successful rotation.
    void settle(RotationState& state, time_point now) const;
    // Releases the lock at once after a failed rotation.
    void abort(RotationState& state) const;

    [[nodiscard]] bool isLocked(const RotationState& state, time_point now) const;
    [[nodiscard]] bool canRotate(const RotationState& state, time_point now) const;
    [[nodiscard]] std::chrono::milliseconds remainingCooldown(const RotationState& state, time_point now) const;

    [[nodiscard]] const Policy& policy() const noexcept { return policy_; }

private:
    Policy policy_;
};

} // namespace proxygate::rotation
