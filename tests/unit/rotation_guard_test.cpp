#include "proxygate/rotation/RotationGuard.hpp"
#include "proxygate/util/Errors.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using proxygate::rotation::RotationGuard;
using proxygate::rotation::RotationState;
using proxygate::util::ErrorCode;
using proxygate::util::GatewayError;

const auto kStart = std::chrono::system_clock::time_point{} + 1000h;

RotationGuard MakeGuard(std::chrono::milliseconds cooldown = 6000ms, std::chrono::milliseconds settle = 1000ms) {
    return RotationGuard(RotationGuard::Policy{cooldown, settle});
}

template <class Fn>
GatewayError CaptureError(Fn&& fn) {
    try {
        fn();
    } catch (const GatewayError& ex) {
        return ex;
    }
    assert(false && "expected GatewayError");
    return GatewayError(ErrorCode::internal_error, "unreachable");
}

void TestFirstAcquireLocksAndStamps() {
    auto guard = MakeGuard();
    RotationState state;
    assert(guard.canRotate(state, kStart));

    guard.acquire(state, kStart);
    assert(state.locked);
    assert(state.lastRotationAt == kStart);
    assert(guard.isLocked(state, kStart + 1h));
    assert(!guard.canRotate(state, kStart));
}

void TestCooldownReportsRemainingWait() {
    auto guard = MakeGuard();
    RotationState state;
    guard.acquire(state, kStart);
    guard.settle(state, kStart);

    auto error = CaptureError([&] { guard.acquire(state, kStart + 2500ms); });
    assert(error.code() == ErrorCode::rotation_cooldown_active);
    assert(error.status() == 429);
    assert(error.remaining().value() == 3500ms);

    guard.acquire(state, kStart + 6000ms);
    assert(state.lastRotationAt == kStart + 6000ms);
}

void TestInFlightRotationBlocksAfterCooldown() {
    auto guard = MakeGuard(100ms, 1000ms);
    RotationState state;
    guard.acquire(state, kStart);

    auto error = CaptureError([&] { guard.acquire(state, kStart + 10s); });
    assert(error.code() == ErrorCode::rotation_in_progress);
}

void TestSettleHoldsLockForSettleDelay() {
    auto guard = MakeGuard(100ms, 500ms);
    RotationState state;
    guard.acquire(state, kStart);
    guard.settle(state, kStart);

    auto error = CaptureError([&] { guard.acquire(state, kStart + 200ms); });
    assert(error.code() == ErrorCode::rotation_in_progress);
    assert(error.remaining().value() == 300ms);

    assert(!guard.isLocked(state, kStart + 500ms));
    guard.acquire(state, kStart + 500ms);
    assert(state.locked);
    assert(!state.lockHeldUntil);
}

void TestAbortReleasesImmediately() {
    auto guard = MakeGuard(100ms, 1000ms);
    RotationState state;
    guard.acquire(state, kStart);
    guard.abort(state);

    assert(!guard.isLocked(state, kStart));
    assert(state.lastRotationAt == kStart);
    guard.acquire(state, kStart + 100ms);
}

void TestSettleWithoutAcquireIsNoop() {
    auto guard = MakeGuard();
    RotationState state;
    guard.settle(state, kStart);
    assert(!state.locked);
    assert(!state.lockHeldUntil);
}

} // namespace

int main() {
    TestFirstAcquireLocksAndStamps();
    TestCooldownReportsRemainingWait();
    TestInFlightRotationBlocksAfterCooldown();
    TestSettleHoldsLockForSettleDelay();
    TestAbortReleasesImmediately();
    TestSettleWithoutAcquireIsNoop();

    std::cout << "proxygate_unit_rotation_guard: pass\n";
    return 0;
}
