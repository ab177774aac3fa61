#pragma once

#include "proxygate/model/ConnectionRecord.hpp"
#include "proxygate/model/ProxyDescriptor.hpp"
#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/rotation/ConnectionLedger.hpp"
#include "proxygate/rotation/RotationGuard.hpp"
#include "proxygate/rotation/RotationState.hpp"
#include "proxygate/util/Clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proxygate::rotation {

// Per-identity rotation state and ledgers, keyed by identity. Each identity has
// its own mutex; the map mutex is only held for lookup, insert and erase.
class IdentityRegistry {
public:
    struct Options {
        RotationGuard::Policy guard{};
        std::size_t ledgerCapacity{ConnectionLedger::kDefaultCapacity};
        // Identities idle for longer than this are dropped by sweep().
        std::chrono::milliseconds retention{12000};
    };

    struct CurrentProxy {
        model::ProxyDescriptor proxy;
        std::size_t position{};   // 1-based
        std::size_t total{};
        std::size_t connections{};
    };

    struct Rotation {
        model::ProxyDescriptor from;
        model::ProxyDescriptor to;
        std::size_t position{};   // 1-based
        std::size_t total{};
    };

    struct GuardStatus {
        bool locked{false};
        std::optional<std::chrono::system_clock::time_point> lastRotation;
        bool canRotate{true};
    };

    struct IdentityStatus {
        std::optional<CurrentProxy> current;
        std::size_t connections{};
        GuardStatus guard;
    };

    IdentityRegistry(proxy::ProxyPool& pool, const util::Clock& clock, Options options);

    // Read-only: an unknown identity is treated as index 0 and not created.
    CurrentProxy currentFor(const std::string& identity) const;
    Rotation rotate(const std::string& identity);
    IdentityStatus status(const std::string& identity) const;
    // Clears the identity's rotation state; returns false if none existed.
    bool reset(const std::string& identity);

    void record(const std::string& identity, model::ConnectionRecord record);
    std::vector<model::ConnectionRecord> connections(const std::string& identity) const;

    std::size_t sweep();
    std::size_t identityCount() const;

    const RotationGuard& guard() const noexcept { return guard_; }
    const Options& options() const noexcept { return options_; }

private:
    struct Entry {
        explicit Entry(std::size_t ledgerCapacity, std::chrono::system_clock::time_point createdAt)
            : ledger(ledgerCapacity)
            , lastActivity(createdAt) {}

        mutable std::mutex mutex;
        RotationState state;
        ConnectionLedger ledger;
        std::chrono::system_clock::time_point lastActivity;
        // Set by sweep() once the entry is unlinked from the map.
        bool removed{false};
    };

    std::shared_ptr<Entry> find(const std::string& identity) const;
    std::shared_ptr<Entry> findOrCreate(const std::string& identity);

    proxy::ProxyPool& pool_;
    const util::Clock& clock_;
    Options options_;
    RotationGuard guard_;
    mutable std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace proxygate::rotation
