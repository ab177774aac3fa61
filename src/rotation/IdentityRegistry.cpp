#include "proxygate/rotation/IdentityRegistry.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/Logging.hpp"

namespace proxygate::rotation {
namespace {

util::GatewayError noProxies() {
    return util::GatewayError(util::ErrorCode::no_proxies_available,
                              "Proxy list is empty. Add proxies via API or environment variables.");
}

} // namespace

IdentityRegistry::IdentityRegistry(proxy::ProxyPool& pool, const util::Clock& clock, Options options)
    : pool_(pool)
    , clock_(clock)
    , options_(options)
    , guard_(options.guard) {}

IdentityRegistry::CurrentProxy IdentityRegistry::currentFor(const std::string& identity) const {
    std::size_t index = 0;
    std::size_t connections = 0;
    if (auto entry = find(identity)) {
        std::scoped_lock lock(entry->mutex);
        index = entry->state.index;
        connections = entry->ledger.size();
    }

    auto selection = pool_.selectAt(index);
    if (!selection) {
        throw noProxies();
    }
    return CurrentProxy{std::move(selection->proxy), selection->index + 1, selection->total, connections};
}

IdentityRegistry::Rotation IdentityRegistry::rotate(const std::string& identity) {
    if (pool_.snapshotLength() == 0) {
        throw noProxies();
    }

    std::shared_ptr<Entry> entry;
    std::size_t index = 0;
    // A sweep may erase the entry between lookup and lock; look it up again.
    for (;;) {
        entry = findOrCreate(identity);
        std::scoped_lock lock(entry->mutex);
        if (entry->removed) {
            continue;
        }
        const auto now = clock_.now();
        guard_.acquire(entry->state, now);
        entry->lastActivity = now;
        index = entry->state.index;
        break;
    }

    // The pool may have been emptied since the length check above.
    auto advance = pool_.advanceFrom(index);
    if (!advance) {
        std::scoped_lock lock(entry->mutex);
        guard_.abort(entry->state);
        throw noProxies();
    }

    {
        std::scoped_lock lock(entry->mutex);
        entry->state.index = advance->index;
        guard_.settle(entry->state, clock_.now());
    }

    util::log(util::LogLevel::info,
              "ROTATE " + identity + ": " + model::authorityOf(advance->from) + " -> " +
                  model::authorityOf(advance->to) + " (#" + std::to_string(advance->index + 1) + "/" +
                  std::to_string(advance->total) + ")");

    return Rotation{std::move(advance->from), std::move(advance->to), advance->index + 1, advance->total};
}

IdentityRegistry::IdentityStatus IdentityRegistry::status(const std::string& identity) const {
    IdentityStatus result;
    RotationState state;
    if (auto entry = find(identity)) {
        std::scoped_lock lock(entry->mutex);
        state = entry->state;
        result.connections = entry->ledger.size();
    }

    const auto now = clock_.now();
    result.guard.locked = guard_.isLocked(state, now);
    result.guard.lastRotation = state.lastRotationAt;
    result.guard.canRotate = guard_.canRotate(state, now);

    if (auto selection = pool_.selectAt(state.index)) {
        result.current = CurrentProxy{std::move(selection->proxy), selection->index + 1, selection->total,
                                      result.connections};
    }
    return result;
}

bool IdentityRegistry::reset(const std::string& identity) {
    auto entry = find(identity);
    if (!entry) {
        return false;
    }
    std::scoped_lock lock(entry->mutex);
    entry->state = RotationState{};
    return true;
}

void IdentityRegistry::record(const std::string& identity, model::ConnectionRecord record) {
    for (;;) {
        auto entry = findOrCreate(identity);
        std::scoped_lock lock(entry->mutex);
        if (entry->removed) {
            continue;
        }
        entry->lastActivity = clock_.now();
        entry->ledger.append(std::move(record));
        return;
    }
}

std::vector<model::ConnectionRecord> IdentityRegistry::connections(const std::string& identity) const {
    auto entry = find(identity);
    if (!entry) {
        return {};
    }
    std::scoped_lock lock(entry->mutex);
    return entry->ledger.snapshot();
}

std::size_t IdentityRegistry::sweep() {
    const auto now = clock_.now();
    const auto cutoff = now - options_.retention;
    std::size_t removed = 0;

    std::scoped_lock mapLock(mapMutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        bool expired = false;
        {
            std::scoped_lock lock(it->second->mutex);
            auto& entry = *it->second;
            expired = !guard_.isLocked(entry.state, now) && entry.lastActivity < cutoff;
            entry.removed = expired;
        }
        if (expired) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t IdentityRegistry::identityCount() const {
    std::scoped_lock lock(mapMutex_);
    return entries_.size();
}

std::shared_ptr<IdentityRegistry::Entry> IdentityRegistry::find(const std::string& identity) const {
    std::scoped_lock lock(mapMutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<IdentityRegistry::Entry> IdentityRegistry::findOrCreate(const std::string& identity) {
    std::scoped_lock lock(mapMutex_);
    auto it = entries_.find(identity);
    if (it != entries_.end()) {
        return it->second;
    }
    auto entry = std::make_shared<Entry>(options_.ledgerCapacity, clock_.now());
    entries_.emplace(identity, entry);
    return entry;
}

} // namespace proxygate::rotation
