#pragma once

#include "proxygate/model/ProxyDescriptor.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace proxygate::proxy {

// Ordered, process-wide list of upstream proxies. Readers never see a stale
// length: every index is reduced modulo the size observed under the same lock.
class ProxyPool {
public:
    struct Selection {
        model::ProxyDescriptor proxy;
        std::size_t index{};
        std::size_t total{};
    };

    struct Advance {
        model::ProxyDescriptor from;
        model::ProxyDescriptor to;
        std::size_t index{};
        std::size_t total{};
    };

    ProxyPool() = default;
    explicit ProxyPool(std::vector<model::ProxyDescriptor> initial);

    // Returns the pool size after the append. Throws duplicate_proxy.
    std::size_t add(model::ProxyDescriptor descriptor);
    // Removes the first host:port match and returns the new size. Throws proxy_not_found.
    std::size_t remove(const std::string& host, std::uint16_t port);
    std::size_t clear();
    // Duplicate host:port entries after the first are dropped; returns how many were kept.
    std::size_t replace(std::vector<model::ProxyDescriptor> descriptors);

    std::vector<model::ProxySummary> list() const;
    std::size_t snapshotLength() const;

    std::optional<Selection> selectAt(std::size_t index) const;
    std::optional<Advance> advanceFrom(std::size_t index) const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<model::ProxyDescriptor> proxies_;
};

} // namespace proxygate::proxy
