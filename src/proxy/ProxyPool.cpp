#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/util/Errors.hpp"

#include <algorithm>
#include <mutex>

namespace proxygate::proxy {
namespace {

bool sameEndpoint(const model::ProxyDescriptor& lhs, const std::string& host, std::uint16_t port) {
    return lhs.host == host && lhs.port == port;
}

std::vector<model::ProxyDescriptor> dropDuplicates(std::vector<model::ProxyDescriptor> descriptors) {
    std::vector<model::ProxyDescriptor> unique;
    unique.reserve(descriptors.size());
    for (auto& descriptor : descriptors) {
        auto match = std::find_if(unique.begin(), unique.end(), [&](const model::ProxyDescriptor& entry) {
            return sameEndpoint(entry, descriptor.host, descriptor.port);
        });
        if (match == unique.end()) {
            unique.push_back(std::move(descriptor));
        }
    }
    return unique;
}

} // namespace

ProxyPool::ProxyPool(std::vector<model::ProxyDescriptor> initial)
    : proxies_(dropDuplicates(std::move(initial))) {}

std::size_t ProxyPool::add(model::ProxyDescriptor descriptor) {
    std::unique_lock lock(mutex_);
    auto match = std::find_if(proxies_.begin(), proxies_.end(), [&](const model::ProxyDescriptor& entry) {
        return sameEndpoint(entry, descriptor.host, descriptor.port);
    });
    if (match != proxies_.end()) {
        throw util::GatewayError(util::ErrorCode::duplicate_proxy,
                                 "Proxy " + model::authorityOf(descriptor) + " already exists");
    }
    proxies_.push_back(std::move(descriptor));
    return proxies_.size();
}

std::size_t ProxyPool::remove(const std::string& host, std::uint16_t port) {
    std::unique_lock lock(mutex_);
    auto match = std::find_if(proxies_.begin(), proxies_.end(), [&](const model::ProxyDescriptor& entry) {
        return sameEndpoint(entry, host, port);
    });
    if (match == proxies_.end()) {
        throw util::GatewayError(util::ErrorCode::proxy_not_found,
                                 "Proxy " + host + ":" + std::to_string(port) + " not found");
    }
    proxies_.erase(match);
    return proxies_.size();
}

std::size_t ProxyPool::clear() {
    std::unique_lock lock(mutex_);
    auto count = proxies_.size();
    proxies_.clear();
    return count;
}

std::size_t ProxyPool::replace(std::vector<model::ProxyDescriptor> descriptors) {
    auto unique = dropDuplicates(std::move(descriptors));
    std::unique_lock lock(mutex_);
    proxies_ = std::move(unique);
    return proxies_.size();
}

std::vector<model::ProxySummary> ProxyPool::list() const {
    std::shared_lock lock(mutex_);
    std::vector<model::ProxySummary> summaries;
    summaries.reserve(proxies_.size());
    for (const auto& proxy : proxies_) {
        summaries.push_back(model::summarize(proxy));
    }
    return summaries;
}

std::size_t ProxyPool::snapshotLength() const {
    std::shared_lock lock(mutex_);
    return proxies_.size();
}

std::optional<ProxyPool::Selection> ProxyPool::selectAt(std::size_t index) const {
    std::shared_lock lock(mutex_);
    if (proxies_.empty()) {
        return std::nullopt;
    }
    const auto total = proxies_.size();
    return Selection{proxies_[index % total], index % total, total};
}

std::optional<ProxyPool::Advance> ProxyPool::advanceFrom(std::size_t index) const {
    std::shared_lock lock(mutex_);
    if (proxies_.empty()) {
        return std::nullopt;
    }
    const auto total = proxies_.size();
    const auto next = (index + 1) % total;
    return Advance{proxies_[index % total], proxies_[next], next, total};
}

} // namespace proxygate::proxy
