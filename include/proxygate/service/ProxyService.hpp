#pragma once

#include "proxygate/model/ProxyDescriptor.hpp"
#include "proxygate/proxy/ProxyPool.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace proxygate::service {

// Keeps the shared pool in step with its configured source.
class ProxyService {
public:
    using Loader = std::function<std::vector<model::ProxyDescriptor>()>;

    ProxyService(boost::asio::io_context& io, proxy::ProxyPool& pool);

    std::size_t loadStatic(std::vector<model::ProxyDescriptor> proxies);
    // Replaces the pool with the loader's result. A throwing loader leaves the
    // pool untouched and returns false.
    bool refreshNow(const Loader& loader);
    void scheduleRefresh(Loader loader, std::chrono::minutes cadence);
    void stop();

private:
    void armTimer();

    boost::asio::io_context& io_;
    proxy::ProxyPool& pool_;
    Loader refreshLoader_;
    std::chrono::minutes cadence_{0};
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

} // namespace proxygate::service
