#include "proxygate/service/ProxyService.hpp"
#include "proxygate/util/Logging.hpp"

#include <exception>

namespace proxygate::service {

ProxyService::ProxyService(boost::asio::io_context& io, proxy::ProxyPool& pool)
    : io_(io)
    , pool_(pool) {}

std::size_t ProxyService::loadStatic(std::vector<model::ProxyDescriptor> proxies) {
    const auto supplied = proxies.size();
    const auto kept = pool_.replace(std::move(proxies));
    if (kept != supplied) {
        util::log(util::LogLevel::warn,
                  "Dropped " + std::to_string(supplied - kept) + " duplicate proxy entries");
    }
    util::log(util::LogLevel::info, "Loaded " + std::to_string(kept) + " proxies from configuration");
    return kept;
}

bool ProxyService::refreshNow(const Loader& loader) {
    try {
        auto proxies = loader();
        const auto kept = pool_.replace(std::move(proxies));
        util::log(util::LogLevel::info, "Proxy list refreshed, " + std::to_string(kept) + " proxies available");
        return true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Failed to load proxies from API: "} + ex.what());
        return false;
    }
}

void ProxyService::scheduleRefresh(Loader loader, std::chrono::minutes cadence) {
    refreshLoader_ = std::move(loader);
    cadence_ = cadence;
    timer_ = std::make_unique<boost::asio::steady_timer>(io_);
    armTimer();
}

void ProxyService::stop() {
    if (timer_) {
        timer_->cancel();
    }
}

void ProxyService::armTimer() {
    timer_->expires_after(cadence_);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Refreshing proxy list...");
        refreshNow(refreshLoader_);
        armTimer();
    });
}

} // namespace proxygate::service
