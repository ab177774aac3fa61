#include "proxygate/service/IdentitySweeper.hpp"
#include "proxygate/util/Logging.hpp"

#include <string>

namespace proxygate::service {

IdentitySweeper::IdentitySweeper(boost::asio::io_context& io,
                                 rotation::IdentityRegistry& registry,
                                 std::chrono::milliseconds interval)
    : registry_(registry)
    , interval_(interval)
    , timer_(io) {}

void IdentitySweeper::start() {
    armTimer();
}

void IdentitySweeper::stop() {
    timer_.cancel();
}

void IdentitySweeper::armTimer() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto removed = registry_.sweep();
        util::log(util::LogLevel::info,
                  "Cleanup: removed " + std::to_string(removed) + ", " +
                      std::to_string(registry_.identityCount()) + " users in rotation cache");
        armTimer();
    });
}

} // namespace proxygate::service
