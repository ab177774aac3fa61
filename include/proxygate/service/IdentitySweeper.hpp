#pragma once

#include "proxygate/rotation/IdentityRegistry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>

namespace proxygate::service {

// Periodically drops idle identity state from the registry.
class IdentitySweeper {
public:
    IdentitySweeper(boost::asio::io_context& io,
                    rotation::IdentityRegistry& registry,
                    std::chrono::milliseconds interval);

    void start();
    void stop();

private:
    void armTimer();

    rotation::IdentityRegistry& registry_;
    std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
};

} // namespace proxygate::service
