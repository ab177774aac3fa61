#include "ManualClock.hpp"

#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/rotation/IdentityRegistry.hpp"
#include "proxygate/service/IdentitySweeper.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using proxygate::model::ConnectionRecord;
using proxygate::proxy::ProxyPool;
using proxygate::rotation::IdentityRegistry;
using proxygate::service::IdentitySweeper;
using proxygate::testing::ManualClock;

void TestSweepsOnEachTickUntilStopped() {
    ProxyPool pool;
    ManualClock clock;
    IdentityRegistry::Options options;
    options.retention = 1000ms;
    IdentityRegistry registry(pool, clock, options);

    registry.record("alice", ConnectionRecord{"http://10.0.0.1:8001", "/", "GET", clock.now(), "curl"});
    registry.record("bob", ConnectionRecord{"http://10.0.0.1:8001", "/", "GET", clock.now(), "curl"});
    clock.advance(5000ms);
    assert(registry.identityCount() == 2);

    boost::asio::io_context io;
    IdentitySweeper sweeper{io, registry, 5ms};
    sweeper.start();

    boost::asio::steady_timer deadline{io, 100ms};
    deadline.async_wait([&](const boost::system::error_code&) { sweeper.stop(); });

    // Returns only once stop() has cancelled the pending sweep.
    io.run();
    assert(registry.identityCount() == 0);
}

} // namespace

int main() {
    proxygate::util::initLogging(proxygate::util::LogLevel::warn);

    TestSweepsOnEachTickUntilStopped();

    std::cout << "proxygate_unit_identity_sweeper: pass\n";
    return 0;
}
