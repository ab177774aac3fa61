#include "proxygate/config/GatewayConfig.hpp"
#include "proxygate/controller/AdminController.hpp"
#include "proxygate/controller/ForwardController.hpp"
#include "proxygate/controller/RotationController.hpp"
#include "proxygate/identity/IdentityResolver.hpp"
#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/proxy/ProxySource.hpp"
#include "proxygate/rotation/IdentityRegistry.hpp"
#include "proxygate/routing/RequestRouter.hpp"
#include "proxygate/server/HttpServer.hpp"
#include "proxygate/server/Router.hpp"
#include "proxygate/service/IdentitySweeper.hpp"
#include "proxygate/service/ProxyService.hpp"
#include "proxygate/util/Clock.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/HttpClient.hpp"
#include "proxygate/util/Logging.hpp"
#include "proxygate/util/ProcessStats.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace proxygate;

std::optional<std::filesystem::path> configPath(int argc, char** argv) {
    if (argc > 1) {
        return std::filesystem::path{argv[1]};
    }
    if (auto value = config::processEnvironment("PROXYGATE_CONFIG"); value && !value->empty()) {
        return std::filesystem::path{*value};
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    using namespace proxygate;
    util::sampleProcessStats();

    config::GatewayConfig gatewayConfig;
    try {
        gatewayConfig = config::loadGatewayConfig(configPath(argc, argv));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid configuration: "} + ex.what());
        return 1;
    }
    util::initLogging(gatewayConfig.logLevel);

    boost::asio::io_context io;
    util::SystemClock clock;
    proxy::ProxyPool proxyPool;
    util::HttpClient httpClient;
    service::ProxyService proxyService{io, proxyPool};

    util::log(util::LogLevel::info, "Initializing proxy list...");
    service::ProxyService::Loader apiLoader;
    if (gatewayConfig.proxyApiUrl) {
        proxy::ProxyApiConfig apiConfig;
        apiConfig.url = *gatewayConfig.proxyApiUrl;
        apiConfig.apiKey = gatewayConfig.proxyApiKey;
        apiLoader = [apiConfig, &httpClient]() { return proxy::fetchProxyList(apiConfig, httpClient); };
    }

    if (gatewayConfig.proxyList) {
        try {
            proxyService.loadStatic(proxy::parseProxyList(*gatewayConfig.proxyList));
        } catch (const util::GatewayError& ex) {
            util::log(util::LogLevel::error, std::string{"Failed to parse PROXY_LIST: "} + ex.what());
            return 1;
        }
    } else if (apiLoader) {
        proxyService.refreshNow(apiLoader);
    } else {
        util::log(util::LogLevel::warn, "PROXY_API_URL not configured, using empty proxy list");
    }

    if (apiLoader) {
        proxyService.scheduleRefresh(apiLoader, gatewayConfig.proxyRefreshInterval);
    }

    rotation::IdentityRegistry::Options registryOptions;
    registryOptions.guard.cooldown = gatewayConfig.rotationCooldown;
    registryOptions.guard.settleDelay = gatewayConfig.settleDelay;
    registryOptions.ledgerCapacity = gatewayConfig.ledgerCapacity;
    registryOptions.retention = gatewayConfig.effectiveRetention();
    rotation::IdentityRegistry registry{proxyPool, clock, registryOptions};

    identity::ClaimedUsernameResolver identityResolver;
    routing::RequestRouter requestRouter{registry, clock};

    auto router = std::make_shared<server::Router>();
    controller::RotationController rotationController{registry, identityResolver};
    rotationController.registerRoutes(*router);

    controller::AdminController adminController{proxyPool, gatewayConfig.adminApiKey};
    adminController.registerRoutes(*router);

    controller::ForwardController forwardController{requestRouter, identityResolver, httpClient,
                                                    gatewayConfig.forwardTimeout};
    forwardController.registerRoutes(*router);

    auto httpServer = std::make_shared<server::HttpServer>(io, router, gatewayConfig.bindAddress, gatewayConfig.port);
    try {
        httpServer->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Cannot listen on " + gatewayConfig.bindAddress + ":" +
                                             std::to_string(gatewayConfig.port) + ": " + ex.what());
        return 1;
    }

    service::IdentitySweeper identitySweeper{io, registry, gatewayConfig.sweepInterval};
    identitySweeper.start();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Signal " + std::to_string(signal) + " received, shutting down");
        httpServer->stop();
        proxyService.stop();
        identitySweeper.stop();
        io.stop();
    });

    util::log(util::LogLevel::info, "Proxy gateway listening on " + gatewayConfig.bindAddress + ":" +
                                        std::to_string(gatewayConfig.port));
    util::log(util::LogLevel::info, "Rotation cooldown: " +
                                        std::to_string(gatewayConfig.rotationCooldown.count()) + " ms");
    util::log(util::LogLevel::info, "Available proxies: " + std::to_string(proxyPool.snapshotLength()));
    if (gatewayConfig.adminApiKey) {
        util::log(util::LogLevel::info, "Admin API enabled for proxy management");
    } else {
        util::log(util::LogLevel::warn, "ADMIN_API_KEY not set - proxy management API disabled");
    }

    unsigned int ioThreadsCount = std::max(1u, gatewayConfig.ioThreads);
    std::vector<std::thread> ioThreads;
    if (ioThreadsCount > 1) {
        ioThreads.reserve(ioThreadsCount - 1);
        for (unsigned int i = 0; i < ioThreadsCount - 1; ++i) {
            ioThreads.emplace_back([&io]() { io.run(); });
        }
    }

    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    util::log(util::LogLevel::info, "Server closed");
    return 0;
}
