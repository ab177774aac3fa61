#pragma once

#include "proxygate/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace proxygate::config {

struct GatewayConfig {
    std::string bindAddress{"0.0.0.0"};
    std::uint16_t port{37699};
    unsigned int ioThreads{2};

    std::chrono::milliseconds rotationCooldown{6000};
    std::chrono::milliseconds settleDelay{1000};
    // Unset means twice the cooldown.
    std::optional<std::chrono::milliseconds> stateRetention;
    std::chrono::milliseconds sweepInterval{300000};
    std::size_t ledgerCapacity{100};
    std::chrono::seconds forwardTimeout{30};

    std::optional<std::string> adminApiKey;

    std::optional<std::string> proxyList;
    std::optional<std::string> proxyApiUrl;
    std::optional<std::string> proxyApiKey;
    std::chrono::minutes proxyRefreshInterval{5};

    util::LogLevel logLevel{util::LogLevel::info};

    std::chrono::milliseconds effectiveRetention() const {
        return stateRetention.value_or(rotationCooldown * 2);
    }
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> processEnvironment(const char* name);

// Fields present in the object override the defaults already in config.
void applyJson(GatewayConfig& config, const boost::json::object& json);
void applyEnvironment(GatewayConfig& config, const EnvLookup& lookup = processEnvironment);

// Defaults, then the optional file, then the environment. Throws std::runtime_error
// on a malformed file or value.
GatewayConfig loadGatewayConfig(const std::optional<std::filesystem::path>& path,
                                const EnvLookup& lookup = processEnvironment);

} // namespace proxygate::config
