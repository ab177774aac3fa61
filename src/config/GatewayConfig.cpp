#include "proxygate/config/GatewayConfig.hpp"
#include "proxygate/util/JsonUtil.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace proxygate::config {
namespace {

std::int64_t parseNumber(const char* name, const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw std::runtime_error(std::string{"invalid numeric value for "} + name + ": " + text);
    }
    return value;
}

std::int64_t requirePositive(const char* name, std::int64_t value) {
    if (value <= 0) {
        throw std::runtime_error(std::string{name} + " must be positive");
    }
    return value;
}

std::uint16_t requirePort(const char* name, std::int64_t value) {
    if (value <= 0 || value > 65535) {
        throw std::runtime_error(std::string{name} + " out of range: " + std::to_string(value));
    }
    return static_cast<std::uint16_t>(value);
}

util::LogLevel requireLevel(const std::string& text) {
    auto level = util::parseLogLevel(text);
    if (!level) {
        throw std::runtime_error("unknown log level: " + text);
    }
    return *level;
}

std::optional<std::int64_t> jsonInteger(const boost::json::object& json, const char* key) {
    if (!json.contains(key)) {
        return std::nullopt;
    }
    auto value = util::getInteger(json, key);
    if (!value) {
        throw std::runtime_error(std::string{"config field "} + key + " must be an integer");
    }
    return value;
}

std::optional<std::string> jsonString(const boost::json::object& json, const char* key) {
    if (!json.contains(key)) {
        return std::nullopt;
    }
    auto value = util::getString(json, key);
    if (!value) {
        throw std::runtime_error(std::string{"config field "} + key + " must be a string");
    }
    return value;
}

} // namespace

std::optional<std::string> processEnvironment(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string{value};
    }
    return std::nullopt;
}

void applyJson(GatewayConfig& config, const boost::json::object& json) {
    if (auto value = jsonString(json, "bindAddress")) config.bindAddress = *value;
    if (auto value = jsonInteger(json, "port")) config.port = requirePort("port", *value);
    if (auto value = jsonInteger(json, "ioThreads")) {
        config.ioThreads = static_cast<unsigned int>(requirePositive("ioThreads", *value));
    }
    if (auto value = jsonInteger(json, "rotationCooldownMs")) {
        config.rotationCooldown = std::chrono::milliseconds(requirePositive("rotationCooldownMs", *value));
    }
    if (auto value = jsonInteger(json, "settleDelayMs")) {
        config.settleDelay = std::chrono::milliseconds(std::max<std::int64_t>(0, *value));
    }
    if (auto value = jsonInteger(json, "stateRetentionMs")) {
        config.stateRetention = std::chrono::milliseconds(requirePositive("stateRetentionMs", *value));
    }
    if (auto value = jsonInteger(json, "sweepIntervalMs")) {
        config.sweepInterval = std::chrono::milliseconds(requirePositive("sweepIntervalMs", *value));
    }
    if (auto value = jsonInteger(json, "ledgerCapacity")) {
        config.ledgerCapacity = static_cast<std::size_t>(requirePositive("ledgerCapacity", *value));
    }
    if (auto value = jsonInteger(json, "forwardTimeoutSeconds")) {
        config.forwardTimeout = std::chrono::seconds(requirePositive("forwardTimeoutSeconds", *value));
    }
    if (auto value = jsonString(json, "adminApiKey"); value && !value->empty()) config.adminApiKey = *value;
    if (auto it = json.if_contains("proxies")) config.proxyList = util::stringifyJson(*it);
    if (auto value = jsonString(json, "proxyApiUrl"); value && !value->empty()) config.proxyApiUrl = *value;
    if (auto value = jsonString(json, "proxyApiKey"); value && !value->empty()) config.proxyApiKey = *value;
    if (auto value = jsonInteger(json, "proxyRefreshMinutes")) {
        config.proxyRefreshInterval = std::chrono::minutes(requirePositive("proxyRefreshMinutes", *value));
    }
    if (auto value = jsonString(json, "logLevel")) config.logLevel = requireLevel(*value);
}

void applyEnvironment(GatewayConfig& config, const EnvLookup& lookup) {
    if (auto value = lookup("PROXYGATE_BIND")) config.bindAddress = *value;
    if (auto value = lookup("PORT")) config.port = requirePort("PORT", parseNumber("PORT", *value));
    if (auto value = lookup("PROXYGATE_IO_THREADS")) {
        config.ioThreads = static_cast<unsigned int>(
            requirePositive("PROXYGATE_IO_THREADS", parseNumber("PROXYGATE_IO_THREADS", *value)));
    }
    if (auto value = lookup("ROTATION_COOLDOWN_MS")) {
        config.rotationCooldown = std::chrono::milliseconds(
            requirePositive("ROTATION_COOLDOWN_MS", parseNumber("ROTATION_COOLDOWN_MS", *value)));
    }
    if (auto value = lookup("ROTATION_SETTLE_MS")) {
        config.settleDelay = std::chrono::milliseconds(
            std::max<std::int64_t>(0, parseNumber("ROTATION_SETTLE_MS", *value)));
    }
    if (auto value = lookup("PROXYGATE_STATE_RETENTION_MS")) {
        config.stateRetention = std::chrono::milliseconds(requirePositive(
            "PROXYGATE_STATE_RETENTION_MS", parseNumber("PROXYGATE_STATE_RETENTION_MS", *value)));
    }
    if (auto value = lookup("PROXYGATE_SWEEP_INTERVAL_MS")) {
        config.sweepInterval = std::chrono::milliseconds(requirePositive(
            "PROXYGATE_SWEEP_INTERVAL_MS", parseNumber("PROXYGATE_SWEEP_INTERVAL_MS", *value)));
    }
    if (auto value = lookup("PROXYGATE_LEDGER_CAPACITY")) {
        config.ledgerCapacity = static_cast<std::size_t>(requirePositive(
            "PROXYGATE_LEDGER_CAPACITY", parseNumber("PROXYGATE_LEDGER_CAPACITY", *value)));
    }
    if (auto value = lookup("PROXYGATE_FORWARD_TIMEOUT_S")) {
        config.forwardTimeout = std::chrono::seconds(requirePositive(
            "PROXYGATE_FORWARD_TIMEOUT_S", parseNumber("PROXYGATE_FORWARD_TIMEOUT_S", *value)));
    }
    if (auto value = lookup("ADMIN_API_KEY"); value && !value->empty()) config.adminApiKey = *value;
    if (auto value = lookup("PROXY_LIST"); value && !value->empty()) config.proxyList = *value;
    if (auto value = lookup("PROXY_API_URL"); value && !value->empty()) config.proxyApiUrl = *value;
    if (auto value = lookup("PROXY_API_KEY"); value && !value->empty()) config.proxyApiKey = *value;
    if (auto value = lookup("PROXY_REFRESH_MINUTES")) {
        config.proxyRefreshInterval = std::chrono::minutes(
            requirePositive("PROXY_REFRESH_MINUTES", parseNumber("PROXY_REFRESH_MINUTES", *value)));
    }
    if (auto value = lookup("PROXYGATE_LOG_LEVEL")) config.logLevel = requireLevel(*value);
}

GatewayConfig loadGatewayConfig(const std::optional<std::filesystem::path>& path, const EnvLookup& lookup) {
    GatewayConfig config;
    config.ioThreads = std::max(2u, std::thread::hardware_concurrency());

    if (path) {
        std::ifstream ifs(*path);
        if (!ifs.is_open()) {
            throw std::runtime_error("cannot open config file " + path->string());
        }
        std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        boost::json::value json;
        try {
            json = util::parseJson(content);
        } catch (const std::exception& ex) {
            throw std::runtime_error("config file " + path->string() + " is not valid JSON: " + ex.what());
        }
        if (!json.is_object()) {
            throw std::runtime_error("config file " + path->string() + " must contain a JSON object");
        }
        applyJson(config, json.as_object());
    }

    applyEnvironment(config, lookup);
    return config;
}

} // namespace proxygate::config
