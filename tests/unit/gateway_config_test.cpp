#include "proxygate/config/GatewayConfig.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace {

using namespace std::chrono_literals;
using proxygate::config::EnvLookup;
using proxygate::config::GatewayConfig;
using proxygate::config::applyEnvironment;
using proxygate::config::applyJson;
using proxygate::config::loadGatewayConfig;
using proxygate::util::LogLevel;

EnvLookup MapLookup(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

template <class Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void TestDefaults() {
    auto config = loadGatewayConfig(std::nullopt, MapLookup({}));
    assert(config.port == 37699);
    assert(config.rotationCooldown == 6000ms);
    assert(config.settleDelay == 1000ms);
    assert(config.effectiveRetention() == 12000ms);
    assert(config.ledgerCapacity == 100);
    assert(config.ioThreads >= 2);
    assert(!config.adminApiKey);
    assert(!config.proxyList);
    assert(!config.proxyApiUrl);
    assert(config.logLevel == LogLevel::info);
}

void TestEnvironmentOverrides() {
    GatewayConfig config;
    applyEnvironment(config, MapLookup({{"PORT", "8080"},
                                        {"ROTATION_COOLDOWN_MS", "2000"},
                                        {"ROTATION_SETTLE_MS", "250"},
                                        {"ADMIN_API_KEY", "s3cret"},
                                        {"PROXY_LIST", "[]"},
                                        {"PROXY_API_URL", ""},
                                        {"PROXY_REFRESH_MINUTES", "15"},
                                        {"PROXYGATE_LOG_LEVEL", "debug"}}));
    assert(config.port == 8080);
    assert(config.rotationCooldown == 2000ms);
    assert(config.settleDelay == 250ms);
    assert(config.effectiveRetention() == 4000ms);
    assert(config.adminApiKey.value() == "s3cret");
    assert(config.proxyList.value() == "[]");
    assert(!config.proxyApiUrl);
    assert(config.proxyRefreshInterval == 15min);
    assert(config.logLevel == LogLevel::debug);
}

void TestInvalidEnvironmentValuesThrow() {
    GatewayConfig config;
    assert(Throws([&] { applyEnvironment(config, MapLookup({{"PORT", "http"}})); }));
    assert(Throws([&] { applyEnvironment(config, MapLookup({{"PORT", "70000"}})); }));
    assert(Throws([&] { applyEnvironment(config, MapLookup({{"ROTATION_COOLDOWN_MS", "0"}})); }));
    assert(Throws([&] { applyEnvironment(config, MapLookup({{"PROXYGATE_LOG_LEVEL", "loud"}})); }));
}

void TestJsonFields() {
    GatewayConfig config;
    boost::json::object json{{"port", 9000},
                             {"rotationCooldownMs", 500},
                             {"stateRetentionMs", 60000},
                             {"proxies", boost::json::array{boost::json::object{
                                             {"host", "a"}, {"port", 1}, {"user", "u"}, {"pass", "p"}}}},
                             {"logLevel", "warn"}};
    applyJson(config, json);
    assert(config.port == 9000);
    assert(config.rotationCooldown == 500ms);
    assert(config.effectiveRetention() == 60000ms);
    assert(config.proxyList.value().find("\"host\":\"a\"") != std::string::npos);
    assert(config.logLevel == LogLevel::warn);

    assert(Throws([&] { applyJson(config, boost::json::object{{"port", "not-a-port"}}); }));
    assert(Throws([&] { applyJson(config, boost::json::object{{"adminApiKey", 42}}); }));
}

void TestFileThenEnvironment() {
    auto path = std::filesystem::temp_directory_path() / "proxygate_gateway_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 9100, "adminApiKey": "from-file", "settleDelayMs": 10})";
    }

    auto config = loadGatewayConfig(path, MapLookup({{"PORT", "9200"}}));
    assert(config.port == 9200);
    assert(config.adminApiKey.value() == "from-file");
    assert(config.settleDelay == 10ms);

    {
        std::ofstream out(path);
        out << "[1, 2]";
    }
    assert(Throws([&] { loadGatewayConfig(path, MapLookup({})); }));
    std::filesystem::remove(path);

    assert(Throws([&] { loadGatewayConfig(path, MapLookup({})); }));
}

} // namespace

int main() {
    TestDefaults();
    TestEnvironmentOverrides();
    TestInvalidEnvironmentValuesThrow();
    TestJsonFields();
    TestFileThenEnvironment();

    std::cout << "proxygate_unit_gateway_config: pass\n";
    return 0;
}
