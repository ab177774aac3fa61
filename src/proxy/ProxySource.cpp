#include "proxygate/proxy/ProxySource.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/HttpClient.hpp"
#include "proxygate/util/JsonUtil.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/beast/http/status.hpp>

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace proxygate::proxy {
namespace {

util::GatewayError invalidSpec(const std::string& message) {
    return util::GatewayError(util::ErrorCode::invalid_proxy_spec, message);
}

std::string requireText(const boost::json::object& json, const char* key) {
    auto value = util::getString(json, key);
    if (!value || value->empty()) {
        throw invalidSpec(std::string{"Missing required proxy field: "} + key);
    }
    return *value;
}

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

} // namespace

model::ProxyDescriptor parseProxyDescriptor(const boost::json::object& json) {
    model::ProxyDescriptor descriptor;
    descriptor.host = requireText(json, "host");

    if (!json.contains("port")) {
        throw invalidSpec("Missing required proxy field: port");
    }
    auto port = util::getInteger(json, "port");
    if (!port || *port <= 0 || *port > 65535) {
        throw invalidSpec("Invalid proxy port for " + descriptor.host);
    }
    descriptor.port = static_cast<std::uint16_t>(*port);

    descriptor.user = requireText(json, "user");
    descriptor.pass = requireText(json, "pass");
    return descriptor;
}

std::vector<model::ProxyDescriptor> parseProxyList(const boost::json::value& json) {
    const boost::json::array* entries = nullptr;
    if (json.is_array()) {
        entries = &json.as_array();
    } else if (json.is_object()) {
        if (auto it = json.as_object().if_contains("proxies"); it && it->is_array()) {
            entries = &it->as_array();
        }
    }
    if (!entries) {
        throw invalidSpec("Proxy list must be an array or an object with a proxies array");
    }

    std::vector<model::ProxyDescriptor> proxies;
    proxies.reserve(entries->size());
    std::size_t position = 0;
    for (const auto& item : *entries) {
        if (!item.is_object()) {
            throw invalidSpec("Proxy entry #" + std::to_string(position) + " is not an object");
        }
        try {
            proxies.push_back(parseProxyDescriptor(item.as_object()));
        } catch (const util::GatewayError& ex) {
            throw invalidSpec("Proxy entry #" + std::to_string(position) + ": " + ex.what());
        }
        ++position;
    }
    return proxies;
}

std::vector<model::ProxyDescriptor> parseProxyList(const std::string& payload) {
    boost::json::value json;
    try {
        json = util::parseJson(payload);
    } catch (const std::exception& ex) {
        throw invalidSpec(std::string{"Proxy list is not valid JSON: "} + ex.what());
    }
    return parseProxyList(json);
}

std::vector<model::ProxyDescriptor> fetchProxyList(const ProxyApiConfig& config,
                                                   util::HttpClient& httpClient) {
    std::vector<util::HttpClient::Header> headers{{"Accept", "application/json"}};
    if (config.apiKey) {
        headers.push_back({"Authorization", "Bearer " + *config.apiKey});
    }

    auto response = httpClient.fetch("GET", config.url, headers, "", config.timeout);

    if (response.result() != boost::beast::http::status::ok) {
        throw std::runtime_error("Proxy API returned status " + std::to_string(response.result_int()));
    }

    auto trimmedBody = trimView(std::string_view{response.body()});
    if (trimmedBody.empty()) {
        throw std::runtime_error("Proxy API returned an empty body");
    }

    auto proxies = parseProxyList(response.body());
    util::log(util::LogLevel::info, "Loaded " + std::to_string(proxies.size()) + " proxies from API");
    return proxies;
}

} // namespace proxygate::proxy
