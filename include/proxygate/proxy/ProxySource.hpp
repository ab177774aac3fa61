#pragma once

#include "proxygate/model/ProxyDescriptor.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace proxygate::util {
class HttpClient;
}

namespace proxygate::proxy {

struct ProxyApiConfig {
    std::string url;
    std::optional<std::string> apiKey;
    std::chrono::seconds timeout{10};
};

// Requires string host, user and pass and a port in 1..65535 (integer or numeric
// string). Throws invalid_proxy_spec naming the first offending field.
model::ProxyDescriptor parseProxyDescriptor(const boost::json::object& json);

// Accepts an array of descriptors or an object with a "proxies" array.
std::vector<model::ProxyDescriptor> parseProxyList(const boost::json::value& json);
std::vector<model::ProxyDescriptor> parseProxyList(const std::string& payload);

std::vector<model::ProxyDescriptor> fetchProxyList(const ProxyApiConfig& config,
                                                   util::HttpClient& httpClient);

} // namespace proxygate::proxy
