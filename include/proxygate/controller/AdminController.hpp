#pragma once

#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/server/Router.hpp"

#include <boost/json.hpp>

#include <optional>
#include <string>

namespace proxygate::controller {

// Pool management behind a bearer token. Without a configured key every call
// is rejected.
class AdminController {
public:
    AdminController(proxy::ProxyPool& pool, std::optional<std::string> adminApiKey);

    void registerRoutes(proxygate::server::Router& router);

private:
    void handleProxies(proxygate::server::RequestContext& ctx);
    void authorize(const proxygate::server::RequestContext& ctx) const;

    boost::json::object addProxy(const boost::json::object* proxy);
    boost::json::object removeProxy(const boost::json::object* proxy);
    boost::json::object listProxies() const;
    boost::json::object clearProxies();

    proxy::ProxyPool& pool_;
    std::optional<std::string> adminApiKey_;
};

} // namespace proxygate::controller
