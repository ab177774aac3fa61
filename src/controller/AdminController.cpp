#include "proxygate/controller/AdminController.hpp"
#include "proxygate/proxy/ProxySource.hpp"
#include "proxygate/server/Responses.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/JsonUtil.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/beast/http.hpp>
#include <openssl/crypto.h>

#include <string>
#include <string_view>

namespace proxygate::controller {
namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

util::GatewayError invalidRequest() {
    return util::GatewayError(util::ErrorCode::invalid_request, "Invalid action or missing proxy data");
}

bool tokensEqual(const std::string& presented, const std::string& expected) {
    if (presented.size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

} // namespace

AdminController::AdminController(proxy::ProxyPool& pool, std::optional<std::string> adminApiKey)
    : pool_(pool)
    , adminApiKey_(std::move(adminApiKey)) {}

void AdminController::registerRoutes(proxygate::server::Router& router) {
    router.addRoute("POST", "/api/proxies", [this](auto& ctx) { handleProxies(ctx); });
}

void AdminController::authorize(const proxygate::server::RequestContext& ctx) const {
    if (!adminApiKey_) {
        throw util::GatewayError(util::ErrorCode::admin_unauthorized, "Admin API disabled");
    }
    auto header = server::headerValue(ctx.request, boost::beast::http::field::authorization);
    if (!header || std::string_view(*header).substr(0, kBearerPrefix.size()) != kBearerPrefix ||
        !tokensEqual(header->substr(kBearerPrefix.size()), *adminApiKey_)) {
        throw util::GatewayError(util::ErrorCode::admin_unauthorized, "Unauthorized");
    }
}

void AdminController::handleProxies(proxygate::server::RequestContext& ctx) {
    authorize(ctx);

    boost::json::value body;
    try {
        body = util::parseJson(ctx.request.body());
    } catch (const std::exception&) {
        throw util::GatewayError(util::ErrorCode::invalid_request, "Request body must be JSON");
    }
    if (!body.is_object()) {
        throw invalidRequest();
    }
    const auto& object = body.as_object();
    auto action = util::getString(object, "action").value_or("");
    const boost::json::object* proxy = nullptr;
    if (auto it = object.if_contains("proxy"); it && it->is_object()) {
        proxy = &it->as_object();
    }

    boost::json::object payload;
    if (action == "add") {
        payload = addProxy(proxy);
    } else if (action == "remove") {
        payload = removeProxy(proxy);
    } else if (action == "list") {
        payload = listProxies();
    } else if (action == "clear") {
        payload = clearProxies();
    } else {
        throw invalidRequest();
    }
    server::sendJson(ctx, boost::beast::http::status::ok, payload);
}

boost::json::object AdminController::addProxy(const boost::json::object* proxy) {
    if (!proxy) {
        throw invalidRequest();
    }
    auto descriptor = proxy::parseProxyDescriptor(*proxy);
    auto authority = model::authorityOf(descriptor);
    auto total = pool_.add(std::move(descriptor));
    util::log(util::LogLevel::info, "Added proxy: " + authority);
    return boost::json::object{{"success", true}, {"message", "Proxy added"}, {"total", total}};
}

boost::json::object AdminController::removeProxy(const boost::json::object* proxy) {
    if (!proxy) {
        throw invalidRequest();
    }
    auto host = util::getString(*proxy, "host");
    auto port = util::getInteger(*proxy, "port");
    if (!host || host->empty() || !port || *port <= 0 || *port > 65535) {
        throw util::GatewayError(util::ErrorCode::invalid_proxy_spec, "Proxy host and port are required");
    }
    auto total = pool_.remove(*host, static_cast<std::uint16_t>(*port));
    util::log(util::LogLevel::info, "Removed proxy: " + *host + ":" + std::to_string(*port));
    return boost::json::object{{"success", true}, {"message", "Proxy removed"}, {"total", total}};
}

boost::json::object AdminController::listProxies() const {
    auto proxies = pool_.list();
    boost::json::array items;
    for (const auto& proxy : proxies) {
        items.emplace_back(boost::json::object{
            {"host", proxy.host},
            {"port", proxy.port},
            {"user", proxy.user},
        });
    }
    return boost::json::object{{"success", true}, {"proxies", items}, {"total", proxies.size()}};
}

boost::json::object AdminController::clearProxies() {
    auto removed = pool_.clear();
    util::log(util::LogLevel::info, "Cleared all proxies (" + std::to_string(removed) + " removed)");
    return boost::json::object{
        {"success", true},
        {"message", "Cleared " + std::to_string(removed) + " proxies"},
        {"removed", removed},
    };
}

} // namespace proxygate::controller
