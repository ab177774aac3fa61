#include "proxygate/controller/ForwardController.hpp"
#include "proxygate/server/Responses.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/beast/http.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace proxygate::controller {
namespace {

constexpr std::array<std::string_view, 5> kReservedPrefixes{
    "/current", "/rotate", "/status", "/reset-cooldown", "/api/",
};

bool isReservedPath(std::string_view target) {
    for (auto prefix : kReservedPrefixes) {
        if (target.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }
    return false;
}

bool isHopByHop(boost::beast::http::field name) {
    switch (name) {
    case boost::beast::http::field::connection:
    case boost::beast::http::field::keep_alive:
    case boost::beast::http::field::transfer_encoding:
    case boost::beast::http::field::upgrade:
    case boost::beast::http::field::proxy_connection:
        return true;
    default:
        return false;
    }
}

void copyUpstreamResponse(proxygate::server::RequestContext& ctx,
                          routing::Forwarder::HttpResponse& upstream) {
    const bool headRequest = ctx.request.method() == boost::beast::http::verb::head;
    ctx.response.result(upstream.result_int());
    for (const auto& field : upstream.base()) {
        if (isHopByHop(field.name())) {
            continue;
        }
        if (!headRequest && field.name() == boost::beast::http::field::content_length) {
            continue;
        }
        ctx.response.insert(field.name_string(), field.value());
    }
    ctx.response.body() = std::move(upstream.body());
    if (!headRequest) {
        ctx.response.prepare_payload();
    }
}

} // namespace

ForwardController::ForwardController(routing::RequestRouter& requestRouter,
                                     const identity::IdentityResolver& resolver,
                                     routing::Forwarder& forwarder,
                                     std::chrono::seconds timeout)
    : requestRouter_(requestRouter)
    , resolver_(resolver)
    , forwarder_(forwarder)
    , timeout_(timeout) {}

void ForwardController::registerRoutes(proxygate::server::Router& router) {
    router.setFallback([this](auto& ctx) { handleForward(ctx); });
}

void ForwardController::handleForward(proxygate::server::RequestContext& ctx) {
    std::string target(ctx.request.target());
    if (isReservedPath(target)) {
        server::sendError(ctx, boost::beast::http::status::not_found, "NotFound", "No route for " + target);
        return;
    }
    if (ctx.request.method() == boost::beast::http::verb::connect) {
        throw util::GatewayError(util::ErrorCode::method_not_allowed, "CONNECT tunnelling is not supported");
    }

    // Proxy clients identify in Proxy-Authorization and may carry an origin
    // Authorization alongside it; that one is only used when it names the caller.
    auto request = ctx.request;
    std::optional<std::string> resolved;
    if (auto proxyAuthorization = server::headerValue(request, boost::beast::http::field::proxy_authorization)) {
        resolved = resolver_.resolve(*proxyAuthorization);
    }
    if (!resolved) {
        auto authorization = server::headerValue(request, boost::beast::http::field::authorization);
        resolved = identity::requireIdentity(resolver_, authorization);
        request.erase(boost::beast::http::field::authorization);
    }
    const auto& user = *resolved;

    routing::InboundRequest inbound;
    inbound.method = std::string(ctx.request.method_string());
    inbound.path = target;
    inbound.agent = server::headerValue(ctx.request, boost::beast::http::field::user_agent).value_or("");
    auto decision = requestRouter_.route(user, inbound);

    try {
        auto upstream = forwarder_.forward(std::move(request), decision, timeout_);
        copyUpstreamResponse(ctx, upstream);
    } catch (const util::GatewayError& ex) {
        util::log(util::LogLevel::error, "PROXY ERROR for " + user + ": " + ex.what());
        throw;
    }
}

} // namespace proxygate::controller
