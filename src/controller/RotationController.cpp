#include "proxygate/controller/RotationController.hpp"
#include "proxygate/server/Responses.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/JsonResponse.hpp"
#include "proxygate/util/Logging.hpp"
#include "proxygate/util/ProcessStats.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <string>

namespace proxygate::controller {
namespace {

boost::json::object proxyJson(const model::ProxyDescriptor& proxy) {
    return boost::json::object{
        {"host", proxy.host},
        {"port", proxy.port},
        {"user", proxy.user},
    };
}

bool isRotationDenial(util::ErrorCode code) {
    return code == util::ErrorCode::rotation_cooldown_active || code == util::ErrorCode::rotation_in_progress;
}

} // namespace

RotationController::RotationController(rotation::IdentityRegistry& registry,
                                       const identity::IdentityResolver& resolver)
    : registry_(registry)
    , resolver_(resolver) {}

void RotationController::registerRoutes(proxygate::server::Router& router) {
    router.addRoute("GET", "/current", [this](auto& ctx) { handleCurrent(ctx); });
    router.addRoute("POST", "/rotate", [this](auto& ctx) { handleRotate(ctx); });
    router.addRoute("GET", "/status", [this](auto& ctx) { handleStatus(ctx); });
    router.addRoute("POST", "/reset-cooldown", [this](auto& ctx) { handleResetCooldown(ctx); });
}

std::string RotationController::identityOf(const proxygate::server::RequestContext& ctx) const {
    return identity::requireIdentity(
        resolver_, server::headerValue(ctx.request, boost::beast::http::field::authorization));
}

void RotationController::handleCurrent(proxygate::server::RequestContext& ctx) {
    auto user = identityOf(ctx);
    util::log(util::LogLevel::debug, "GET /current User:" + user);

    auto current = registry_.currentFor(user);
    boost::json::object payload{
        {"proxy", proxyJson(current.proxy)},
        {"index", current.position},
        {"total", current.total},
        {"connections", current.connections},
        {"timestamp", util::makeIsoTimestamp()},
    };
    server::sendJson(ctx, boost::beast::http::status::ok, payload);
}

void RotationController::handleRotate(proxygate::server::RequestContext& ctx) {
    auto user = identityOf(ctx);
    util::log(util::LogLevel::debug, "POST /rotate User:" + user);

    try {
        auto rotation = registry_.rotate(user);
        boost::json::object payload{
            {"success", true},
            {"rotation", boost::json::object{
                {"from", model::authorityOf(rotation.from)},
                {"to", model::authorityOf(rotation.to)},
                {"index", rotation.position},
                {"total", rotation.total},
            }},
            {"proxy", proxyJson(rotation.to)},
            {"timestamp", util::makeIsoTimestamp()},
            {"cooldownMs", registry_.guard().policy().cooldown.count()},
        };
        server::sendJson(ctx, boost::beast::http::status::ok, payload);
    } catch (const util::GatewayError& ex) {
        if (isRotationDenial(ex.code())) {
            util::log(util::LogLevel::warn, "ROTATION BLOCKED for " + user + ": " + ex.what());
        } else {
            util::log(util::LogLevel::error, "Rotation error for " + user + ": " + ex.what());
        }
        throw;
    }
}

void RotationController::handleStatus(proxygate::server::RequestContext& ctx) {
    auto user = identityOf(ctx);
    auto status = registry_.status(user);
    auto stats = util::sampleProcessStats();

    boost::json::value proxy = nullptr;
    std::size_t totalProxies = 0;
    if (status.current) {
        auto object = proxyJson(status.current->proxy);
        object["index"] = status.current->position;
        object["total"] = status.current->total;
        proxy = std::move(object);
        totalProxies = status.current->total;
    }

    boost::json::value lastRotation = nullptr;
    if (status.guard.lastRotation) {
        lastRotation = util::formatIsoTimestamp(*status.guard.lastRotation);
    }

    boost::json::object payload{
        {"status", "online"},
        {"user", user},
        {"proxy", proxy},
        {"connections", status.connections},
        {"rotation", boost::json::object{
            {"locked", status.guard.locked},
            {"lastRotation", lastRotation},
            {"cooldownMs", registry_.guard().policy().cooldown.count()},
            {"canRotate", status.guard.canRotate},
        }},
        {"server", boost::json::object{
            {"uptime", stats.uptime.count()},
            {"memory", boost::json::object{
                {"rss", stats.residentBytes},
                {"virtual", stats.virtualBytes},
            }},
            {"activeUsers", registry_.identityCount()},
            {"totalProxies", totalProxies},
        }},
        {"timestamp", util::makeIsoTimestamp()},
    };
    server::sendJson(ctx, boost::beast::http::status::ok, payload);
}

void RotationController::handleResetCooldown(proxygate::server::RequestContext& ctx) {
    auto user = identityOf(ctx);
    registry_.reset(user);
    util::log(util::LogLevel::info, "Cooldown reset for user: " + user);

    boost::json::object payload{
        {"success", true},
        {"message", "Rotation cooldown reset"},
        {"user", user},
        {"timestamp", util::makeIsoTimestamp()},
    };
    server::sendJson(ctx, boost::beast::http::status::ok, payload);
}

} // namespace proxygate::controller
