#include "proxygate/server/Router.hpp"
#include "proxygate/server/Responses.hpp"
#include "proxygate/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string_view>

namespace proxygate::server {
namespace {
std::string normalizeMethod(std::string method) {
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return method;
}

// Absolute-form targets (forward proxy requests) never match a local route.
bool isOriginForm(const std::string& path) {
    return !path.empty() && path.front() == '/';
}
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = normalizeMethod(std::move(method));
    entry.path = std::move(path);
    entry.handler = std::move(handler);
    routes_.push_back(std::move(entry));
}

void Router::setFallback(Handler handler) {
    fallback_ = std::move(handler);
}

Router::Handler Router::resolve(const std::string& method, const std::string& target) const {
    if (isOriginForm(target)) {
        auto normalized = normalizeMethod(method);
        std::string_view path(target);
        path = path.substr(0, path.find('?'));
        if (path.size() > 1 && path.back() == '/') {
            path.remove_suffix(1);
        }
        for (const auto& entry : routes_) {
            if (!entry.method.empty() && entry.method != normalized) {
                continue;
            }
            if (path == entry.path) {
                return entry.handler;
            }
        }
    }

    return fallback_;
}

void Router::dispatch(RequestContext& ctx) const {
    auto handler = resolve(std::string(ctx.request.method_string()), std::string(ctx.request.target()));

    if (!handler) {
        sendError(ctx, boost::beast::http::status::not_found, "NotFound", "No route for " + std::string(ctx.request.target()));
        return;
    }

    try {
        handler(ctx);
    } catch (const util::GatewayError& ex) {
        sendError(ctx, ex);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Server error: " + std::string(ex.what()));
        ctx.response = {};
        ctx.response.version(ctx.request.version());
        sendError(ctx, util::GatewayError(util::ErrorCode::internal_error, ex.what()));
    }

    if (ctx.response.result() == boost::beast::http::status::unknown) {
        ctx.response.result(boost::beast::http::status::no_content);
        ctx.response.prepare_payload();
    }
}

} // namespace proxygate::server
