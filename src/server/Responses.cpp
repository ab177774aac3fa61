#include "proxygate/server/Responses.hpp"
#include "proxygate/util/JsonResponse.hpp"
#include "proxygate/util/JsonUtil.hpp"

namespace proxygate::server {

void sendJson(RequestContext& ctx, boost::beast::http::status status, const boost::json::value& body) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(body);
    ctx.response.prepare_payload();
}

void sendError(RequestContext& ctx, const util::GatewayError& error) {
    sendJson(ctx, static_cast<boost::beast::http::status>(error.status()), util::makeErrorBody(error));
}

void sendError(RequestContext& ctx,
               boost::beast::http::status status,
               std::string_view error,
               std::string_view message) {
    sendJson(ctx, status, util::makeErrorBody(error, message));
}

std::optional<std::string> headerValue(const RequestContext::HttpRequest& request,
                                       boost::beast::http::field field) {
    auto it = request.find(field);
    if (it == request.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

} // namespace proxygate::server
