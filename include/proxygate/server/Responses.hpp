#pragma once

#include "proxygate/server/RequestContext.hpp"
#include "proxygate/util/Errors.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proxygate::server {

void sendJson(RequestContext& ctx, boost::beast::http::status status, const boost::json::value& body);
void sendError(RequestContext& ctx, const util::GatewayError& error);
void sendError(RequestContext& ctx,
               boost::beast::http::status status,
               std::string_view error,
               std::string_view message);

std::optional<std::string> headerValue(const RequestContext::HttpRequest& request,
                                       boost::beast::http::field field);

} // namespace proxygate::server
