#pragma once

#include "proxygate/routing/RequestRouter.hpp"

#include <boost/beast/http.hpp>

#include <chrono>

namespace proxygate::routing {

// Carries one request to the upstream chosen by RequestRouter.
class Forwarder {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    virtual ~Forwarder() = default;

    // Throws upstream_forwarding_error when the upstream cannot be reached.
    virtual HttpResponse forward(HttpRequest request,
                                 const RoutingDecision& decision,
                                 std::chrono::seconds timeout) = 0;
};

} // namespace proxygate::routing
