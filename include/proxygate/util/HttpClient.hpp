#pragma once

#include "proxygate/routing/Forwarder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace proxygate::util {

class HttpClient : public routing::Forwarder {
public:
    using HttpRequest = routing::Forwarder::HttpRequest;
    using HttpResponse = routing::Forwarder::HttpResponse;

    struct Header {
        std::string name;
        std::string value;
    };

    HttpClient();

    // Direct request, used for the proxy list API.
    HttpResponse fetch(const std::string& method,
                       const std::string& url,
                       const std::vector<Header>& headers,
                       const std::string& body,
                       std::chrono::seconds timeout);

    HttpResponse forward(HttpRequest request,
                         const routing::RoutingDecision& decision,
                         std::chrono::seconds timeout) override;

private:
    boost::asio::ssl::context sslContext_;
};

// Builds the request sent to the upstream proxy: absolute-form target and the
// inbound Proxy-Authorization replaced by the upstream's. Authorization is left
// for the origin.
HttpClient::HttpRequest prepareUpstreamRequest(HttpClient::HttpRequest request,
                                               const routing::RoutingDecision& decision);

} // namespace proxygate::util
