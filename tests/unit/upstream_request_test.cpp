#include "proxygate/util/Errors.hpp"
#include "proxygate/util/HttpClient.hpp"

#include <boost/beast/http.hpp>

#include <cassert>
#include <iostream>
#include <string>

namespace {

namespace http = boost::beast::http;
using proxygate::routing::RoutingDecision;
using proxygate::util::ErrorCode;
using proxygate::util::GatewayError;
using proxygate::util::HttpClient;
using proxygate::util::prepareUpstreamRequest;

RoutingDecision MakeDecision(std::string authHeader) {
    RoutingDecision decision;
    decision.proxy = proxygate::model::ProxyDescriptor{"10.0.0.1", 8001, "user1", "pass1"};
    decision.target = "http://10.0.0.1:8001";
    decision.upstreamAuthHeader = std::move(authHeader);
    return decision;
}

void TestAbsoluteTargetKeptAndProxyCredentialsSwapped() {
    HttpClient::HttpRequest request{http::verb::get, "http://example.com/ip", 11};
    request.set(http::field::host, "example.com");
    request.set(http::field::authorization, "Bearer origin-token");
    request.set(http::field::proxy_authorization, "Basic YWxpY2U6cHc=");
    request.set("Proxy-Connection", "keep-alive");

    auto upstream = prepareUpstreamRequest(request, MakeDecision("Basic dXNlcjE6cGFzczE="));
    assert(upstream.target() == "http://example.com/ip");
    assert(upstream[http::field::authorization] == "Bearer origin-token");
    assert(upstream[http::field::proxy_authorization] == "Basic dXNlcjE6cGFzczE=");
    assert(upstream.find("Proxy-Connection") == upstream.end());
    assert(!upstream.keep_alive());
}

void TestOriginFormRebuiltFromHost() {
    HttpClient::HttpRequest request{http::verb::post, "/submit?q=1", 11};
    request.set(http::field::host, "example.com:8080");
    request.body() = "payload";

    auto upstream = prepareUpstreamRequest(request, MakeDecision(""));
    assert(upstream.target() == "http://example.com:8080/submit?q=1");
    assert(upstream.find(http::field::proxy_authorization) == upstream.end());
    assert(upstream[http::field::content_length] == "7");
}

void TestMissingHostIsRejected() {
    HttpClient::HttpRequest request{http::verb::get, "/ip", 11};
    bool thrown = false;
    try {
        prepareUpstreamRequest(request, MakeDecision(""));
    } catch (const GatewayError& ex) {
        thrown = true;
        assert(ex.code() == ErrorCode::invalid_request);
    }
    assert(thrown);
}

} // namespace

int main() {
    TestAbsoluteTargetKeptAndProxyCredentialsSwapped();
    TestOriginFormRebuiltFromHost();
    TestMissingHostIsRejected();

    std::cout << "proxygate_unit_upstream_request: pass\n";
    return 0;
}
