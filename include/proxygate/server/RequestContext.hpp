#pragma once

#include <boost/beast/http.hpp>
#include <chrono>
#include <string>

namespace proxygate::server {

struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpRequest request;
    HttpResponse response;
    std::chrono::steady_clock::time_point startedAt;
};

} // namespace proxygate::server
