#pragma once

#include "proxygate/server/RequestContext.hpp"

#include <functional>
#include <string>
#include <vector>

namespace proxygate::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    void addRoute(std::string method, std::string path, Handler handler);
    // Receives every request no route matches.
    void setFallback(Handler handler);

    // Exact path match, ignoring the query and a trailing slash. Absolute-form
    // targets always get the fallback.
    Handler resolve(const std::string& method, const std::string& target) const;

    // Runs the resolved handler. Exceptions escaping it become a 500 response.
    void dispatch(RequestContext& ctx) const;

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
    Handler fallback_;
};

} // namespace proxygate::server
