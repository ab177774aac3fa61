#pragma once

#include "proxygate/identity/IdentityResolver.hpp"
#include "proxygate/routing/Forwarder.hpp"
#include "proxygate/routing/RequestRouter.hpp"
#include "proxygate/server/Router.hpp"

#include <chrono>

namespace proxygate::controller {

// Handles every request that is not a gateway endpoint by sending it through the
// caller's current upstream.
class ForwardController {
public:
    ForwardController(routing::RequestRouter& requestRouter,
                      const identity::IdentityResolver& resolver,
                      routing::Forwarder& forwarder,
                      std::chrono::seconds timeout);

    void registerRoutes(proxygate::server::Router& router);

private:
    void handleForward(proxygate::server::RequestContext& ctx);

    routing::RequestRouter& requestRouter_;
    const identity::IdentityResolver& resolver_;
    routing::Forwarder& forwarder_;
    std::chrono::seconds timeout_;
};

} // namespace proxygate::controller
