#pragma once

#include "proxygate/identity/IdentityResolver.hpp"
#include "proxygate/rotation/IdentityRegistry.hpp"
#include "proxygate/server/Router.hpp"

namespace proxygate::controller {

class RotationController {
public:
    RotationController(rotation::IdentityRegistry& registry, const identity::IdentityResolver& resolver);

    void registerRoutes(proxygate::server::Router& router);

private:
    void handleCurrent(proxygate::server::RequestContext& ctx);
    void handleRotate(proxygate::server::RequestContext& ctx);
    void handleStatus(proxygate::server::RequestContext& ctx);
    void handleResetCooldown(proxygate::server::RequestContext& ctx);

    std::string identityOf(const proxygate::server::RequestContext& ctx) const;

    rotation::IdentityRegistry& registry_;
    const identity::IdentityResolver& resolver_;
};

} // namespace proxygate::controller
