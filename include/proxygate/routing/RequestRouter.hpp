#pragma once

#include "proxygate/model/ProxyDescriptor.hpp"
#include "proxygate/rotation/IdentityRegistry.hpp"
#include "proxygate/util/Clock.hpp"

#include <string>

namespace proxygate::routing {

struct InboundRequest {
    std::string method;
    std::string path;
    std::string agent;
};

struct RoutingDecision {
    model::ProxyDescriptor proxy;
    std::string target;               // http://host:port
    std::string upstreamAuthHeader;   // Proxy-Authorization value, empty without credentials
};

std::string upstreamAuthorization(const model::ProxyDescriptor& proxy);

// Picks the identity's current upstream and records the attempt in its ledger.
// Throws no_proxies_available; never falls back to another destination.
class RequestRouter {
public:
    RequestRouter(rotation::IdentityRegistry& registry, const util::Clock& clock);

    RoutingDecision route(const std::string& identity, const InboundRequest& request);

private:
    rotation::IdentityRegistry& registry_;
    const util::Clock& clock_;
};

} // namespace proxygate::routing
