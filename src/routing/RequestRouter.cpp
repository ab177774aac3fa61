#include "proxygate/routing/RequestRouter.hpp"
#include "proxygate/util/Base64.hpp"
#include "proxygate/util/Logging.hpp"

namespace proxygate::routing {

std::string upstreamAuthorization(const model::ProxyDescriptor& proxy) {
    if (proxy.user.empty() && proxy.pass.empty()) {
        return {};
    }
    return "Basic " + util::base64Encode(proxy.user + ":" + proxy.pass);
}

RequestRouter::RequestRouter(rotation::IdentityRegistry& registry, const util::Clock& clock)
    : registry_(registry)
    , clock_(clock) {}

RoutingDecision RequestRouter::route(const std::string& identity, const InboundRequest& request) {
    auto current = registry_.currentFor(identity);

    RoutingDecision decision;
    decision.target = "http://" + model::authorityOf(current.proxy);
    decision.upstreamAuthHeader = upstreamAuthorization(current.proxy);
    decision.proxy = std::move(current.proxy);

    model::ConnectionRecord record;
    record.target = decision.target;
    record.path = request.path;
    record.method = request.method;
    record.timestamp = clock_.now();
    record.agent = request.agent.empty() ? "unknown" : request.agent;
    registry_.record(identity, std::move(record));

    util::log(util::LogLevel::info,
              "PROXY " + identity + ": " + request.method + " " + request.path + " -> " + decision.target);
    return decision;
}

} // namespace proxygate::routing
