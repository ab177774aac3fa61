#include "proxygate/util/Errors.hpp"

namespace proxygate::util {

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::unauthenticated: return "Unauthenticated";
    case ErrorCode::admin_unauthorized: return "Unauthorized";
    case ErrorCode::no_proxies_available: return "NoProxiesAvailable";
    case ErrorCode::rotation_cooldown_active: return "RotationCooldownActive";
    case ErrorCode::rotation_in_progress: return "RotationInProgress";
    case ErrorCode::proxy_not_found: return "ProxyNotFound";
    case ErrorCode::duplicate_proxy: return "DuplicateProxy";
    case ErrorCode::invalid_proxy_spec: return "InvalidProxySpec";
    case ErrorCode::invalid_request: return "InvalidRequest";
    case ErrorCode::method_not_allowed: return "MethodNotAllowed";
    case ErrorCode::upstream_forwarding_error: return "UpstreamForwardingError";
    case ErrorCode::internal_error: return "InternalError";
    }
    return "InternalError";
}

int httpStatusFor(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::unauthenticated:
    case ErrorCode::admin_unauthorized:
        return 401;
    case ErrorCode::no_proxies_available:
        return 503;
    case ErrorCode::rotation_cooldown_active:
    case ErrorCode::rotation_in_progress:
        return 429;
    case ErrorCode::proxy_not_found:
        return 404;
    case ErrorCode::duplicate_proxy:
        return 409;
    case ErrorCode::invalid_proxy_spec:
    case ErrorCode::invalid_request:
        return 400;
    case ErrorCode::method_not_allowed:
        return 405;
    case ErrorCode::upstream_forwarding_error:
        return 502;
    case ErrorCode::internal_error:
        return 500;
    }
    return 500;
}

} // namespace proxygate::util
