#include "proxygate/identity/IdentityResolver.hpp"
#include "proxygate/util/Base64.hpp"
#include "proxygate/util/Errors.hpp"

namespace proxygate::identity {
namespace {

constexpr std::string_view kBasicPrefix = "Basic ";

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

} // namespace

std::string requireIdentity(const IdentityResolver& resolver, const std::optional<std::string>& authorization) {
    if (authorization) {
        if (auto identity = resolver.resolve(*authorization)) {
            return *identity;
        }
    }
    throw util::GatewayError(util::ErrorCode::unauthenticated, "Unauthorized");
}

std::optional<BasicCredentials> parseBasicCredentials(std::string_view authorization) {
    if (authorization.substr(0, kBasicPrefix.size()) != kBasicPrefix) {
        return std::nullopt;
    }
    auto decoded = util::base64Decode(trimView(authorization.substr(kBasicPrefix.size())));
    if (!decoded) {
        return std::nullopt;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return BasicCredentials{decoded->substr(0, colon), decoded->substr(colon + 1)};
}

std::optional<std::string> ClaimedUsernameResolver::resolve(std::string_view authorization) const {
    auto credentials = parseBasicCredentials(authorization);
    if (!credentials || credentials->username.empty() || credentials->password.empty()) {
        return std::nullopt;
    }
    return credentials->username;
}

} // namespace proxygate::identity
