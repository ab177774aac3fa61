#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxygate::identity {

// Derives a caller identity from the inbound Authorization header value.
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    virtual std::optional<std::string> resolve(std::string_view authorization) const = 0;
};

// Throws unauthenticated when the header is absent or does not resolve.
std::string requireIdentity(const IdentityResolver& resolver, const std::optional<std::string>& authorization);

struct BasicCredentials {
    std::string username;
    std::string password;
};

std::optional<BasicCredentials> parseBasicCredentials(std::string_view authorization);

// Trusts the claimed username of a Basic credential. The password must be
// present but is not verified.
class ClaimedUsernameResolver : public IdentityResolver {
public:
    std::optional<std::string> resolve(std::string_view authorization) const override;
};

} // namespace proxygate::identity
