#pragma once

#include <cstdint>
#include <string>

namespace proxygate::model {

struct ProxyDescriptor {
    std::string host;
    std::uint16_t port{};
    std::string user;
    std::string pass;
};

// Public view of a descriptor; the password never leaves the pool.
struct ProxySummary {
    std::string host;
    std::uint16_t port{};
    std::string user;
};

inline ProxySummary summarize(const ProxyDescriptor& descriptor) {
    return ProxySummary{descriptor.host, descriptor.port, descriptor.user};
}

inline std::string authorityOf(const ProxyDescriptor& descriptor) {
    return descriptor.host + ":" + std::to_string(descriptor.port);
}

} // namespace proxygate::model
