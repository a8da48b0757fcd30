/*
 * dircat C++ - System Resolver
 */
#include <dircat/security/dns_resolver.hpp>
#include <dircat/core/logger.hpp>

#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace dircat {

ResolveResult SystemDnsResolver::resolve(const std::string& host) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0) {
        LOG_DEBUG("[Resolver] getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(rc));
        return ResolveResult::fail(gai_strerror(rc));
    }

    std::vector<IpAddress> addrs;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        IpAddress addr;
        if (ai->ai_family == AF_INET) {
            const struct sockaddr_in* sin = reinterpret_cast<const struct sockaddr_in*>(ai->ai_addr);
            addr = IpAddress::from_v4(ntohl(sin->sin_addr.s_addr));
        } else if (ai->ai_family == AF_INET6) {
            const struct sockaddr_in6* sin6 = reinterpret_cast<const struct sockaddr_in6*>(ai->ai_addr);
            addr = IpAddress::from_v6(sin6->sin6_addr.s6_addr);
        } else {
            continue;
        }

        bool seen = false;
        for (size_t i = 0; i < addrs.size(); ++i) {
            if (addrs[i] == addr) {
                seen = true;
                break;
            }
        }
        if (!seen) addrs.push_back(addr);
    }
    freeaddrinfo(res);

    LOG_DEBUG("[Resolver] %s -> %zu address(es)", host.c_str(), addrs.size());
    return ResolveResult::ok(addrs);
}

} // namespace dircat
