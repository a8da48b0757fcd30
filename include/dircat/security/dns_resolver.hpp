/*
 * dircat C++ - Hostname Resolution
 *
 * InputValidator resolves domain names through this interface so tests and
 * embedders can substitute their own resolver.
 */
#ifndef dircat_SECURITY_DNS_RESOLVER_HPP
#define dircat_SECURITY_DNS_RESOLVER_HPP

#include "address.hpp"
#include <string>
#include <vector>

namespace dircat {

struct ResolveResult {
    bool success;
    std::vector<IpAddress> addresses;
    std::string error;

    ResolveResult() : success(false) {}

    static ResolveResult ok(const std::vector<IpAddress>& addrs) {
        ResolveResult r;
        r.success = true;
        r.addresses = addrs;
        return r;
    }

    static ResolveResult fail(const std::string& err) {
        ResolveResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

class DnsResolver {
public:
    virtual ~DnsResolver() = default;

    // Every address the name maps to, IPv4 and IPv6. Blocking.
    virtual ResolveResult resolve(const std::string& host) = 0;
};

// getaddrinfo() backed resolver
class SystemDnsResolver : public DnsResolver {
public:
    ResolveResult resolve(const std::string& host) override;
};

} // namespace dircat

#endif // dircat_SECURITY_DNS_RESOLVER_HPP
