/*
 * dircat C++ - IP Addresses and Address Classification
 *
 * IpAddress is a small value type for IPv4/IPv6 addresses. classify() maps an
 * address to the coarse class the SSRF checks care about; it is total and
 * performs no I/O. IPv6 forms that carry an IPv4 payload (mapped, compatible,
 * NAT64, 6to4) are classified by that payload.
 */
#ifndef dircat_SECURITY_ADDRESS_HPP
#define dircat_SECURITY_ADDRESS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

enum class AddressFamily {
    IPv4,
    IPv6
};

enum class AddressClass {
    Loopback,
    LinkLocal,
    Private,
    Unspecified,
    Multicast,
    Public
};

class IpAddress {
public:
    IpAddress();  // 0.0.0.0

    // value in host byte order: 0x7F000001 is 127.0.0.1
    static IpAddress from_v4(uint32_t value);
    static IpAddress from_v6(const unsigned char bytes[16]);

    // Canonical textual forms only (inet_pton): dotted quad or IPv6 without
    // brackets. Use parse_host_literals() for URL hosts.
    static bool parse(const std::string& text, IpAddress& out);

    AddressFamily family() const { return family_; }
    bool is_v4() const { return family_ == AddressFamily::IPv4; }

    uint32_t v4() const { return v4_; }
    const unsigned char* v6() const { return bytes_; }

    // IPv4 payload of ::ffff:a.b.c.d, ::ffff:0:a.b.c.d, ::a.b.c.d,
    // 64:ff9b::a.b.c.d and 2002:AABB:CCDD::/48. False for plain IPv6.
    bool embedded_v4(IpAddress& out) const;

    std::string to_string() const;

    bool operator==(const IpAddress& other) const;
    bool operator!=(const IpAddress& other) const { return !(*this == other); }

private:
    AddressFamily family_;
    uint32_t v4_;
    unsigned char bytes_[16];
};

AddressClass classify(const IpAddress& address);

inline bool is_public(AddressClass cls) { return cls == AddressClass::Public; }

const char* address_class_name(AddressClass cls);

// Every numeric interpretation of a URL host, one parse attempt per encoding:
// bracketed or bare IPv6, dotted decimal, a single 32-bit decimal integer,
// and inet_aton style components with 0x/0 prefixes. Duplicates are removed.
// Empty when no attempt succeeds.
std::vector<IpAddress> parse_host_literals(const std::string& host);

// True when the last label of the host is a number (decimal or 0x hex).
// Such a host is never a valid domain name.
bool host_ends_in_number(const std::string& host);

} // namespace dircat

#endif // dircat_SECURITY_ADDRESS_HPP
