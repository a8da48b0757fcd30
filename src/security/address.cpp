/*
 * dircat C++ - IP Addresses and Address Classification Implementation
 */
#include <dircat/security/address.hpp>
#include <dircat/core/utils.hpp>

#include <cctype>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace dircat {

// ============================================================================
// IpAddress
// ============================================================================

IpAddress::IpAddress()
    : family_(AddressFamily::IPv4)
    , v4_(0) {
    memset(bytes_, 0, sizeof(bytes_));
}

IpAddress IpAddress::from_v4(uint32_t value) {
    IpAddress a;
    a.family_ = AddressFamily::IPv4;
    a.v4_ = value;
    return a;
}

IpAddress IpAddress::from_v6(const unsigned char bytes[16]) {
    IpAddress a;
    a.family_ = AddressFamily::IPv6;
    memcpy(a.bytes_, bytes, sizeof(a.bytes_));
    return a;
}

bool IpAddress::parse(const std::string& text, IpAddress& out) {
    if (text.empty() || text.find('\0') != std::string::npos) return false;

    struct in_addr v4;
    if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        out = from_v4(ntohl(v4.s_addr));
        return true;
    }
    struct in6_addr v6;
    if (inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
        out = from_v6(v6.s6_addr);
        return true;
    }
    return false;
}

static bool all_zero(const unsigned char* p, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (p[i] != 0) return false;
    }
    return true;
}

static uint32_t read_be32(const unsigned char* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

bool IpAddress::embedded_v4(IpAddress& out) const {
    if (is_v4()) return false;
    const unsigned char* b = bytes_;

    // ::ffff:a.b.c.d (mapped)
    if (all_zero(b, 10) && b[10] == 0xFF && b[11] == 0xFF) {
        out = from_v4(read_be32(b + 12));
        return true;
    }
    // ::ffff:0:a.b.c.d (SIIT translated)
    if (all_zero(b, 8) && b[8] == 0xFF && b[9] == 0xFF && b[10] == 0 && b[11] == 0) {
        out = from_v4(read_be32(b + 12));
        return true;
    }
    // ::a.b.c.d (deprecated compatible form)
    if (all_zero(b, 12)) {
        out = from_v4(read_be32(b + 12));
        return true;
    }
    // 64:ff9b::a.b.c.d (NAT64 well-known prefix)
    if (b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xFF && b[3] == 0x9B && all_zero(b + 4, 8)) {
        out = from_v4(read_be32(b + 12));
        return true;
    }
    // 2002:AABB:CCDD::/48 (6to4)
    if (b[0] == 0x20 && b[1] == 0x02) {
        out = from_v4(read_be32(b + 2));
        return true;
    }
    return false;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN];
    if (is_v4()) {
        struct in_addr v4;
        v4.s_addr = htonl(v4_);
        if (inet_ntop(AF_INET, &v4, buf, sizeof(buf)) == NULL) return "";
    } else {
        struct in6_addr v6;
        memcpy(v6.s6_addr, bytes_, sizeof(bytes_));
        if (inet_ntop(AF_INET6, &v6, buf, sizeof(buf)) == NULL) return "";
    }
    return std::string(buf);
}

bool IpAddress::operator==(const IpAddress& other) const {
    if (family_ != other.family_) return false;
    if (is_v4()) return v4_ == other.v4_;
    return memcmp(bytes_, other.bytes_, sizeof(bytes_)) == 0;
}

// ============================================================================
// Classification
// ============================================================================

static AddressClass classify_v4(uint32_t v) {
    uint32_t first = v >> 24;

    if (first == 0) return AddressClass::Unspecified;           // 0.0.0.0/8
    if (first == 127) return AddressClass::Loopback;            // 127.0.0.0/8
    if (first == 10) return AddressClass::Private;              // 10.0.0.0/8
    if ((v & 0xFFF00000u) == 0xAC100000u) return AddressClass::Private;   // 172.16.0.0/12
    if ((v & 0xFFFF0000u) == 0xC0A80000u) return AddressClass::Private;   // 192.168.0.0/16
    if ((v & 0xFFFF0000u) == 0xA9FE0000u) return AddressClass::LinkLocal; // 169.254.0.0/16
    if ((v & 0xFFC00000u) == 0x64400000u) return AddressClass::Private;   // 100.64.0.0/10
    if ((v & 0xFFFFFF00u) == 0xC0000000u) return AddressClass::Private;   // 192.0.0.0/24
    if ((v & 0xFFFE0000u) == 0xC6120000u) return AddressClass::Private;   // 198.18.0.0/15
    if ((v & 0xF0000000u) == 0xE0000000u) return AddressClass::Multicast; // 224.0.0.0/4
    if ((v & 0xF0000000u) == 0xF0000000u) return AddressClass::Private;   // 240.0.0.0/4, broadcast
    return AddressClass::Public;
}

static AddressClass classify_v6(const IpAddress& address) {
    const unsigned char* b = address.v6();

    if (all_zero(b, 16)) return AddressClass::Unspecified;
    if (all_zero(b, 15) && b[15] == 1) return AddressClass::Loopback;

    IpAddress inner;
    if (address.embedded_v4(inner)) {
        return classify_v4(inner.v4());
    }

    if (b[0] == 0xFF) return AddressClass::Multicast;                       // ff00::/8
    if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return AddressClass::LinkLocal; // fe80::/10
    if (b[0] == 0xFE && (b[1] & 0xC0) == 0xC0) return AddressClass::Private;   // fec0::/10
    if ((b[0] & 0xFE) == 0xFC) return AddressClass::Private;                // fc00::/7
    return AddressClass::Public;
}

AddressClass classify(const IpAddress& address) {
    if (address.is_v4()) {
        return classify_v4(address.v4());
    }
    return classify_v6(address);
}

const char* address_class_name(AddressClass cls) {
    switch (cls) {
        case AddressClass::Loopback: return "loopback";
        case AddressClass::LinkLocal: return "link-local";
        case AddressClass::Private: return "private";
        case AddressClass::Unspecified: return "unspecified";
        case AddressClass::Multicast: return "multicast";
        case AddressClass::Public: return "public";
    }
    return "unknown";
}

// ============================================================================
// Host literal parsing
// ============================================================================

namespace {

// One number in an inet_aton style address: 0x1F (hex), 017 (octal), 17.
static bool parse_component(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;

    int base = 10;
    std::string digits = s;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        digits = s.substr(2);
    } else if (s.size() > 1 && s[0] == '0') {
        base = 8;
        digits = s.substr(1);
    }

    size_t first = digits.find_first_not_of('0');
    std::string significant = (first == std::string::npos) ? "" : digits.substr(first);
    size_t max_digits = (base == 16) ? 8 : (base == 8 ? 11 : 10);
    if (significant.size() > max_digits) return false;

    uint64_t value = 0;
    for (size_t i = 0; i < digits.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(digits[i]);
        int d;
        if (c >= '0' && c <= '9') {
            d = c - '0';
        } else if (base == 16 && std::isxdigit(c)) {
            d = std::tolower(c) - 'a' + 10;
        } else {
            return false;
        }
        if (d >= base) return false;
        value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(d);
    }
    out = value;
    return true;
}

static bool parse_ipv6_literal(const std::string& host, IpAddress& out) {
    std::string inner = host;
    if (!inner.empty() && inner[0] == '[') {
        if (inner.size() < 2 || inner[inner.size() - 1] != ']') return false;
        inner = inner.substr(1, inner.size() - 2);
    }
    if (inner.find(':') == std::string::npos) return false;

    // Zone identifiers (fe80::1%eth0, or %25eth0 inside URLs) do not change the class
    size_t zone = inner.find('%');
    if (zone != std::string::npos) {
        inner = inner.substr(0, zone);
    }

    struct in6_addr v6;
    if (inet_pton(AF_INET6, inner.c_str(), &v6) != 1) return false;
    out = IpAddress::from_v6(v6.s6_addr);
    return true;
}

// 127.0.0.1, and 0177.0.0.1 read as decimal 177.0.0.1
static bool parse_dotted_decimal(const std::string& host, IpAddress& out) {
    std::vector<std::string> parts = split(host, '.');
    if (parts.size() != 4) return false;

    uint32_t value = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!is_all_digits(parts[i])) return false;
        // 00000000127 is still 127; only significant digits are bounded
        size_t first = parts[i].find_first_not_of('0');
        std::string significant = (first == std::string::npos) ? "0" : parts[i].substr(first);
        if (significant.size() > 3) return false;
        unsigned long long octet = std::stoull(significant);
        if (octet > 255) return false;
        value = (value << 8) | static_cast<uint32_t>(octet);
    }
    out = IpAddress::from_v4(value);
    return true;
}

// 2130706433 read as a 32-bit big-endian address
static bool parse_decimal_integer(const std::string& host, IpAddress& out) {
    if (!is_all_digits(host)) return false;
    size_t first = host.find_first_not_of('0');
    std::string significant = (first == std::string::npos) ? "0" : host.substr(first);
    if (significant.size() > 10) return false;

    unsigned long long value = std::stoull(significant);
    if (value > 0xFFFFFFFFull) return false;
    out = IpAddress::from_v4(static_cast<uint32_t>(value));
    return true;
}

// inet_aton semantics: 1 to 4 parts, each 0x-hex, 0-octal or decimal, the
// last part filling the remaining bytes (127.1, 0x7f.0.0.1, 0177.0.0.1).
static bool parse_prefixed_components(const std::string& host, IpAddress& out) {
    std::vector<std::string> parts = split(host, '.');
    if (parts.empty() || parts.size() > 4) return false;

    std::vector<uint64_t> values;
    for (size_t i = 0; i < parts.size(); ++i) {
        uint64_t v;
        if (!parse_component(parts[i], v)) return false;
        values.push_back(v);
    }

    size_t n = values.size();
    for (size_t i = 0; i + 1 < n; ++i) {
        if (values[i] > 255) return false;
    }
    uint64_t last_max = (n == 1) ? 0xFFFFFFFFull : ((1ull << (8 * (5 - n))) - 1);
    if (values[n - 1] > last_max) return false;

    uint64_t value = values[n - 1];
    for (size_t i = 0; i + 1 < n; ++i) {
        value |= values[i] << (24 - 8 * i);
    }
    out = IpAddress::from_v4(static_cast<uint32_t>(value));
    return true;
}

typedef bool (*HostLiteralParser)(const std::string&, IpAddress&);

static const HostLiteralParser kHostLiteralParsers[] = {
    parse_ipv6_literal,
    parse_dotted_decimal,
    parse_decimal_integer,
    parse_prefixed_components,
};

} // namespace

std::vector<IpAddress> parse_host_literals(const std::string& host) {
    std::vector<IpAddress> found;
    if (host.empty()) return found;

    for (size_t i = 0; i < sizeof(kHostLiteralParsers) / sizeof(kHostLiteralParsers[0]); ++i) {
        IpAddress candidate;
        if (!kHostLiteralParsers[i](host, candidate)) continue;

        bool seen = false;
        for (size_t j = 0; j < found.size(); ++j) {
            if (found[j] == candidate) {
                seen = true;
                break;
            }
        }
        if (!seen) found.push_back(candidate);
    }
    return found;
}

bool host_ends_in_number(const std::string& host) {
    if (host.empty() || host[0] == '[' || host.find(':') != std::string::npos) return false;

    std::string h = host;
    if (h[h.size() - 1] == '.') h.erase(h.size() - 1);
    size_t dot = h.rfind('.');
    std::string label = (dot == std::string::npos) ? h : h.substr(dot + 1);
    if (label.empty()) return false;

    if (is_all_digits(label)) return true;
    if (label.size() >= 2 && label[0] == '0' && (label[1] == 'x' || label[1] == 'X')) {
        for (size_t i = 2; i < label.size(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(label[i]))) return false;
        }
        return true;
    }
    return false;
}

} // namespace dircat
