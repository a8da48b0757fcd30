/*
 * dircat C++ - Pinned HTTPS Client
 *
 * libcurl wrapper used after validate_input() has vetted a remote target.
 * The vetted address is installed with CURLOPT_RESOLVE so curl connects to
 * exactly that address instead of resolving the name again. Only https is
 * permitted and redirects are never followed.
 */
#ifndef dircat_NET_HTTP_CLIENT_HPP
#define dircat_NET_HTTP_CLIENT_HPP

#include <dircat/security/address.hpp>
#include <dircat/core/json.hpp>

#include <map>
#include <string>

namespace dircat {

struct PinnedAddress {
    std::string host;   // as it appears in the URL, without brackets
    int port;
    IpAddress address;

    PinnedAddress() : port(443) {}

    // "host:port:address" for CURLOPT_RESOLVE; IPv6 addresses are bracketed
    std::string resolve_entry() const;
};

// Pin `url`'s host and port to `address`. False if the URL does not parse.
bool make_pinned_address(const std::string& url, const IpAddress& address, PinnedAddress& out);

struct HttpResponse {
    long status_code;   // 0 when no response was received
    std::string body;
    std::string error;

    HttpResponse() : status_code(0) {}

    // Parsed body, or a discarded value if it is not JSON
    Json json() const;
};

class HttpClient {
public:
    HttpClient();

    void set_timeout(long seconds) { timeout_seconds_ = seconds; }
    void set_max_body_bytes(size_t bytes) { max_body_bytes_ = bytes; }
    void set_user_agent(const std::string& agent) { user_agent_ = agent; }

    // Every request goes to this address; the URL host must match pin.host
    void pin(const PinnedAddress& pinned);
    bool is_pinned() const { return pinned_; }

    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

    HttpResponse post_json(const std::string& url, const std::string& body,
                           const std::map<std::string, std::string>& headers = std::map<std::string, std::string>());

private:
    HttpResponse perform(const std::string& method, const std::string& url, const std::string& body,
                         const std::map<std::string, std::string>& headers);

    // Checks scheme and pin before any handle is created
    bool preflight(const std::string& url, std::string& error) const;

    long timeout_seconds_;
    size_t max_body_bytes_;
    std::string user_agent_;
    bool pinned_;
    PinnedAddress pin_;
};

} // namespace dircat

#endif // dircat_NET_HTTP_CLIENT_HPP
