/*
 * dircat C++ - Input Validator
 *
 * Decides whether a repository URL or local path may be handed to git or
 * the directory walker. Gates, in order:
 *   1. control characters                          -> MalformedInput
 *   2. ext:: / fd:: transports (any spelling)      -> ForbiddenScheme
 *   3. (enabled) scheme, URL hygiene, local paths
 *   4. (enabled) numeric host interpretations      -> PrivateOrLoopbackAddress
 *   5. (enabled) domain allowlist                  -> DomainNotAllowed
 *   6. (enabled) DNS resolution, every answer vetted
 * A successful network check carries the address to pin the connection to.
 */
#ifndef dircat_SECURITY_INPUT_VALIDATOR_HPP
#define dircat_SECURITY_INPUT_VALIDATOR_HPP

#include "safe_mode.hpp"
#include <string>

namespace dircat {

struct ParsedUrl {
    std::string scheme;     // lowercase
    std::string host;       // lowercase, brackets kept for IPv6, trailing dot removed
    int port;               // -1 when absent
    std::string path;       // everything after the authority
    bool bracketed;

    ParsedUrl() : port(-1), bracketed(false) {}

    // Port the connection will use (443 for https when absent)
    int effective_port() const;

    // Host without IPv6 brackets
    std::string bare_host() const;
};

// Splits scheme://[userinfo@]host[:port][/path]. Userinfo is dropped.
// Returns false with a reason for anything that is not an unambiguous URL.
bool parse_url(const std::string& input, ParsedUrl& out, std::string& error);

// True for "scheme://..." and "name::address" inputs, and scp-like
// "user@host:path" forms git would hand to ssh.
bool is_network_input(const std::string& input);

ValidationOutcome validate_input(const std::string& input, const SafeModeConfig& config);

} // namespace dircat

#endif // dircat_SECURITY_INPUT_VALIDATOR_HPP
