/*
 * dircat C++ - Input Validator Implementation
 */
#include <dircat/security/input_validator.hpp>
#include <dircat/security/file_access.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <cctype>

namespace dircat {

namespace {

// git transports that run arbitrary commands or read arbitrary descriptors
static const char* const kDeniedTransports[] = { "ext", "fd" };

static bool is_scheme_name(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

static bool is_denied_transport(const std::string& input) {
    std::string lower = to_lower(ltrim(input));
    for (size_t i = 0; i < sizeof(kDeniedTransports) / sizeof(kDeniedTransports[0]); ++i) {
        std::string name(kDeniedTransports[i]);
        if (starts_with(lower, name + "::") || starts_with(lower, name + "://")) {
            return true;
        }
    }
    return false;
}

// "name::address" (git remote helper syntax)
static bool is_remote_helper(const std::string& input) {
    size_t pos = input.find("::");
    if (pos == std::string::npos || pos == 0) return false;
    return is_scheme_name(input.substr(0, pos));
}

// "user@host:path" or "host:path"; a single letter before the colon is a
// drive letter, a slash before it makes it a path.
static bool is_scp_like(const std::string& input) {
    size_t colon = input.find(':');
    if (colon == std::string::npos || colon < 2) return false;
    size_t slash = input.find('/');
    if (slash != std::string::npos && slash < colon) return false;
    return input.compare(colon, 2, "::") != 0;
}

static bool is_valid_host_label_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

static DnsResolver& system_resolver() {
    static SystemDnsResolver resolver;
    return resolver;
}

static ValidationOutcome block(SecurityErrorKind kind, const std::string& message,
                               const std::string& input) {
    LOG_WARN("[SafeMode] Blocked (%s): %s input='%s'",
             error_kind_name(kind), message.c_str(), escape_for_log(input).c_str());
    return ValidationOutcome::fail(kind, message);
}

static ValidationOutcome validate_local_path(const std::string& input, const SafeModeConfig& config) {
    if (!config.allow_local_paths) {
        return block(SecurityErrorKind::LocalPathsDisabled,
                     "Safe Mode: Local file system paths are disabled.", input);
    }
    if (!config.allowed_roots) {
        return ValidationOutcome::ok();
    }

    FileAccessOutcome access = validate_file_access(input, "", &(*config.allowed_roots),
                                                    config.file_policy());
    if (!access.success) {
        return ValidationOutcome::fail(access.error.kind, access.error.message);
    }
    return ValidationOutcome::ok();
}

} // namespace

// ============================================================================
// ParsedUrl
// ============================================================================

int ParsedUrl::effective_port() const {
    if (port >= 0) return port;
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return -1;
}

std::string ParsedUrl::bare_host() const {
    if (bracketed && host.size() >= 2) {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool parse_url(const std::string& input, ParsedUrl& out, std::string& error) {
    size_t sep = input.find("://");
    if (sep == std::string::npos) {
        error = "missing '://'";
        return false;
    }
    std::string scheme = input.substr(0, sep);
    if (!is_scheme_name(scheme)) {
        error = "invalid scheme";
        return false;
    }

    size_t start = sep + 3;
    size_t end = input.find_first_of("/?#", start);
    std::string authority = (end == std::string::npos)
        ? input.substr(start)
        : input.substr(start, end - start);

    if (authority.find('\\') != std::string::npos) {
        error = "backslash in authority";
        return false;
    }
    if (authority.find('%') != std::string::npos) {
        error = "percent-escape in authority";
        return false;
    }

    size_t at = authority.rfind('@');
    std::string hostport = (at == std::string::npos) ? authority : authority.substr(at + 1);

    ParsedUrl parsed;
    parsed.scheme = to_lower(scheme);
    parsed.path = (end == std::string::npos) ? "" : input.substr(end);

    std::string port_text;
    if (!hostport.empty() && hostport[0] == '[') {
        size_t close = hostport.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal";
            return false;
        }
        parsed.host = to_lower(hostport.substr(0, close + 1));
        parsed.bracketed = true;
        std::string rest = hostport.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                error = "garbage after IPv6 literal";
                return false;
            }
            port_text = rest.substr(1);
        }
    } else {
        size_t colon = hostport.find(':');
        if (colon != std::string::npos) {
            if (hostport.find(':', colon + 1) != std::string::npos) {
                error = "unbracketed IPv6 literal";
                return false;
            }
            port_text = hostport.substr(colon + 1);
            hostport = hostport.substr(0, colon);
        }
        parsed.host = to_lower(hostport);
        if (!parsed.host.empty() && parsed.host[parsed.host.size() - 1] == '.') {
            parsed.host.erase(parsed.host.size() - 1);
        }
        for (size_t i = 0; i < parsed.host.size(); ++i) {
            if (!is_valid_host_label_char(static_cast<unsigned char>(parsed.host[i]))) {
                error = "invalid character in host";
                return false;
            }
        }
        if (parsed.host.find("..") != std::string::npos ||
            (!parsed.host.empty() && parsed.host[0] == '.')) {
            error = "empty label in host";
            return false;
        }
    }

    if (parsed.host.empty() || parsed.host == "[]") {
        error = "empty host";
        return false;
    }

    if (!port_text.empty()) {
        if (!is_all_digits(port_text) || port_text.size() > 5) {
            error = "invalid port";
            return false;
        }
        int port = std::stoi(port_text);
        if (port < 1 || port > 65535) {
            error = "port out of range";
            return false;
        }
        parsed.port = port;
    }

    out = parsed;
    return true;
}

bool is_network_input(const std::string& input) {
    return input.find("://") != std::string::npos ||
           is_remote_helper(input) ||
           is_scp_like(input);
}

// ============================================================================
// validate_input
// ============================================================================

ValidationOutcome validate_input(const std::string& input, const SafeModeConfig& config) {
    if (contains_control_chars(input)) {
        return block(SecurityErrorKind::MalformedInput,
                     "Safe Mode: Input contains control characters.", input);
    }
    if (is_denied_transport(input)) {
        return block(SecurityErrorKind::ForbiddenScheme,
                     "Safe Mode: The 'ext' and 'fd' git transports are not allowed.", input);
    }
    if (!config.enabled) {
        return ValidationOutcome::ok();
    }

    if (!is_network_input(input)) {
        return validate_local_path(input, config);
    }
    size_t sep = input.find("://");
    if (sep == std::string::npos ||
        (is_scheme_name(input.substr(0, sep)) && to_lower(input.substr(0, sep)) != "https")) {
        return block(SecurityErrorKind::ForbiddenScheme,
                     "Safe Mode: Only 'https' protocol is allowed.", input);
    }

    ParsedUrl url;
    std::string parse_error;
    if (!parse_url(input, url, parse_error)) {
        return block(SecurityErrorKind::MalformedInput,
                     "Safe Mode: Invalid URL format (" + parse_error + ").", input);
    }

    // Numeric hosts: every interpretation must be public
    std::vector<IpAddress> literals = parse_host_literals(url.host);
    if (url.bracketed && literals.empty()) {
        return block(SecurityErrorKind::MalformedInput,
                     "Safe Mode: Invalid IPv6 address literal.", input);
    }
    for (size_t i = 0; i < literals.size(); ++i) {
        AddressClass cls = classify(literals[i]);
        if (!is_public(cls)) {
            return block(SecurityErrorKind::PrivateOrLoopbackAddress,
                         std::string("Safe Mode: Host is a ") + address_class_name(cls) +
                         " address.", input);
        }
    }
    if (literals.size() > 1) {
        return block(SecurityErrorKind::MalformedInput,
                     "Safe Mode: Ambiguous numeric host.", input);
    }
    if (literals.empty() && host_ends_in_number(url.host)) {
        return block(SecurityErrorKind::MalformedInput,
                     "Safe Mode: Host looks numeric but is not a valid address.", input);
    }

    if (!config.is_domain_allowed(url.host)) {
        return block(SecurityErrorKind::DomainNotAllowed,
                     "Safe Mode: Domain '" + url.host + "' is not in the allowlist.", input);
    }

    if (!literals.empty()) {
        LOG_DEBUG("[SafeMode] Literal host %s accepted", literals[0].to_string().c_str());
        return ValidationOutcome::ok(literals[0]);
    }

    DnsResolver& resolver = config.resolver ? *config.resolver : system_resolver();
    ResolveResult resolved = resolver.resolve(url.host);
    if (!resolved.success || resolved.addresses.empty()) {
        return block(SecurityErrorKind::ResolutionFailed,
                     "Safe Mode: Could not resolve hostname '" + url.host + "'.", input);
    }

    for (size_t i = 0; i < resolved.addresses.size(); ++i) {
        AddressClass cls = classify(resolved.addresses[i]);
        if (!is_public(cls)) {
            LOG_WARN("[SafeMode] Host '%s' resolved to %s address %s",
                     url.host.c_str(), address_class_name(cls),
                     resolved.addresses[i].to_string().c_str());
            return block(SecurityErrorKind::PrivateOrLoopbackAddress,
                         "Safe Mode: Domain resolves to a private/local IP address.", input);
        }
    }

    LOG_DEBUG("[SafeMode] %s pinned to %s", url.host.c_str(),
              resolved.addresses[0].to_string().c_str());
    return ValidationOutcome::ok(resolved.addresses[0]);
}

} // namespace dircat
