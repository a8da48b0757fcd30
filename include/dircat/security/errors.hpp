/*
 * dircat C++ - Safe Mode Errors
 *
 * Closed set of rejection reasons produced by the validation layer, and the
 * result structs returned by every validator. Callers switch over
 * SecurityErrorKind without a default so new kinds are caught at compile time.
 */
#ifndef dircat_SECURITY_ERRORS_HPP
#define dircat_SECURITY_ERRORS_HPP

#include <string>

namespace dircat {

enum class SecurityErrorKind {
    ForbiddenScheme,
    DomainNotAllowed,
    PrivateOrLoopbackAddress,
    MalformedInput,
    LocalPathsDisabled,
    PathTraversal,
    HardlinkDetected,
    SymlinkNotAllowed,
    FileChanged,
    PatternTooLong,
    TooManyWildcards,
    InvalidReference,
    JsonTooDeep,
    ArrayTooLarge,
    PayloadTooLarge,
    ResourceLimitExceeded,
    ClipboardDisabled,
    ResolutionFailed,
    Timeout,
    NotFound,
    IoOther
};

// Stable identifier, e.g. "PatternTooLong"
const char* error_kind_name(SecurityErrorKind kind);

// HTTP status the service boundary answers with for this kind
int http_status_for(SecurityErrorKind kind);

struct SecurityError {
    SecurityErrorKind kind;
    std::string message;

    SecurityError() : kind(SecurityErrorKind::IoOther) {}
    SecurityError(SecurityErrorKind k, const std::string& msg) : kind(k), message(msg) {}
};

// Outcome of a check that produces nothing on success (ComplexityGuard)
struct GuardResult {
    bool success;
    SecurityError error;

    GuardResult() : success(true) {}

    static GuardResult ok() {
        return GuardResult();
    }

    static GuardResult fail(SecurityErrorKind kind, const std::string& message) {
        GuardResult r;
        r.success = false;
        r.error = SecurityError(kind, message);
        return r;
    }

    static GuardResult fail(const SecurityError& err) {
        GuardResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

} // namespace dircat

#endif // dircat_SECURITY_ERRORS_HPP
