/*
 * dircat C++ - Validation Outcomes
 */
#ifndef dircat_SECURITY_OUTCOMES_HPP
#define dircat_SECURITY_OUTCOMES_HPP

#include "errors.hpp"
#include "address.hpp"
#include <optional>
#include <string>

namespace dircat {

// Result of validate_input(). `resolved` is set when a network target was
// vetted; connect to exactly that address.
struct ValidationOutcome {
    bool success;
    std::optional<IpAddress> resolved;
    SecurityError error;

    ValidationOutcome() : success(true) {}

    static ValidationOutcome ok() {
        return ValidationOutcome();
    }

    static ValidationOutcome ok(const IpAddress& address) {
        ValidationOutcome r;
        r.resolved = address;
        return r;
    }

    static ValidationOutcome fail(SecurityErrorKind kind, const std::string& message) {
        ValidationOutcome r;
        r.success = false;
        r.error = SecurityError(kind, message);
        return r;
    }
};

struct FileAccessPolicy {
    bool require_containment;
    bool reject_hardlinks;
    bool reject_symlinks;

    FileAccessPolicy()
        : require_containment(true)
        , reject_hardlinks(true)
        , reject_symlinks(true) {}
};

struct FileAccessOutcome {
    bool success;
    // realpath() of the input. Only a disabled SafeModeConfig hands back an
    // unresolved path, and only for one that does not exist.
    std::string canonical_path;
    SecurityError error;

    FileAccessOutcome() : success(false) {}

    static FileAccessOutcome ok(const std::string& canonical) {
        FileAccessOutcome r;
        r.success = true;
        r.canonical_path = canonical;
        return r;
    }

    static FileAccessOutcome fail(SecurityErrorKind kind, const std::string& message) {
        FileAccessOutcome r;
        r.success = false;
        r.error = SecurityError(kind, message);
        return r;
    }
};

} // namespace dircat

#endif // dircat_SECURITY_OUTCOMES_HPP
