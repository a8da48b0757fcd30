/*
 * dircat C++ - File Access Validator Implementation
 */
#include <dircat/security/file_access.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace dircat {

// ============================================================================
// ScopedFd
// ============================================================================

ScopedFd::~ScopedFd() {
    reset();
}

ScopedFd& ScopedFd::operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
        reset(other.fd_);
        other.fd_ = -1;
    }
    return *this;
}

int ScopedFd::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void ScopedFd::reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

static bool is_missing_errno(int err) {
    return err == ENOENT || err == ENOTDIR || err == ELOOP;
}

static FileAccessOutcome deny(SecurityErrorKind kind, const std::string& message,
                              const std::string& path) {
    LOG_WARN("[SafeMode] File access denied (%s): %s path='%s'",
             error_kind_name(kind), message.c_str(), escape_for_log(path).c_str());
    return FileAccessOutcome::fail(kind, message);
}

static bool canonicalize(const std::string& path, std::string& out, int& err) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == NULL) {
        err = errno;
        return false;
    }
    out = resolved;
    return true;
}

static bool is_contained(const std::string& canonical,
                         const std::string& root,
                         const std::vector<std::string>* allowed_roots) {
    std::vector<std::string> candidates;
    if (!root.empty()) candidates.push_back(root);
    if (allowed_roots) {
        candidates.insert(candidates.end(), allowed_roots->begin(), allowed_roots->end());
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        std::string canonical_root;
        int err = 0;
        if (!canonicalize(candidates[i], canonical_root, err)) {
            LOG_WARN("[SafeMode] Containment root '%s' cannot be resolved: %s",
                     escape_for_log(candidates[i]).c_str(), strerror(err));
            continue;
        }
        if (is_path_within(canonical, canonical_root)) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

FileAccessOutcome validate_file_access(const std::string& path,
                                       const std::string& root,
                                       const std::vector<std::string>* allowed_roots,
                                       const FileAccessPolicy& policy) {
    if (path.empty() || path.find('\0') != std::string::npos) {
        return deny(SecurityErrorKind::MalformedInput, "Safe Mode: Invalid path.", path);
    }

    if (policy.reject_symlinks) {
        struct stat lst;
        if (lstat(path.c_str(), &lst) != 0) {
            int err = errno;
            if (is_missing_errno(err)) {
                return FileAccessOutcome::fail(SecurityErrorKind::NotFound,
                    "Path not found: " + path);
            }
            return FileAccessOutcome::fail(SecurityErrorKind::IoOther,
                std::string("Cannot inspect path ") + path + ": " + strerror(err));
        }
        if (S_ISLNK(lst.st_mode)) {
            return deny(SecurityErrorKind::SymlinkNotAllowed,
                        "Safe Mode: Symlinks are disabled.", path);
        }
    }

    std::string canonical;
    int err = 0;
    if (!canonicalize(path, canonical, err)) {
        if (is_missing_errno(err)) {
            return FileAccessOutcome::fail(SecurityErrorKind::NotFound,
                "Path not found: " + path);
        }
        return FileAccessOutcome::fail(SecurityErrorKind::IoOther,
            std::string("Failed to resolve path ") + path + ": " + strerror(err));
    }

    if (policy.require_containment && !is_contained(canonical, root, allowed_roots)) {
        return deny(SecurityErrorKind::PathTraversal,
                    "Safe Mode Security Violation: '" + canonical + "' escapes the sandbox root.",
                    path);
    }

    struct stat st;
    if (stat(canonical.c_str(), &st) != 0) {
        err = errno;
        if (is_missing_errno(err)) {
            return FileAccessOutcome::fail(SecurityErrorKind::NotFound,
                "Path not found: " + path);
        }
        return FileAccessOutcome::fail(SecurityErrorKind::IoOther,
            std::string("Cannot stat ") + canonical + ": " + strerror(err));
    }

    if (policy.reject_hardlinks && S_ISREG(st.st_mode) && st.st_nlink > 1) {
        return deny(SecurityErrorKind::HardlinkDetected,
                    "Safe Mode: Hardlinks are not allowed (nlink > 1).", path);
    }

    return FileAccessOutcome::ok(canonical);
}

GuardResult verify_open_file(int fd, const std::string& canonical_path) {
    struct stat open_st;
    if (fstat(fd, &open_st) != 0) {
        return GuardResult::fail(SecurityErrorKind::IoOther,
            std::string("Cannot stat open file: ") + strerror(errno));
    }

    struct stat path_st;
    if (stat(canonical_path.c_str(), &path_st) != 0) {
        int err = errno;
        if (is_missing_errno(err)) {
            LOG_WARN("[SafeMode] TOCTOU: '%s' vanished after open",
                     escape_for_log(canonical_path).c_str());
            return GuardResult::fail(SecurityErrorKind::FileChanged,
                "Safe Mode Security Violation: The file at '" + canonical_path +
                "' changed during processing.");
        }
        return GuardResult::fail(SecurityErrorKind::IoOther,
            std::string("Cannot stat ") + canonical_path + ": " + strerror(err));
    }

    if (open_st.st_dev != path_st.st_dev || open_st.st_ino != path_st.st_ino) {
        LOG_WARN("[SafeMode] TOCTOU detected for '%s'", escape_for_log(canonical_path).c_str());
        return GuardResult::fail(SecurityErrorKind::FileChanged,
            "Safe Mode Security Violation: The file at '" + canonical_path +
            "' changed during processing.");
    }
    return GuardResult::ok();
}

FileAccessOutcome open_validated_file(const std::string& path,
                                      const std::string& root,
                                      const std::vector<std::string>* allowed_roots,
                                      const FileAccessPolicy& policy,
                                      ScopedFd& out) {
    FileAccessOutcome outcome = validate_file_access(path, root, allowed_roots, policy);
    if (!outcome.success) {
        return outcome;
    }

    ScopedFd fd(open(outcome.canonical_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.valid()) {
        int err = errno;
        if (err == ELOOP || err == ENOENT) {
            // Swapped for a symlink or removed since validation
            return deny(SecurityErrorKind::FileChanged,
                        "Safe Mode Security Violation: The file at '" + outcome.canonical_path +
                        "' changed during processing.", path);
        }
        return FileAccessOutcome::fail(SecurityErrorKind::IoOther,
            std::string("Cannot open ") + outcome.canonical_path + ": " + strerror(err));
    }

    struct stat st;
    if (fstat(fd.get(), &st) != 0) {
        return FileAccessOutcome::fail(SecurityErrorKind::IoOther,
            std::string("Cannot stat open file: ") + strerror(errno));
    }
    if (policy.reject_hardlinks && S_ISREG(st.st_mode) && st.st_nlink > 1) {
        return deny(SecurityErrorKind::HardlinkDetected,
                    "Safe Mode: Hardlinks are not allowed (nlink > 1).", path);
    }

    GuardResult same = verify_open_file(fd.get(), outcome.canonical_path);
    if (!same.success) {
        return FileAccessOutcome::fail(same.error.kind, same.error.message);
    }

    out = std::move(fd);
    return outcome;
}

} // namespace dircat
