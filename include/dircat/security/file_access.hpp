/*
 * dircat C++ - File Access Validator
 *
 * Containment and link checks for paths taken from a request. The path is
 * canonicalized first, so a symlink pointing outside the root is caught by
 * the prefix check. Hard links are not visible to canonicalization and are
 * rejected by link count instead.
 */
#ifndef dircat_SECURITY_FILE_ACCESS_HPP
#define dircat_SECURITY_FILE_ACCESS_HPP

#include "outcomes.hpp"
#include <string>
#include <vector>

namespace dircat {

// Owning file descriptor, closed on destruction
class ScopedFd {
public:
    ScopedFd() : fd_(-1) {}
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd();

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ScopedFd& operator=(ScopedFd&& other) noexcept;

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

private:
    int fd_;
};

// `root` may be empty, in which case only `allowed_roots` count. With
// require_containment set the canonical path must sit under at least one
// of them. Directories are never link-count checked.
FileAccessOutcome validate_file_access(const std::string& path,
                                       const std::string& root,
                                       const std::vector<std::string>* allowed_roots,
                                       const FileAccessPolicy& policy);

// Device/inode of the open descriptor must match what the path names now
GuardResult verify_open_file(int fd, const std::string& canonical_path);

// validate_file_access(), then open with O_NOFOLLOW, re-check the link count
// on the descriptor and verify identity. On success `out` owns the file.
FileAccessOutcome open_validated_file(const std::string& path,
                                      const std::string& root,
                                      const std::vector<std::string>* allowed_roots,
                                      const FileAccessPolicy& policy,
                                      ScopedFd& out);

} // namespace dircat

#endif // dircat_SECURITY_FILE_ACCESS_HPP
