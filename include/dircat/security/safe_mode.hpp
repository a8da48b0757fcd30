/*
 * dircat C++ - Safe Mode Configuration
 *
 * One explicit value threaded through every validator. Two presets:
 *   SafeModeConfig::strict()    - enabled, minimal allowances
 *   SafeModeConfig::defaults()  - disabled (local CLI use)
 * Validators take it by const reference and never modify it.
 */
#ifndef dircat_SECURITY_SAFE_MODE_HPP
#define dircat_SECURITY_SAFE_MODE_HPP

#include "outcomes.hpp"
#include "dns_resolver.hpp"
#include <dircat/core/config.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

struct SafeModeConfig {
    bool enabled;
    bool allow_local_paths;
    bool allow_symlinks;
    bool reject_hardlinks;

    // Exact hostnames or literal addresses ("140.82.112.3", "[2606:50c0::1]").
    // Unset means any public host is accepted.
    std::optional<std::set<std::string>> allowed_domains;

    // Roots local paths must stay under, in addition to the per-call root
    std::optional<std::vector<std::string>> allowed_roots;

    // Absolute paths scrubbed from outgoing error text
    std::vector<std::string> sensitive_roots;

    size_t max_pattern_length;
    size_t max_json_depth;
    size_t max_array_length;
    size_t max_body_bytes;
    size_t max_wildcards;
    size_t max_ref_length;
    int64_t request_timeout_ms;

    // Work bounds for the scan that follows admission. Unbounded by default.
    uint64_t max_file_size;     // one file read into memory
    uint64_t max_repo_size;     // a cloned repository on disk
    uint64_t max_output_size;   // the generated document
    size_t max_file_count;      // files processed per request
    bool allow_clipboard;

    // Used for domain names; a SystemDnsResolver when null
    std::shared_ptr<DnsResolver> resolver;

    SafeModeConfig();

    static SafeModeConfig strict();
    static SafeModeConfig defaults();

    // Reads the safe_mode.* keys. safe_mode.preset picks the base preset
    // ("strict" or "default"), the remaining keys override single fields.
    static SafeModeConfig from_config(const Config& cfg);

    void add_sensitive_root(const std::string& root);

    // Exact, case-insensitive allowlist test; true when no allowlist is set
    bool is_domain_allowed(const std::string& host) const;

    // Link policy derived from the flags above
    FileAccessPolicy file_policy() const;

    ValidationOutcome validate_input(const std::string& input) const;

    // Disabled mode admits every path, as the local CLI does. canonical_path is
    // the resolved path when it exists and the input unchanged when it does not.
    FileAccessOutcome validate_file_access(const std::string& path, const std::string& root) const;

    std::string sanitize_error(const std::string& message) const;
};

} // namespace dircat

#endif // dircat_SECURITY_SAFE_MODE_HPP
