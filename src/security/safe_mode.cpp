/*
 * dircat C++ - Safe Mode Configuration Implementation
 */
#include <dircat/security/safe_mode.hpp>
#include <dircat/security/input_validator.hpp>
#include <dircat/security/file_access.hpp>
#include <dircat/security/error_sanitizer.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <limits>

namespace dircat {

namespace {

static const size_t kMiB = 1024 * 1024;

static std::string normalize_host(const std::string& host) {
    std::string h = to_lower(trim(host));
    if (h.size() >= 2 && h[0] == '[' && h[h.size() - 1] == ']') {
        h = h.substr(1, h.size() - 2);
    }
    if (!h.empty() && h[h.size() - 1] == '.') {
        h.erase(h.size() - 1);
    }
    return h;
}

template <typename T>
static void read_limit(const Config& cfg, const std::string& key, T& field) {
    if (!cfg.has(key)) return;
    int64_t v = cfg.get_int(key, 0);
    if (v <= 0) {
        LOG_WARN("[SafeMode] %s must be positive, keeping %llu", key.c_str(),
                 static_cast<unsigned long long>(field));
        return;
    }
    field = static_cast<T>(v);
}

} // namespace

SafeModeConfig::SafeModeConfig()
    : enabled(false)
    , allow_local_paths(true)
    , allow_symlinks(true)
    , reject_hardlinks(true)
    , max_pattern_length(1000)
    , max_json_depth(128)
    , max_array_length(10000)
    , max_body_bytes(2 * kMiB)
    , max_wildcards(4)
    , max_ref_length(255)
    , request_timeout_ms(3600000)
    , max_file_size(std::numeric_limits<uint64_t>::max())
    , max_repo_size(std::numeric_limits<uint64_t>::max())
    , max_output_size(std::numeric_limits<uint64_t>::max())
    , max_file_count(std::numeric_limits<size_t>::max())
    , allow_clipboard(true)
{}

SafeModeConfig SafeModeConfig::strict() {
    SafeModeConfig c;
    c.enabled = true;
    c.allow_local_paths = false;
    c.allow_symlinks = false;
    c.reject_hardlinks = true;

    std::set<std::string> domains;
    domains.insert("github.com");
    domains.insert("gitlab.com");
    c.allowed_domains = domains;

    c.max_pattern_length = 256;
    c.max_json_depth = 32;
    c.max_array_length = 1000;
    c.request_timeout_ms = 30000;

    c.max_file_size = 10 * kMiB;
    c.max_repo_size = 500 * kMiB;
    c.max_output_size = 50 * kMiB;
    c.max_file_count = 1000;
    c.allow_clipboard = false;
    return c;
}

SafeModeConfig SafeModeConfig::defaults() {
    return SafeModeConfig();
}

SafeModeConfig SafeModeConfig::from_config(const Config& cfg) {
    std::string preset = to_lower(cfg.get_string("safe_mode.preset", "default"));
    SafeModeConfig c;
    if (preset == "strict") {
        c = strict();
    } else if (preset != "default" && preset != "defaults") {
        LOG_WARN("[SafeMode] Unknown preset '%s', falling back to strict", preset.c_str());
        c = strict();
    }

    c.enabled = cfg.get_bool("safe_mode.enabled", c.enabled);
    c.allow_local_paths = cfg.get_bool("safe_mode.allow_local_paths", c.allow_local_paths);
    c.allow_symlinks = cfg.get_bool("safe_mode.allow_symlinks", c.allow_symlinks);
    c.reject_hardlinks = cfg.get_bool("safe_mode.reject_hardlinks", c.reject_hardlinks);
    c.allow_clipboard = cfg.get_bool("safe_mode.allow_clipboard", c.allow_clipboard);

    if (cfg.has("safe_mode.allowed_domains")) {
        std::set<std::string> domains;
        std::vector<std::string> list = cfg.get_string_list("safe_mode.allowed_domains");
        for (size_t i = 0; i < list.size(); ++i) {
            std::string d = normalize_host(list[i]);
            if (!d.empty()) domains.insert(d);
        }
        c.allowed_domains = domains;
    }

    if (cfg.has("safe_mode.allowed_roots")) {
        c.allowed_roots = cfg.get_string_list("safe_mode.allowed_roots");
    }

    std::vector<std::string> sensitive = cfg.get_string_list("safe_mode.sensitive_roots");
    for (size_t i = 0; i < sensitive.size(); ++i) {
        c.add_sensitive_root(sensitive[i]);
    }

    read_limit(cfg, "safe_mode.max_pattern_length", c.max_pattern_length);
    read_limit(cfg, "safe_mode.max_json_depth", c.max_json_depth);
    read_limit(cfg, "safe_mode.max_array_length", c.max_array_length);
    read_limit(cfg, "safe_mode.max_body_bytes", c.max_body_bytes);
    read_limit(cfg, "safe_mode.max_wildcards", c.max_wildcards);
    read_limit(cfg, "safe_mode.max_ref_length", c.max_ref_length);
    read_limit(cfg, "safe_mode.max_file_size", c.max_file_size);
    read_limit(cfg, "safe_mode.max_repo_size", c.max_repo_size);
    read_limit(cfg, "safe_mode.max_output_size", c.max_output_size);
    read_limit(cfg, "safe_mode.max_file_count", c.max_file_count);

    int64_t timeout = cfg.get_int("safe_mode.request_timeout_ms", c.request_timeout_ms);
    if (timeout > 0) {
        c.request_timeout_ms = timeout;
    } else {
        LOG_WARN("[SafeMode] safe_mode.request_timeout_ms must be positive, keeping %lld",
                 static_cast<long long>(c.request_timeout_ms));
    }

    LOG_DEBUG("[SafeMode] enabled=%s local_paths=%s symlinks=%s hardlinks=%s domains=%s",
              c.enabled ? "yes" : "no",
              c.allow_local_paths ? "allowed" : "denied",
              c.allow_symlinks ? "allowed" : "denied",
              c.reject_hardlinks ? "rejected" : "allowed",
              c.allowed_domains ? std::to_string(c.allowed_domains->size()).c_str() : "any");
    return c;
}

void SafeModeConfig::add_sensitive_root(const std::string& root) {
    std::string r = trim(root);
    if (r.empty()) return;
    for (size_t i = 0; i < sensitive_roots.size(); ++i) {
        if (sensitive_roots[i] == r) return;
    }
    sensitive_roots.push_back(r);
}

bool SafeModeConfig::is_domain_allowed(const std::string& host) const {
    if (!allowed_domains) return true;

    std::string h = normalize_host(host);
    if (h.empty()) return false;
    for (std::set<std::string>::const_iterator it = allowed_domains->begin();
         it != allowed_domains->end(); ++it) {
        if (normalize_host(*it) == h) return true;
    }
    return false;
}

FileAccessPolicy SafeModeConfig::file_policy() const {
    FileAccessPolicy policy;
    policy.require_containment = true;
    policy.reject_hardlinks = reject_hardlinks;
    policy.reject_symlinks = !allow_symlinks;
    return policy;
}

ValidationOutcome SafeModeConfig::validate_input(const std::string& input) const {
    return dircat::validate_input(input, *this);
}

FileAccessOutcome SafeModeConfig::validate_file_access(const std::string& path,
                                                       const std::string& root) const {
    if (!enabled) {
        FileAccessPolicy relaxed;
        relaxed.require_containment = false;
        relaxed.reject_hardlinks = false;
        relaxed.reject_symlinks = false;
        FileAccessOutcome resolved = dircat::validate_file_access(path, "", nullptr, relaxed);
        if (resolved.success) return resolved;
        return FileAccessOutcome::ok(path);
    }
    const std::vector<std::string>* roots = allowed_roots ? &(*allowed_roots) : nullptr;
    return dircat::validate_file_access(path, root, roots, file_policy());
}

std::string SafeModeConfig::sanitize_error(const std::string& message) const {
    return dircat::sanitize_error(message, *this);
}

} // namespace dircat
