/*
 * dircat C++ - Request Guard
 *
 * What a route handler calls with the raw request body. Runs every check in
 * a fixed order and either hands back the typed request together with the
 * address to pin, or a ready-made error response:
 *
 *   body size -> depth scan -> shape pass -> DOM parse -> field types
 *     -> file count / pattern / wildcard / ref limits -> validate_input (on the pool)
 *
 * Error bodies are {"error": <sanitized message>, "kind": <kind name>}.
 */
#ifndef dircat_SERVICE_REQUEST_GUARD_HPP
#define dircat_SERVICE_REQUEST_GUARD_HPP

#include <dircat/security/safe_mode.hpp>
#include <dircat/core/json.hpp>

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

class ValidationPool;

struct ScanRequest {
    std::string input_path;
    std::optional<std::string> extensions;
    std::optional<std::string> exclude_extensions;
    std::optional<std::string> path_regex;
    std::optional<std::string> filename_regex;
    std::optional<std::string> exclude_path_regex;
    std::optional<std::string> ignore_patterns;
    std::optional<std::string> git_branch;
    std::optional<uint32_t> git_depth;
    std::optional<std::string> request_id;
};

struct GenerateRequest {
    std::string input_path;
    std::optional<std::vector<std::string> > selected_files;
    std::optional<std::string> git_branch;
    std::optional<std::string> process_last;
    std::optional<std::string> request_id;
};

struct GuardResponse {
    int status;
    std::string body;

    GuardResponse() : status(200) {}
};

template <typename Request>
struct GuardedRequest {
    bool success;
    Request request;
    std::optional<IpAddress> pinned;
    GuardResponse response;

    GuardedRequest() : success(false) {}
};

class RequestGuard {
public:
    // `pool` is optional; without one validate_input runs inline
    explicit RequestGuard(const SafeModeConfig& config, ValidationPool* pool = nullptr);

    GuardedRequest<ScanRequest> guard_scan(const std::string& body) const;
    GuardedRequest<GenerateRequest> guard_generate(const std::string& body) const;

    // Status for the kind, message passed through the sanitizer once
    GuardResponse error_response(const SecurityError& error) const;

    const SafeModeConfig& config() const { return config_; }

private:
    GuardResult check_scan_limits(const ScanRequest& req) const;
    GuardResult check_generate_limits(const GenerateRequest& req) const;
    ValidationOutcome validate_target(const std::string& input) const;

    SafeModeConfig config_;
    ValidationPool* pool_;
};

} // namespace dircat

#endif // dircat_SERVICE_REQUEST_GUARD_HPP
