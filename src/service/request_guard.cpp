/*
 * dircat C++ - Request Guard Implementation
 */
#include <dircat/service/request_guard.hpp>
#include <dircat/service/validation_pool.hpp>
#include <dircat/security/complexity_guard.hpp>
#include <dircat/security/input_validator.hpp>
#include <dircat/security/error_sanitizer.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <limits>

namespace dircat {

namespace {

static SecurityError malformed(const std::string& message) {
    return SecurityError(SecurityErrorKind::MalformedInput, message);
}

static bool read_required_string(const Json& body, const char* key,
                                 std::string& out, SecurityError& err) {
    Json::const_iterator it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        err = malformed(std::string("Field '") + key + "' is required and must be a string.");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool read_optional_string(const Json& body, const char* key,
                                 std::optional<std::string>& out, SecurityError& err) {
    Json::const_iterator it = body.find(key);
    if (it == body.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = malformed(std::string("Field '") + key + "' must be a string.");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool read_optional_u32(const Json& body, const char* key,
                              std::optional<uint32_t>& out, SecurityError& err) {
    Json::const_iterator it = body.find(key);
    if (it == body.end() || it->is_null()) return true;
    if (!it->is_number_unsigned() ||
        it->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        err = malformed(std::string("Field '") + key + "' must be a non-negative 32-bit integer.");
        return false;
    }
    out = static_cast<uint32_t>(it->get<uint64_t>());
    return true;
}

static bool read_optional_string_list(const Json& body, const char* key,
                                      const SafeModeConfig& config,
                                      std::optional<std::vector<std::string> >& out,
                                      SecurityError& err) {
    Json::const_iterator it = body.find(key);
    if (it == body.end() || it->is_null()) return true;
    if (!it->is_array()) {
        err = malformed(std::string("Field '") + key + "' must be an array of strings.");
        return false;
    }

    GuardResult size_ok = check_array_length(it->size(), config, key);
    if (!size_ok.success) {
        err = size_ok.error;
        return false;
    }

    std::vector<std::string> items;
    items.reserve(it->size());
    for (Json::const_iterator item = it->begin(); item != it->end(); ++item) {
        if (!item->is_string()) {
            err = malformed(std::string("Field '") + key + "' must be an array of strings.");
            return false;
        }
        std::string value = item->get<std::string>();
        if (contains_control_chars(value)) {
            err = malformed(std::string("Field '") + key + "' contains control characters.");
            return false;
        }
        items.push_back(value);
    }
    out = items;
    return true;
}

template <typename Request>
static GuardedRequest<Request> rejected(const RequestGuard& guard, const SecurityError& error) {
    GuardedRequest<Request> r;
    r.success = false;
    r.response = guard.error_response(error);
    return r;
}

} // namespace

RequestGuard::RequestGuard(const SafeModeConfig& config, ValidationPool* pool)
    : config_(config)
    , pool_(pool)
{}

GuardResponse RequestGuard::error_response(const SecurityError& error) const {
    Json body;
    body["error"] = sanitize_error(error.message, config_);
    body["kind"] = error_kind_name(error.kind);

    GuardResponse response;
    response.status = http_status_for(error.kind);
    response.body = body.dump();
    return response;
}

ValidationOutcome RequestGuard::validate_target(const std::string& input) const {
    if (pool_) {
        return pool_->validate(input, config_, config_.request_timeout_ms);
    }
    return validate_input(input, config_);
}

GuardResult RequestGuard::check_scan_limits(const ScanRequest& req) const {
    struct Field {
        const char* name;
        const std::optional<std::string>* value;
    };
    const Field patterns[] = {
        { "extensions", &req.extensions },
        { "exclude_extensions", &req.exclude_extensions },
        { "path_regex", &req.path_regex },
        { "filename_regex", &req.filename_regex },
        { "exclude_path_regex", &req.exclude_path_regex },
        { "ignore_patterns", &req.ignore_patterns },
    };

    for (size_t i = 0; i < sizeof(patterns) / sizeof(patterns[0]); ++i) {
        if (!*patterns[i].value) continue;
        GuardResult r = check_pattern_length(**patterns[i].value, config_, patterns[i].name);
        if (!r.success) return r;
    }

    if (req.ignore_patterns) {
        GuardResult r = check_wildcards(*req.ignore_patterns, config_, "ignore_patterns");
        if (!r.success) return r;
    }
    if (req.git_branch) {
        GuardResult r = check_git_ref(*req.git_branch, config_);
        if (!r.success) return r;
    }
    return GuardResult::ok();
}

GuardResult RequestGuard::check_generate_limits(const GenerateRequest& req) const {
    if (req.selected_files) {
        GuardResult r = check_file_count(req.selected_files->size(), config_);
        if (!r.success) return r;
    }
    if (req.process_last) {
        GuardResult r = check_pattern_length(*req.process_last, config_, "process_last");
        if (!r.success) return r;
    }
    if (req.git_branch) {
        GuardResult r = check_git_ref(*req.git_branch, config_);
        if (!r.success) return r;
    }
    return GuardResult::ok();
}

GuardedRequest<ScanRequest> RequestGuard::guard_scan(const std::string& body) const {
    Json parsed;
    GuardResult r = parse_guarded_json(body, config_, parsed);
    if (!r.success) return rejected<ScanRequest>(*this, r.error);
    if (!parsed.is_object()) {
        return rejected<ScanRequest>(*this, malformed("Request body must be a JSON object."));
    }

    ScanRequest req;
    SecurityError err;
    if (!read_required_string(parsed, "input_path", req.input_path, err) ||
        !read_optional_string(parsed, "extensions", req.extensions, err) ||
        !read_optional_string(parsed, "exclude_extensions", req.exclude_extensions, err) ||
        !read_optional_string(parsed, "path_regex", req.path_regex, err) ||
        !read_optional_string(parsed, "filename_regex", req.filename_regex, err) ||
        !read_optional_string(parsed, "exclude_path_regex", req.exclude_path_regex, err) ||
        !read_optional_string(parsed, "ignore_patterns", req.ignore_patterns, err) ||
        !read_optional_string(parsed, "git_branch", req.git_branch, err) ||
        !read_optional_u32(parsed, "git_depth", req.git_depth, err) ||
        !read_optional_string(parsed, "request_id", req.request_id, err)) {
        return rejected<ScanRequest>(*this, err);
    }

    r = check_scan_limits(req);
    if (!r.success) return rejected<ScanRequest>(*this, r.error);

    ValidationOutcome target = validate_target(req.input_path);
    if (!target.success) return rejected<ScanRequest>(*this, target.error);

    LOG_DEBUG("[RequestGuard] scan accepted for '%s'", escape_for_log(req.input_path).c_str());

    GuardedRequest<ScanRequest> accepted;
    accepted.success = true;
    accepted.request = req;
    accepted.pinned = target.resolved;
    return accepted;
}

GuardedRequest<GenerateRequest> RequestGuard::guard_generate(const std::string& body) const {
    Json parsed;
    GuardResult r = parse_guarded_json(body, config_, parsed);
    if (!r.success) return rejected<GenerateRequest>(*this, r.error);
    if (!parsed.is_object()) {
        return rejected<GenerateRequest>(*this, malformed("Request body must be a JSON object."));
    }

    GenerateRequest req;
    SecurityError err;
    if (!read_required_string(parsed, "input_path", req.input_path, err) ||
        !read_optional_string_list(parsed, "selected_files", config_, req.selected_files, err) ||
        !read_optional_string(parsed, "git_branch", req.git_branch, err) ||
        !read_optional_string(parsed, "process_last", req.process_last, err) ||
        !read_optional_string(parsed, "request_id", req.request_id, err)) {
        return rejected<GenerateRequest>(*this, err);
    }

    r = check_generate_limits(req);
    if (!r.success) return rejected<GenerateRequest>(*this, r.error);

    ValidationOutcome target = validate_target(req.input_path);
    if (!target.success) return rejected<GenerateRequest>(*this, target.error);

    LOG_DEBUG("[RequestGuard] generate accepted for '%s' (%zu selected files)",
              escape_for_log(req.input_path).c_str(),
              req.selected_files ? req.selected_files->size() : static_cast<size_t>(0));

    GuardedRequest<GenerateRequest> accepted;
    accepted.success = true;
    accepted.request = req;
    accepted.pinned = target.resolved;
    return accepted;
}

} // namespace dircat
