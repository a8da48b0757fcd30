/*
 * dircat C++ - Complexity Guard Implementation
 */
#include <dircat/security/complexity_guard.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <cctype>

namespace dircat {

namespace {

static GuardResult reject(SecurityErrorKind kind, const std::string& message) {
    LOG_WARN("[SafeMode] Request rejected (%s): %s", error_kind_name(kind), message.c_str());
    return GuardResult::fail(kind, message);
}

static bool is_ref_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/';
}

} // namespace

// ============================================================================
// Scalar checks
// ============================================================================

GuardResult check_pattern_length(const std::string& pattern,
                                 const SafeModeConfig& config,
                                 const std::string& field) {
    if (!config.enabled) return GuardResult::ok();
    if (pattern.size() > config.max_pattern_length) {
        return reject(SecurityErrorKind::PatternTooLong,
                      "Safe Mode: '" + field + "' exceeds maximum length of " +
                      std::to_string(config.max_pattern_length) + " characters.");
    }
    return GuardResult::ok();
}

GuardResult check_wildcards(const std::string& patterns,
                            const SafeModeConfig& config,
                            const std::string& field) {
    if (!config.enabled) return GuardResult::ok();

    size_t stars = 0;
    for (size_t i = 0; i <= patterns.size(); ++i) {
        if (i == patterns.size() || patterns[i] == '\n') {
            if (stars > config.max_wildcards) {
                return reject(SecurityErrorKind::TooManyWildcards,
                              "Safe Mode: '" + field + "' contains too many wildcards (limit " +
                              std::to_string(config.max_wildcards) + " per line).");
            }
            stars = 0;
        } else if (patterns[i] == '*') {
            ++stars;
        }
    }
    return GuardResult::ok();
}

GuardResult check_git_ref(const std::string& ref, const SafeModeConfig& config) {
    if (ref.empty()) {
        return reject(SecurityErrorKind::InvalidReference,
                      "Safe Mode: Empty git branch/tag name.");
    }
    if (ref.size() > config.max_ref_length) {
        return reject(SecurityErrorKind::InvalidReference,
                      "Safe Mode: git branch/tag name exceeds maximum length of " +
                      std::to_string(config.max_ref_length) + " characters.");
    }
    // Would be parsed as an option by git
    if (ref[0] == '-') {
        return reject(SecurityErrorKind::InvalidReference,
                      "Safe Mode: git branch/tag name must not start with '-'.");
    }
    for (size_t i = 0; i < ref.size(); ++i) {
        if (!is_ref_char(static_cast<unsigned char>(ref[i]))) {
            return reject(SecurityErrorKind::InvalidReference,
                          "Safe Mode: Invalid characters in git branch/tag name.");
        }
    }
    if (ref.find("..") != std::string::npos) {
        return reject(SecurityErrorKind::InvalidReference,
                      "Safe Mode: git branch/tag name must not contain '..'.");
    }
    return GuardResult::ok();
}

GuardResult check_json_depth(const std::string& payload, const SafeModeConfig& config) {
    size_t depth = 0;
    bool in_string = false;
    bool escaped = false;

    for (size_t i = 0; i < payload.size(); ++i) {
        char c = payload[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                if (++depth > config.max_json_depth) {
                    return reject(SecurityErrorKind::JsonTooDeep,
                                  "Safe Mode: JSON nesting exceeds maximum depth of " +
                                  std::to_string(config.max_json_depth) + ".");
                }
                break;
            case '}':
            case ']':
                // Unbalanced input is left for the parser to report
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return GuardResult::ok();
}

GuardResult check_array_length(size_t count,
                               const SafeModeConfig& config,
                               const std::string& field) {
    if (count > config.max_array_length) {
        return reject(SecurityErrorKind::ArrayTooLarge,
                      "Safe Mode: '" + field + "' exceeds maximum of " +
                      std::to_string(config.max_array_length) + " entries.");
    }
    return GuardResult::ok();
}

GuardResult check_body_size(size_t bytes, const SafeModeConfig& config) {
    if (bytes > config.max_body_bytes) {
        return reject(SecurityErrorKind::PayloadTooLarge,
                      "Safe Mode: Request body exceeds " +
                      std::to_string(config.max_body_bytes) + " bytes.");
    }
    return GuardResult::ok();
}

GuardResult check_file_size(uint64_t bytes, const SafeModeConfig& config) {
    if (!config.enabled || bytes <= config.max_file_size) return GuardResult::ok();
    return reject(SecurityErrorKind::ResourceLimitExceeded,
                  "Safe Mode: File size (" + std::to_string(bytes) + ") exceeds limit (" +
                  std::to_string(config.max_file_size) + ").");
}

GuardResult check_repo_size(uint64_t bytes, const SafeModeConfig& config) {
    if (!config.enabled || bytes <= config.max_repo_size) return GuardResult::ok();
    return reject(SecurityErrorKind::ResourceLimitExceeded,
                  "Safe Mode: Repository size (" + std::to_string(bytes) + ") exceeds limit (" +
                  std::to_string(config.max_repo_size) + ").");
}

GuardResult check_output_size(uint64_t bytes, const SafeModeConfig& config) {
    if (!config.enabled || bytes <= config.max_output_size) return GuardResult::ok();
    return reject(SecurityErrorKind::ResourceLimitExceeded, "Output size limit exceeded");
}

GuardResult check_file_count(size_t count, const SafeModeConfig& config) {
    if (!config.enabled || count <= config.max_file_count) return GuardResult::ok();
    return reject(SecurityErrorKind::ResourceLimitExceeded,
                  "Safe Mode: File count exceeds limit of " +
                  std::to_string(config.max_file_count) + ".");
}

GuardResult check_clipboard_access(const SafeModeConfig& config) {
    if (!config.enabled || config.allow_clipboard) return GuardResult::ok();
    return reject(SecurityErrorKind::ClipboardDisabled, "Safe Mode: Clipboard access is disabled.");
}

// ============================================================================
// PayloadShapeChecker
// ============================================================================

PayloadShapeChecker::PayloadShapeChecker(size_t max_depth, size_t max_array_length)
    : max_depth_(max_depth)
    , max_array_length_(max_array_length)
    , violated_(false)
{}

bool PayloadShapeChecker::fail(SecurityErrorKind kind, const std::string& message) {
    violated_ = true;
    violation_ = SecurityError(kind, message);
    return false;
}

bool PayloadShapeChecker::on_value() {
    if (stack_.empty() || !stack_.back().is_array) return true;

    Frame& top = stack_.back();
    if (++top.count > max_array_length_) {
        return fail(SecurityErrorKind::ArrayTooLarge,
                    "Safe Mode: '" + top.name + "' exceeds maximum of " +
                    std::to_string(max_array_length_) + " entries.");
    }
    return true;
}

bool PayloadShapeChecker::push(bool is_array) {
    if (!on_value()) return false;

    Frame frame;
    frame.is_array = is_array;
    frame.count = 0;
    if (stack_.empty()) {
        frame.name = "body";
    } else if (stack_.back().is_array) {
        frame.name = stack_.back().name + "[]";
    } else {
        frame.name = pending_key_;
    }
    stack_.push_back(frame);

    if (stack_.size() > max_depth_) {
        return fail(SecurityErrorKind::JsonTooDeep,
                    "Safe Mode: JSON nesting exceeds maximum depth of " +
                    std::to_string(max_depth_) + ".");
    }
    return true;
}

bool PayloadShapeChecker::null() { return on_value(); }
bool PayloadShapeChecker::boolean(bool) { return on_value(); }
bool PayloadShapeChecker::number_integer(number_integer_t) { return on_value(); }
bool PayloadShapeChecker::number_unsigned(number_unsigned_t) { return on_value(); }
bool PayloadShapeChecker::number_float(number_float_t, const string_t&) { return on_value(); }
bool PayloadShapeChecker::string(string_t&) { return on_value(); }
bool PayloadShapeChecker::binary(binary_t&) { return on_value(); }

bool PayloadShapeChecker::start_object(std::size_t) {
    return push(false);
}

bool PayloadShapeChecker::key(string_t& val) {
    pending_key_ = val;
    return true;
}

bool PayloadShapeChecker::end_object() {
    if (!stack_.empty()) stack_.pop_back();
    return true;
}

bool PayloadShapeChecker::start_array(std::size_t) {
    return push(true);
}

bool PayloadShapeChecker::end_array() {
    if (!stack_.empty()) stack_.pop_back();
    return true;
}

bool PayloadShapeChecker::parse_error(std::size_t position, const std::string&,
                                      const nlohmann::detail::exception& ex) {
    LOG_DEBUG("[SafeMode] JSON syntax error at byte %zu: %s", position, ex.what());
    return fail(SecurityErrorKind::MalformedInput, "Invalid JSON in request body.");
}

// ============================================================================
// Payload checks
// ============================================================================

GuardResult check_payload_shape(const std::string& payload, const SafeModeConfig& config) {
    PayloadShapeChecker checker(config.max_json_depth, config.max_array_length);
    bool completed = false;
    try {
        completed = Json::sax_parse(payload, &checker);
    } catch (const Json::exception& e) {
        return reject(SecurityErrorKind::MalformedInput,
                      std::string("Invalid JSON in request body: ") + e.what());
    }

    if (checker.violated()) {
        return reject(checker.violation().kind, checker.violation().message);
    }
    if (!completed) {
        return reject(SecurityErrorKind::MalformedInput, "Invalid JSON in request body.");
    }
    return GuardResult::ok();
}

GuardResult parse_guarded_json(const std::string& payload, const SafeModeConfig& config, Json& out) {
    GuardResult r = check_body_size(payload.size(), config);
    if (!r.success) return r;

    r = check_json_depth(payload, config);
    if (!r.success) return r;

    r = check_payload_shape(payload, config);
    if (!r.success) return r;

    try {
        out = Json::parse(payload);
    } catch (const Json::parse_error& e) {
        return reject(SecurityErrorKind::MalformedInput,
                      std::string("Invalid JSON in request body: ") + e.what());
    }
    return GuardResult::ok();
}

} // namespace dircat
