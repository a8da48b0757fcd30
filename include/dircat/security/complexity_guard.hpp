/*
 * dircat C++ - Complexity Guard
 *
 * Cheap bounds checks that run before anything expensive sees the input:
 * regex compilation, glob expansion, JSON decoding, list materialization.
 *
 * Pattern length and wildcard checks apply only when safe mode is enabled.
 * Depth, array, body size and git reference checks always apply. File, repo,
 * output and file-count bounds are enforced by whoever does the scan work.
 */
#ifndef dircat_SECURITY_COMPLEXITY_GUARD_HPP
#define dircat_SECURITY_COMPLEXITY_GUARD_HPP

#include "safe_mode.hpp"
#include <dircat/core/json.hpp>

#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

GuardResult check_pattern_length(const std::string& pattern,
                                 const SafeModeConfig& config,
                                 const std::string& field = "pattern");

// Newline separated glob lines; each line may hold at most max_wildcards '*'
GuardResult check_wildcards(const std::string& patterns,
                            const SafeModeConfig& config,
                            const std::string& field = "ignore_patterns");

// Branch or tag name handed to git
GuardResult check_git_ref(const std::string& ref, const SafeModeConfig& config);

// Single pass over the raw text; never recurses, never allocates per level
GuardResult check_json_depth(const std::string& payload, const SafeModeConfig& config);

GuardResult check_array_length(size_t count,
                               const SafeModeConfig& config,
                               const std::string& field = "array");

GuardResult check_body_size(size_t bytes, const SafeModeConfig& config);

// Scan work bounds, applied only when safe mode is enabled
GuardResult check_file_size(uint64_t bytes, const SafeModeConfig& config);
GuardResult check_repo_size(uint64_t bytes, const SafeModeConfig& config);
GuardResult check_output_size(uint64_t bytes, const SafeModeConfig& config);
GuardResult check_file_count(size_t count, const SafeModeConfig& config);
GuardResult check_clipboard_access(const SafeModeConfig& config);

// Streaming pass enforcing depth and per-array element counts without
// building a DOM. Stops at the first violation.
class PayloadShapeChecker {
public:
    typedef Json::number_integer_t number_integer_t;
    typedef Json::number_unsigned_t number_unsigned_t;
    typedef Json::number_float_t number_float_t;
    typedef Json::string_t string_t;
    typedef Json::binary_t binary_t;

    PayloadShapeChecker(size_t max_depth, size_t max_array_length);

    bool null();
    bool boolean(bool val);
    bool number_integer(number_integer_t val);
    bool number_unsigned(number_unsigned_t val);
    bool number_float(number_float_t val, const string_t& s);
    bool string(string_t& val);
    bool binary(binary_t& val);
    bool start_object(std::size_t elements);
    bool key(string_t& val);
    bool end_object();
    bool start_array(std::size_t elements);
    bool end_array();
    bool parse_error(std::size_t position, const std::string& last_token,
                     const nlohmann::detail::exception& ex);

    bool violated() const { return violated_; }
    const SecurityError& violation() const { return violation_; }

private:
    struct Frame {
        bool is_array;
        size_t count;
        std::string name;
    };

    bool on_value();
    bool push(bool is_array);
    bool fail(SecurityErrorKind kind, const std::string& message);

    size_t max_depth_;
    size_t max_array_length_;
    std::vector<Frame> stack_;
    std::string pending_key_;
    bool violated_;
    SecurityError violation_;
};

GuardResult check_payload_shape(const std::string& payload, const SafeModeConfig& config);

// Body size, depth scan, shape pass, then the DOM parse
GuardResult parse_guarded_json(const std::string& payload, const SafeModeConfig& config, Json& out);

} // namespace dircat

#endif // dircat_SECURITY_COMPLEXITY_GUARD_HPP
