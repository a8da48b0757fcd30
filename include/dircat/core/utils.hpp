#ifndef dircat_CORE_UTILS_HPP
#define dircat_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// ASCII-only lowercase; bytes >= 0x80 are left alone
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter (empty fields are kept)
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace every occurrence of `from` (non-empty) with `to`
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// True if every byte is an ASCII digit (false for empty strings)
bool is_all_digits(const std::string& s);

// True for NUL, C0 control characters and DEL
bool contains_control_chars(const std::string& s);

// Render untrusted text for a log line: control bytes become \xNN and the
// result is capped at max_len bytes (with a trailing "...").
std::string escape_for_log(const std::string& s, size_t max_len = 200);

// ============ Path utilities ============

// True if `path` equals `base` or lies underneath it. Both must already be
// canonical; "/" contains every absolute path.
bool is_path_within(const std::string& path, const std::string& base);

} // namespace dircat

#endif // dircat_CORE_UTILS_HPP
