/*
 * dircat C++ - Error Sanitizer
 *
 * Scrubs filesystem paths out of error text before it leaves the process.
 * Order of passes:
 *   1. '\' normalized to '/'
 *   2. each absolute sensitive root plus the path tail after it
 *   3. file:// URLs
 *   4. Windows drive paths (C:/..., d:/...)
 *   5. any remaining absolute POSIX path
 * Network URLs stay readable. sanitize(sanitize(x)) == sanitize(x).
 */
#ifndef dircat_SECURITY_ERROR_SANITIZER_HPP
#define dircat_SECURITY_ERROR_SANITIZER_HPP

#include "safe_mode.hpp"
#include <string>
#include <vector>

namespace dircat {

extern const char* const kRedactionToken;

// Relative roots are ignored
std::string sanitize_error(const std::string& message, const std::vector<std::string>& sensitive_roots);

std::string sanitize_error(const std::string& message, const SafeModeConfig& config);

} // namespace dircat

#endif // dircat_SECURITY_ERROR_SANITIZER_HPP
