/*
 * dircat C++ - Error Sanitizer Implementation
 */
#include <dircat/security/error_sanitizer.hpp>
#include <dircat/core/utils.hpp>

#include <cctype>
#include <regex>

namespace dircat {

const char* const kRedactionToken = "<path_redacted>";

namespace {

const std::regex& windows_path_re() {
    static const std::regex re(R"re((^|[^A-Za-z0-9])([A-Za-z]:/[A-Za-z0-9_.\-/~]*))re");
    return re;
}

const std::regex& file_url_re() {
    static const std::regex re(R"re(\bfile:/[^\s'"<>]*)re", std::regex::icase);
    return re;
}

// A '/' that starts a path: not inside a word or another path. After ':' it
// starts a path unless it is the "//" of a scheme (PATH=/a:/b, /x:/y).
const std::regex& posix_path_re() {
    static const std::regex re(R"re((^|[^A-Za-z0-9_.\-/:~]|:(?!//))((/+[A-Za-z0-9_.\-~]+)+/*))re");
    return re;
}

static bool is_path_tail_char(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '/' || c == '~';
}

static bool is_absolute_root(const std::string& root) {
    if (!root.empty() && root[0] == '/') return true;
    return root.size() >= 3 && std::isalpha(static_cast<unsigned char>(root[0])) &&
           root[1] == ':' && (root[2] == '/' || root[2] == '\\');
}

static std::string redact_root(const std::string& text, const std::string& root) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = text.find(root, pos);
        if (hit == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, hit - pos);
        out += kRedactionToken;

        size_t end = hit + root.size();
        while (end < text.size() && is_path_tail_char(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        pos = end;
    }
    return out;
}

} // namespace

std::string sanitize_error(const std::string& message, const std::vector<std::string>& sensitive_roots) {
    std::string text = replace_all(message, "\\", "/");

    for (size_t i = 0; i < sensitive_roots.size(); ++i) {
        if (!is_absolute_root(sensitive_roots[i])) continue;

        std::string root = replace_all(sensitive_roots[i], "\\", "/");
        while (root.size() > 1 && root[root.size() - 1] == '/') {
            root.erase(root.size() - 1);
        }
        if (root == "/") continue;
        text = redact_root(text, root);
    }

    text = std::regex_replace(text, file_url_re(), kRedactionToken);
    text = std::regex_replace(text, windows_path_re(), "$1<path_redacted>");
    text = std::regex_replace(text, posix_path_re(), "$1<path_redacted>");
    return text;
}

std::string sanitize_error(const std::string& message, const SafeModeConfig& config) {
    return sanitize_error(message, config.sensitive_roots);
}

} // namespace dircat
