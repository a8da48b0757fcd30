#include <dircat/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdio>

namespace dircat {

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string result;
    result.reserve(s.size());
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(from, start)) != std::string::npos) {
        result.append(s, start, pos - start);
        result += to;
        start = pos + from.size();
    }
    result.append(s, start, std::string::npos);
    return result;
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool contains_control_chars(const std::string& s) {
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F) return true;
    }
    return false;
}

std::string escape_for_log(const std::string& s, size_t max_len) {
    std::string out;
    out.reserve(std::min(s.size(), max_len) + 4);
    for (size_t i = 0; i < s.size(); ++i) {
        if (out.size() >= max_len) {
            out += "...";
            break;
        }
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x20 || c == 0x7F) {
            char buf[5];
            snprintf(buf, sizeof(buf), "\\x%02X", c);
            out += buf;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// ============ Path utilities ============

bool is_path_within(const std::string& path, const std::string& base) {
    if (base.empty() || path.empty()) return false;
    if (base == "/") return path[0] == '/';

    if (path.size() >= base.size() &&
        path.compare(0, base.size(), base) == 0) {
        return (path.size() == base.size() || path[base.size()] == '/');
    }
    return false;
}

} // namespace dircat
