/*
 * dircat C++ - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *   cfg.get_int("safe_mode.max_json_depth", 128)
 * reads {"safe_mode": {"max_json_depth": ...}}.
 */
#ifndef dircat_CORE_CONFIG_HPP
#define dircat_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace dircat {

class Config {
public:
    Config();

    // Load from a file / string. On failure the previous contents are kept
    // and the reason is available from last_error().
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    // Array of strings; non-string entries are skipped. Empty if missing.
    std::vector<std::string> get_string_list(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* lookup(const std::string& key) const;
    Json& slot(const std::string& key);

    Json data_;
    std::string last_error_;
};

} // namespace dircat

#endif // dircat_CORE_CONFIG_HPP
