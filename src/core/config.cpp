/*
 * dircat C++ - Configuration Implementation
 */
#include <dircat/core/config.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace dircat {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) {
        last_error_ = "cannot open config file '" + path + "'";
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return load_string(oss.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "config root must be a JSON object";
        return false;
    }
    data_ = std::move(parsed);
    last_error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* v = lookup(key);
    if (v && v->is_string()) {
        return v->get<std::string>();
    }
    return default_value;
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* v = lookup(key);
    if (v && v->is_number_integer()) {
        return v->get<int64_t>();
    }
    if (v && !v->is_null()) {
        LOG_WARN("Config key '%s' is not an integer, using default %lld",
                 key.c_str(), static_cast<long long>(default_value));
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* v = lookup(key);
    if (v && v->is_boolean()) {
        return v->get<bool>();
    }
    if (v && !v->is_null()) {
        LOG_WARN("Config key '%s' is not a boolean, using default %s",
                 key.c_str(), default_value ? "true" : "false");
    }
    return default_value;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> result;
    const Json* v = lookup(key);
    if (!v || !v->is_array()) return result;
    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        if (it->is_string()) {
            result.push_back(it->get<std::string>());
        }
    }
    return result;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace dircat
