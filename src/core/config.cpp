/*
 * mdguard C++17 - Configuration Implementation
 */
#include <mdguard/core/config.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/schema.hpp>
#include <mdguard/core/utils.hpp>

namespace mdguard {

namespace {

std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        parts.push_back(key.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

} // anonymous namespace

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        LOG_ERROR("[Config] Cannot read config file: %s", path.c_str());
        return false;
    }
    if (!load_string(text)) {
        LOG_ERROR("[Config] Invalid config file: %s", path.c_str());
        return false;
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("[Config] Top-level config value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        LOG_ERROR("[Config] JSON parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split_key(key);
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
    std::vector<std::string> parts = split_key(key);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* value = find(key);
    if (!value || value->is_null()) return default_value;
    return schema::require_string<ConfigError>(*value, key);
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* value = find(key);
    if (!value || value->is_null()) return default_value;
    return schema::require_int<ConfigError>(*value, key);
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* value = find(key);
    if (!value || value->is_null()) return default_value;
    return schema::require_bool<ConfigError>(*value, key);
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

} // namespace mdguard
