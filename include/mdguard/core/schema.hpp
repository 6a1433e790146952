/*
 * mdguard C++17 - Schema assertions
 *
 * Type checks for JSON values read from config files and serialized
 * records. Each helper throws `ErrorT(label + " must be ...")` on mismatch,
 * so callers pick the error kind (ConfigError, RecordError, ...).
 */
#ifndef mdguard_CORE_SCHEMA_HPP
#define mdguard_CORE_SCHEMA_HPP

#include <mdguard/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace mdguard {
namespace schema {

template<typename ErrorT>
const Json& require_object(const Json& value, const std::string& label) {
    if (!value.is_object()) {
        throw ErrorT(label + " must be an object");
    }
    return value;
}

template<typename ErrorT>
const Json& require_array(const Json& value, const std::string& label) {
    if (!value.is_array()) {
        throw ErrorT(label + " must be an array");
    }
    return value;
}

template<typename ErrorT>
std::string require_string(const Json& value, const std::string& label) {
    if (!value.is_string()) {
        throw ErrorT(label + " must be a string");
    }
    return value.get<std::string>();
}

// Booleans are not integers here, unlike in JSON's loose sense
template<typename ErrorT>
int64_t require_int(const Json& value, const std::string& label) {
    if (!value.is_number_integer()) {
        throw ErrorT(label + " must be an integer");
    }
    return value.get<int64_t>();
}

template<typename ErrorT>
bool require_bool(const Json& value, const std::string& label) {
    if (!value.is_boolean()) {
        throw ErrorT(label + " must be a boolean");
    }
    return value.get<bool>();
}

template<typename ErrorT>
std::vector<std::string> require_string_list(const Json& value, const std::string& label) {
    require_array<ErrorT>(value, label);
    std::vector<std::string> items;
    items.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        items.push_back(require_string<ErrorT>(value[i], label + "[" + std::to_string(i) + "]"));
    }
    return items;
}

// Member lookup; a missing key is reported like a wrong type
template<typename ErrorT>
const Json& require_member(const Json& object, const std::string& key, const std::string& label) {
    require_object<ErrorT>(object, label);
    Json::const_iterator it = object.find(key);
    if (it == object.end()) {
        throw ErrorT(label + "." + key + " is required");
    }
    return *it;
}

} // namespace schema
} // namespace mdguard

#endif // mdguard_CORE_SCHEMA_HPP
