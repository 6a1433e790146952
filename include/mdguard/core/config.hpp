/*
 * mdguard C++17 - Configuration
 *
 * JSON-backed settings with dotted-key lookup ("chunking.max_chunk_chars").
 */
#ifndef mdguard_CORE_CONFIG_HPP
#define mdguard_CORE_CONFIG_HPP

#include <mdguard/core/json.hpp>
#include <string>
#include <cstdint>

namespace mdguard {

class Config {
public:
    Config();

    // Load a JSON object from file. Returns false (and logs) when the file
    // cannot be read or does not hold a JSON object; previous values are kept.
    bool load_file(const std::string& path);

    // Same as load_file but from an in-memory document
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    // Missing keys return the default; present keys of the wrong JSON type
    // throw ConfigError naming the key.
    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const Json& raw() const { return data_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json data_;
};

} // namespace mdguard

#endif // mdguard_CORE_CONFIG_HPP
