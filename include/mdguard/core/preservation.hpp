/*
 * mdguard C++17 - Preservation Engine
 *
 * protect() swaps every protected span for a placeholder token and records
 * the original text in a restoration map; restore() puts it back.
 */
#ifndef mdguard_CORE_PRESERVATION_HPP
#define mdguard_CORE_PRESERVATION_HPP

#include <mdguard/core/json.hpp>
#include <mdguard/core/span_detector.hpp>
#include <map>
#include <string>

namespace mdguard {

// placeholder token -> original span text
typedef std::map<std::string, std::string> RestorationMap;

struct ProtectOptions {
    bool skip_inline_code;  // Leave `code` spans in place (placeholder-heavy chunks)

    ProtectOptions() : skip_inline_code(false) {}
};

struct ProtectedText {
    std::string text;
    RestorationMap map;
};

// Throws DetectionError if `text` already holds a placeholder-shaped token or
// one kind runs past 999 placeholders.
ProtectedText protect(const std::string& text, const ProtectOptions& options = ProtectOptions());

// Throws RestorationError. With strict == false, keys missing from the text
// are skipped; a leftover placeholder-shaped token is still an error.
std::string restore(const std::string& protected_text, const RestorationMap& map, bool strict = true);

// Every key occurs exactly once and every placeholder-shaped token is a key.
// Throws RestorationError (MISSING, DUPLICATED, UNKNOWN).
void validate_restoration(const std::string& protected_text, const RestorationMap& map);

// Remove placeholder-shaped tokens that are not keys of `map`
std::string strip_unknown_placeholders(const std::string& text, const RestorationMap& map);

// {"__URL_001__": "https://...", ...}
Json restoration_map_to_json(const RestorationMap& map);

// Throws RestorationError (MALFORMED_RECORD) on non-object or non-string values
RestorationMap restoration_map_from_json(const Json& record);

} // namespace mdguard

#endif // mdguard_CORE_PRESERVATION_HPP
