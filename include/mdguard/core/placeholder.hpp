/*
 * mdguard C++17 - Placeholder tokens
 *
 * Grammar: "__" KIND "_" NNN "__", KIND = [A-Z][A-Z_]*, NNN = three digits.
 * When searched inside text a token must not be preceded by [_A-Za-z0-9].
 */
#ifndef mdguard_CORE_PLACEHOLDER_HPP
#define mdguard_CORE_PLACEHOLDER_HPP

#include <string>
#include <map>
#include <cstddef>

namespace mdguard {

enum class SpanKind {
    CODE_BLOCK,
    MATH_BLOCK,
    MATH_INLINE,
    INLINE_CODE,
    URL,
    HTML
};

// "CODE_BLOCK", "MATH_BLOCK", ... (also the placeholder kind name)
const char* span_kind_name(SpanKind kind);

const size_t MAX_PLACEHOLDERS_PER_KIND = 999;

struct PlaceholderMatch {
    size_t position;
    size_t length;

    PlaceholderMatch() : position(std::string::npos), length(0) {}

    bool found() const { return position != std::string::npos; }
};

// Leftmost placeholder-shaped token at or after `from`
PlaceholderMatch find_placeholder(const std::string& text, size_t from = 0);

// True if `text` contains a placeholder-shaped token; stores it in `token`
bool contains_placeholder(const std::string& text, std::string* token = nullptr);

// True if the whole of `token` is one placeholder
bool is_placeholder(const std::string& token);

// "__KIND_NNN__"
std::string format_placeholder(const std::string& kind, size_t number);

// Per-kind numbering for a single protect() call. Not shared between calls.
class PlaceholderCounter {
public:
    PlaceholderCounter() {}

    // Next token for `kind`; throws DetectionError past MAX_PLACEHOLDERS_PER_KIND
    std::string next(SpanKind kind);

    size_t count(SpanKind kind) const;

private:
    std::map<std::string, size_t> counts_;
};

} // namespace mdguard

#endif // mdguard_CORE_PLACEHOLDER_HPP
