/*
 * mdguard C++17 - Placeholder tokens Implementation
 */
#include <mdguard/core/placeholder.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/utils.hpp>

namespace mdguard {

namespace {

bool is_word_char(char c) {
    return is_alnum(c) || c == '_';
}

// Length of a token starting at `pos`, or 0. The lookbehind is not checked here.
//
// The kind run [A-Z_]* is greedy and cannot contain digits, so the "_NNN"
// suffix must start on the run's final underscore.
size_t match_token_at(const std::string& text, size_t pos) {
    if (!matches_at(text, pos, "__")) return 0;
    size_t kind_start = pos + 2;
    if (kind_start >= text.size() || !is_upper(text[kind_start])) return 0;

    size_t run_end = kind_start + 1;
    while (run_end < text.size() && (is_upper(text[run_end]) || text[run_end] == '_')) {
        ++run_end;
    }
    // run_end - 1 is the separator underscore; the kind needs one letter before it
    if (run_end - 1 <= kind_start || text[run_end - 1] != '_') return 0;
    if (run_end + 5 > text.size()) return 0;
    if (!is_digit(text[run_end]) || !is_digit(text[run_end + 1]) || !is_digit(text[run_end + 2])) {
        return 0;
    }
    if (text[run_end + 3] != '_' || text[run_end + 4] != '_') return 0;
    return run_end + 5 - pos;
}

} // anonymous namespace

const char* span_kind_name(SpanKind kind) {
    switch (kind) {
        case SpanKind::CODE_BLOCK: return "CODE_BLOCK";
        case SpanKind::MATH_BLOCK: return "MATH_BLOCK";
        case SpanKind::MATH_INLINE: return "MATH_INLINE";
        case SpanKind::INLINE_CODE: return "INLINE_CODE";
        case SpanKind::URL: return "URL";
        case SpanKind::HTML: return "HTML";
        default: return "UNKNOWN";
    }
}

PlaceholderMatch find_placeholder(const std::string& text, size_t from) {
    PlaceholderMatch match;
    size_t pos = text.find("__", from);
    while (pos != std::string::npos) {
        if (pos == 0 || !is_word_char(text[pos - 1])) {
            size_t len = match_token_at(text, pos);
            if (len > 0) {
                match.position = pos;
                match.length = len;
                return match;
            }
        }
        pos = text.find("__", pos + 1);
    }
    return match;
}

bool contains_placeholder(const std::string& text, std::string* token) {
    PlaceholderMatch match = find_placeholder(text);
    if (!match.found()) return false;
    if (token) {
        *token = text.substr(match.position, match.length);
    }
    return true;
}

bool is_placeholder(const std::string& token) {
    return !token.empty() && match_token_at(token, 0) == token.size();
}

std::string format_placeholder(const std::string& kind, size_t number) {
    return "__" + kind + "_" + zero_pad(number, 3) + "__";
}

std::string PlaceholderCounter::next(SpanKind kind) {
    std::string name = span_kind_name(kind);
    size_t& count = counts_[name];
    if (count >= MAX_PLACEHOLDERS_PER_KIND) {
        throw DetectionError("too many placeholders for " + name +
                             " (limit " + std::to_string(MAX_PLACEHOLDERS_PER_KIND) + ")",
                             format_placeholder(name, count));
    }
    ++count;
    return format_placeholder(name, count);
}

size_t PlaceholderCounter::count(SpanKind kind) const {
    std::map<std::string, size_t>::const_iterator it = counts_.find(span_kind_name(kind));
    return it == counts_.end() ? 0 : it->second;
}

} // namespace mdguard
