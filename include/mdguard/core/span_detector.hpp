/*
 * mdguard C++17 - Span Detector
 *
 * Finds the ranges of a Markdown document that must pass through chunking
 * and external rewriting unchanged: fenced code, display and inline math,
 * inline code, link destinations and raw HTML.
 *
 * Detection is heuristic, not a Markdown/LaTeX parser. A delimiter preceded
 * by an odd number of backslashes is escaped and never opens or closes.
 */
#ifndef mdguard_CORE_SPAN_DETECTOR_HPP
#define mdguard_CORE_SPAN_DETECTOR_HPP

#include <mdguard/core/placeholder.hpp>
#include <string>
#include <vector>

namespace mdguard {

// Half-open byte range [start, end)
struct ProtectedSpan {
    size_t start;
    size_t end;
    SpanKind kind;

    ProtectedSpan() : start(0), end(0), kind(SpanKind::CODE_BLOCK) {}
    ProtectedSpan(size_t s, size_t e, SpanKind k) : start(s), end(e), kind(k) {}

    size_t length() const { return end - start; }

    bool overlaps(size_t other_start, size_t other_end) const {
        return start < other_end && other_start < end;
    }

    bool operator==(const ProtectedSpan& other) const {
        return start == other.start && end == other.end && kind == other.kind;
    }
};

typedef std::vector<ProtectedSpan> SpanList;

// All protected spans, non-overlapping, sorted by (start, end). Candidates
// are accepted in priority order code > display math > inline math >
// inline code > URL > HTML; a candidate overlapping an accepted span is
// dropped whole.
SpanList find_protected_spans(const std::string& text);

// ============================================================================
// Individual finders (candidates of one family, in text order)
// ============================================================================

// ``` or ~~~ fences; unterminated fences run to end of text
SpanList find_fenced_code_spans(const std::string& text);

// $$...$$ pairs; an unmatched opener runs to end of text
SpanList find_display_dollar_math_spans(const std::string& text);

// \[...\]; unmatched runs to end of text
SpanList find_bracket_display_math_spans(const std::string& text);

// \begin{env}...\end{env} by literal environment name
SpanList find_begin_end_math_spans(const std::string& text);

// \(...\) on one line
SpanList find_inline_paren_math_spans(const std::string& text);

// $...$ filtered by the currency heuristic (see looks_like_math)
SpanList find_inline_dollar_math_spans(const std::string& text);

// `code` with matching backtick run length. Never spans over a
// placeholder-shaped token and never runs to end of text.
SpanList find_inline_code_spans(const std::string& text);

// Link/image destinations, inline ones first, then reference definitions
SpanList find_url_spans(const std::string& text);

// Comments, doctypes and single tags
SpanList find_html_spans(const std::string& text);

// ============================================================================
// Helpers shared with the preservation engine and QA checks
// ============================================================================

// Odd number of backslashes directly before `index`
bool is_escaped(const std::string& text, size_t index);

// Content of a $...$ candidate: non-blank and holding a letter, a
// backslash, ^ _ = { } [ ] < > + - * /
bool looks_like_math(const std::string& content);

// True if the line (without its line ending) opens a fence; reports the
// fence character and run length
bool is_fence_open_line(const std::string& line, char* fence_char, size_t* fence_len);

// Append `candidates` that overlap nothing already in `accepted`
void append_non_overlapping(SpanList& accepted, const SpanList& candidates);

} // namespace mdguard

#endif // mdguard_CORE_SPAN_DETECTOR_HPP
