/*
 * mdguard C++17 - Span Detector Implementation
 */
#include <mdguard/core/span_detector.hpp>
#include <mdguard/core/placeholder.hpp>
#include <mdguard/core/utils.hpp>
#include <algorithm>
#include <utility>

namespace mdguard {

namespace {

bool span_less(const ProtectedSpan& a, const ProtectedSpan& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
}

bool is_unescaped_pair(const std::string& text, size_t i, char first, char second) {
    return i + 1 < text.size() && text[i] == first && text[i + 1] == second && !is_escaped(text, i);
}

size_t line_content_length(const std::string& line) {
    size_t len = line.size();
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
        --len;
    }
    return len;
}

// Optional blanks, `fence_char` at least `fence_len` times, optional blanks, end of line
bool is_fence_close_line(const std::string& line, char fence_char, size_t fence_len) {
    size_t len = line_content_length(line);
    if (len == 0) return false;
    size_t i = 0;
    while (i < len && is_blank(line[i])) ++i;
    size_t run = 0;
    while (i + run < len && line[i + run] == fence_char) ++run;
    if (run < fence_len) return false;
    i += run;
    while (i < len && is_blank(line[i])) ++i;
    return i == len;
}

// Index of the ']' closing the '[' at `open`, honouring nesting and escapes
size_t find_matching_bracket(const std::string& text, size_t open) {
    int depth = 0;
    for (size_t i = open; i < text.size(); ++i) {
        if (text[i] == '[' && !is_escaped(text, i)) {
            ++depth;
        } else if (text[i] == ']' && !is_escaped(text, i)) {
            --depth;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Index of the ')' closing a destination that starts at `start`; stops at line end
size_t find_matching_paren(const std::string& text, size_t start) {
    int depth = 0;
    size_t i = start;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n') return std::string::npos;
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth == 0) return i;
            --depth;
        }
        ++i;
    }
    return std::string::npos;
}

// Locate the URL inside a link destination occupying text[begin, end)
bool parse_link_destination(const std::string& text, size_t begin, size_t end,
                            size_t* url_start, size_t* url_end) {
    size_t i = begin;
    while (i < end && is_space(text[i])) ++i;
    if (i >= end) return false;

    if (text[i] == '<') {
        size_t close = text.find('>', i + 1);
        if (close == std::string::npos || close >= end) return false;
        *url_start = i + 1;
        *url_end = close;
        return true;
    }

    size_t start = i;
    int depth = 0;
    while (i < end) {
        char c = text[i];
        if (c == '\n') break;
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth == 0) break;
            --depth;
        } else if (is_space(c) && depth == 0) {
            break;
        }
        ++i;
    }
    if (i > end) i = end;
    if (i <= start) return false;
    *url_start = start;
    *url_end = i;
    return true;
}

SpanList find_inline_link_url_spans(const std::string& text) {
    SpanList spans;
    // Destinations already consumed; brackets inside them are not link openers
    std::vector<std::pair<size_t, size_t> > destinations;
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        // `i` only moves forward, so regions behind it can be forgotten
        bool in_destination = false;
        for (size_t d = 0; d < destinations.size();) {
            if (destinations[d].second <= i) {
                destinations.erase(destinations.begin() + d);
                continue;
            }
            if (destinations[d].first <= i) {
                i = destinations[d].second;
                in_destination = true;
                break;
            }
            ++d;
        }
        if (in_destination) continue;

        size_t bracket;
        if (text[i] == '!' && i + 1 < n && text[i + 1] == '[') {
            bracket = i + 1;
        } else if (text[i] == '[') {
            bracket = i;
        } else {
            ++i;
            continue;
        }

        if (is_escaped(text, bracket)) {
            ++i;
            continue;
        }

        size_t label_end = find_matching_bracket(text, bracket);
        if (label_end == std::string::npos) {
            ++i;
            continue;
        }

        size_t cursor = label_end + 1;
        while (cursor < n && is_space(text[cursor]) && text[cursor] != '\r' && text[cursor] != '\n') {
            ++cursor;
        }
        // Not a link; links or images nested in the brackets are still candidates
        if (cursor >= n || text[cursor] != '(') {
            i = bracket + 1;
            continue;
        }

        size_t dest_start = cursor + 1;
        size_t dest_end = find_matching_paren(text, dest_start);
        if (dest_end == std::string::npos) {
            i = bracket + 1;
            continue;
        }

        size_t url_start = 0;
        size_t url_end = 0;
        if (parse_link_destination(text, dest_start, dest_end, &url_start, &url_end) && url_start < url_end) {
            spans.push_back(ProtectedSpan(url_start, url_end, SpanKind::URL));
        }

        destinations.push_back(std::make_pair(dest_start, dest_end + 1));
        // Rescan the label so images nested in link text are found too
        i = bracket + 1;
    }
    // Nested destinations are found after their enclosing one
    std::sort(spans.begin(), spans.end(), span_less);
    return spans;
}

// "[label]: dest" at the start of a line (after up to any blanks)
SpanList find_reference_definition_url_spans(const std::string& text) {
    SpanList spans;
    std::vector<std::string> lines = split_lines_keep_ends(text);
    size_t offset = 0;
    for (size_t li = 0; li < lines.size(); ++li) {
        const std::string& line = lines[li];
        size_t i = 0;
        while (i < line.size() && is_blank(line[i])) ++i;
        if (i < line.size() && line[i] == '[') {
            size_t close = line.find(']', i + 1);
            if (close != std::string::npos && close > i + 1 &&
                close + 1 < line.size() && line[close + 1] == ':') {
                size_t prefix_end = close + 2;
                while (prefix_end < line.size() && is_blank(line[prefix_end])) ++prefix_end;

                size_t url_start = 0;
                size_t url_end = 0;
                if (parse_link_destination(text, offset + prefix_end, offset + line.size(),
                                           &url_start, &url_end) && url_start < url_end) {
                    spans.push_back(ProtectedSpan(url_start, url_end, SpanKind::URL));
                }
            }
        }
        offset += line.size();
    }
    return spans;
}

// Length of an HTML comment, doctype or tag starting at `p`, 0 if none
size_t match_html_at(const std::string& text, size_t p) {
    size_t n = text.size();
    if (p >= n || text[p] != '<') return 0;

    if (matches_at(text, p + 1, "!--")) {
        size_t close = text.find("-->", p + 4);
        return close == std::string::npos ? 0 : close + 3 - p;
    }

    if (matches_at(text, p + 1, "!DOCTYPE")) {
        size_t j = p + 9;
        while (j < n && text[j] != '<' && text[j] != '>') ++j;
        return (j < n && text[j] == '>') ? j + 1 - p : 0;
    }

    size_t j = p + 1;
    if (j < n && text[j] == '/') ++j;
    if (j >= n || !is_alpha(text[j])) return 0;
    ++j;
    while (j < n && (is_alnum(text[j]) || text[j] == ':' || text[j] == '-')) ++j;
    if (j >= n) return 0;

    if (text[j] == '>') return j + 1 - p;
    if (text[j] == '/' && j + 1 < n && text[j + 1] == '>') return j + 2 - p;
    if (is_space(text[j])) {
        size_t k = j + 1;
        while (k < n && text[k] != '<' && text[k] != '>') ++k;
        return (k < n && text[k] == '>') ? k + 1 - p : 0;
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

bool is_escaped(const std::string& text, size_t index) {
    size_t backslashes = 0;
    while (index > backslashes && text[index - backslashes - 1] == '\\') {
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

bool looks_like_math(const std::string& content) {
    std::string stripped = trim(content);
    if (stripped.empty()) return false;
    if (stripped.find_first_of("\\^_={}[]<>+-*/") != std::string::npos) return true;
    for (size_t i = 0; i < stripped.size(); ++i) {
        if (is_alpha(stripped[i])) return true;
    }
    return false;
}

bool is_fence_open_line(const std::string& line, char* fence_char, size_t* fence_len) {
    size_t i = 0;
    while (i < line.size() && is_blank(line[i])) ++i;
    if (i >= line.size() || (line[i] != '`' && line[i] != '~')) return false;
    size_t run = count_run(line, i, line[i]);
    if (run < 3) return false;
    if (fence_char) *fence_char = line[i];
    if (fence_len) *fence_len = run;
    return true;
}

void append_non_overlapping(SpanList& accepted, const SpanList& candidates) {
    SpanList sorted = candidates;
    std::sort(sorted.begin(), sorted.end(), span_less);
    for (size_t i = 0; i < sorted.size(); ++i) {
        const ProtectedSpan& candidate = sorted[i];
        bool clash = false;
        for (size_t j = 0; j < accepted.size(); ++j) {
            if (accepted[j].overlaps(candidate.start, candidate.end)) {
                clash = true;
                break;
            }
        }
        if (!clash) {
            accepted.push_back(candidate);
        }
    }
}

// ============================================================================
// Finders
// ============================================================================

SpanList find_fenced_code_spans(const std::string& text) {
    SpanList spans;
    std::vector<std::string> lines = split_lines_keep_ends(text);

    size_t offset = 0;
    bool in_fence = false;
    char fence_char = 0;
    size_t fence_len = 0;
    size_t fence_start = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (in_fence) {
            if (is_fence_close_line(line, fence_char, fence_len)) {
                spans.push_back(ProtectedSpan(fence_start, offset + line.size(), SpanKind::CODE_BLOCK));
                in_fence = false;
            }
        } else if (is_fence_open_line(line, &fence_char, &fence_len)) {
            in_fence = true;
            fence_start = offset;
        }
        offset += line.size();
    }

    if (in_fence) {
        spans.push_back(ProtectedSpan(fence_start, text.size(), SpanKind::CODE_BLOCK));
    }
    return spans;
}

SpanList find_display_dollar_math_spans(const std::string& text) {
    SpanList spans;
    size_t open = std::string::npos;
    size_t i = 0;
    while (i + 1 < text.size()) {
        if (is_unescaped_pair(text, i, '$', '$')) {
            if (open == std::string::npos) {
                open = i;
            } else {
                spans.push_back(ProtectedSpan(open, i + 2, SpanKind::MATH_BLOCK));
                open = std::string::npos;
            }
            i += 2;
            continue;
        }
        ++i;
    }
    if (open != std::string::npos) {
        spans.push_back(ProtectedSpan(open, text.size(), SpanKind::MATH_BLOCK));
    }
    return spans;
}

SpanList find_bracket_display_math_spans(const std::string& text) {
    SpanList spans;
    size_t n = text.size();
    size_t i = 0;
    while (i + 1 < n) {
        if (!is_unescaped_pair(text, i, '\\', '[')) {
            ++i;
            continue;
        }
        size_t start = i;
        size_t search = i + 2;
        bool closed = false;
        while (search + 1 < n) {
            if (is_unescaped_pair(text, search, '\\', ']')) {
                spans.push_back(ProtectedSpan(start, search + 2, SpanKind::MATH_BLOCK));
                i = search + 2;
                closed = true;
                break;
            }
            ++search;
        }
        if (!closed) {
            spans.push_back(ProtectedSpan(start, n, SpanKind::MATH_BLOCK));
            i = n;
        }
    }
    return spans;
}

SpanList find_begin_end_math_spans(const std::string& text) {
    SpanList spans;
    const std::string opener = "\\begin{";
    size_t covered_until = 0;
    size_t pos = text.find(opener);
    while (pos != std::string::npos) {
        size_t name_start = pos + opener.size();
        size_t name_end = text.find('}', name_start);
        if (name_end == std::string::npos || name_end == name_start) {
            pos = text.find(opener, pos + 1);
            continue;
        }
        size_t match_end = name_end + 1;

        if (pos >= covered_until && !is_escaped(text, pos)) {
            std::string closer = "\\end{" + text.substr(name_start, name_end - name_start) + "}";
            size_t close = text.find(closer, match_end);
            if (close != std::string::npos) {
                size_t end = close + closer.size();
                spans.push_back(ProtectedSpan(pos, end, SpanKind::MATH_BLOCK));
                covered_until = end;
            }
        }
        pos = text.find(opener, match_end);
    }
    return spans;
}

SpanList find_inline_paren_math_spans(const std::string& text) {
    SpanList spans;
    size_t n = text.size();
    size_t i = 0;
    while (i + 1 < n) {
        if (!is_unescaped_pair(text, i, '\\', '(')) {
            ++i;
            continue;
        }
        size_t start = i;
        size_t search = i + 2;
        bool closed = false;
        bool line_break = false;
        while (search < n) {
            if (text[search] == '\n') {
                line_break = true;
                break;
            }
            if (is_unescaped_pair(text, search, '\\', ')')) {
                spans.push_back(ProtectedSpan(start, search + 2, SpanKind::MATH_INLINE));
                i = search + 2;
                closed = true;
                break;
            }
            ++search;
        }
        if (closed) continue;
        if (line_break) {
            i = start + 2;
        } else {
            spans.push_back(ProtectedSpan(start, n, SpanKind::MATH_INLINE));
            i = n;
        }
    }
    return spans;
}

SpanList find_inline_dollar_math_spans(const std::string& text) {
    SpanList spans;
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] != '$' || is_escaped(text, i)) {
            ++i;
            continue;
        }
        if (i + 1 < n && text[i + 1] == '$') {
            i += 2;
            continue;
        }
        if (i + 1 >= n || is_space(text[i + 1])) {
            ++i;
            continue;
        }

        bool found = false;
        size_t search = i + 1;
        while (search < n) {
            if (text[search] == '\n') break;
            if (text[search] != '$' || is_escaped(text, search)) {
                ++search;
                continue;
            }
            if (search + 1 < n && text[search + 1] == '$') {
                search += 2;
                continue;
            }
            if (is_space(text[search - 1])) {
                ++search;
                continue;
            }
            if (search + 1 < n && is_digit(text[search + 1])) {
                ++search;
                continue;
            }

            // The first acceptable closer decides; a non-math body rejects the opener
            if (!looks_like_math(text.substr(i + 1, search - i - 1))) break;

            spans.push_back(ProtectedSpan(i, search + 1, SpanKind::MATH_INLINE));
            i = search + 1;
            found = true;
            break;
        }
        if (!found) ++i;
    }
    return spans;
}

SpanList find_inline_code_spans(const std::string& text) {
    SpanList spans;
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] != '`' || is_escaped(text, i)) {
            ++i;
            continue;
        }

        size_t ticks = count_run(text, i, '`');
        size_t start = i;
        size_t search = start + ticks;
        bool closed = false;
        while (search < n) {
            if (text[search] != '`') {
                ++search;
                continue;
            }
            size_t run = count_run(text, search, '`');
            if (run == ticks && !is_escaped(text, search)) {
                size_t end = search + ticks;
                if (!contains_placeholder(text.substr(start, end - start))) {
                    spans.push_back(ProtectedSpan(start, end, SpanKind::INLINE_CODE));
                    i = end;
                    closed = true;
                }
                break;
            }
            search += run;
        }
        // Unclosed, or closing would swallow a placeholder: treat the run as text
        if (!closed) {
            i = start + ticks;
        }
    }
    return spans;
}

SpanList find_url_spans(const std::string& text) {
    SpanList spans = find_inline_link_url_spans(text);
    SpanList refs = find_reference_definition_url_spans(text);
    spans.insert(spans.end(), refs.begin(), refs.end());
    return spans;
}

SpanList find_html_spans(const std::string& text) {
    SpanList spans;
    size_t pos = text.find('<');
    while (pos != std::string::npos) {
        size_t len = match_html_at(text, pos);
        if (len == 0) {
            pos = text.find('<', pos + 1);
            continue;
        }
        if (!is_escaped(text, pos)) {
            spans.push_back(ProtectedSpan(pos, pos + len, SpanKind::HTML));
        }
        pos = text.find('<', pos + len);
    }
    return spans;
}

SpanList find_protected_spans(const std::string& text) {
    SpanList spans;
    append_non_overlapping(spans, find_fenced_code_spans(text));
    append_non_overlapping(spans, find_display_dollar_math_spans(text));
    append_non_overlapping(spans, find_bracket_display_math_spans(text));
    append_non_overlapping(spans, find_begin_end_math_spans(text));
    append_non_overlapping(spans, find_inline_paren_math_spans(text));
    append_non_overlapping(spans, find_inline_dollar_math_spans(text));
    append_non_overlapping(spans, find_inline_code_spans(text));
    append_non_overlapping(spans, find_url_spans(text));
    append_non_overlapping(spans, find_html_spans(text));
    std::sort(spans.begin(), spans.end(), span_less);
    return spans;
}

} // namespace mdguard
