/*
 * mdguard C++17 - Preservation Engine Implementation
 */
#include <mdguard/core/preservation.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/placeholder.hpp>
#include <mdguard/core/schema.hpp>
#include <mdguard/core/utils.hpp>
#include <algorithm>
#include <utility>
#include <vector>

namespace mdguard {

namespace {

typedef SpanList (*SpanFinder)(const std::string&);

// One extraction pass: a finder and the placeholder kind it produces
struct ExtractionPass {
    SpanFinder find;
    SpanKind kind;
    bool inline_code;
};

// Fixed order; later passes run on text where earlier spans are already tokens
const ExtractionPass EXTRACTION_PASSES[] = {
    { find_fenced_code_spans,          SpanKind::CODE_BLOCK,  false },
    { find_display_dollar_math_spans,  SpanKind::MATH_BLOCK,  false },
    { find_bracket_display_math_spans, SpanKind::MATH_BLOCK,  false },
    { find_begin_end_math_spans,       SpanKind::MATH_BLOCK,  false },
    { find_inline_paren_math_spans,    SpanKind::MATH_INLINE, false },
    { find_inline_dollar_math_spans,   SpanKind::MATH_INLINE, false },
    { find_inline_code_spans,          SpanKind::INLINE_CODE, true  },
    { find_url_spans,                  SpanKind::URL,         false },
    { find_html_spans,                 SpanKind::HTML,        false },
};

bool span_less(const ProtectedSpan& a, const ProtectedSpan& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
}

bool longer_first(const std::string& a, const std::string& b) {
    return a.size() > b.size();
}

std::vector<PlaceholderMatch> find_all_placeholders(const std::string& text) {
    std::vector<PlaceholderMatch> found;
    PlaceholderMatch match = find_placeholder(text);
    while (match.found()) {
        found.push_back(match);
        match = find_placeholder(text, match.position + match.length);
    }
    return found;
}

// Non-overlapping substring count
size_t count_occurrences(const std::string& text, const std::string& token) {
    size_t count = 0;
    size_t pos = text.find(token);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(token, pos + token.size());
    }
    return count;
}

// Build `text` with each span replaced by its token. `starts` receives the
// position of every token in the result.
std::string substitute(const std::string& text, const SpanList& spans,
                       const std::vector<std::string>& tokens, std::vector<size_t>* starts) {
    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        out.append(text, cursor, spans[i].start - cursor);
        if (starts) starts->push_back(out.size());
        out += tokens[i];
        cursor = spans[i].end;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

// A token placed right after text such as "__BOLD" reads as one longer,
// unregistered token ("__BOLD____INLINE_CODE_001__"). Such spans stay
// unprotected. Every token of a kind has the same shape, so the check runs
// on a draft before any number is handed out.
void drop_glued_candidates(const std::string& text, SpanKind kind, SpanList& accepted) {
    const std::string shape = format_placeholder(span_kind_name(kind), 0);
    bool dropped = true;
    while (dropped && !accepted.empty()) {
        dropped = false;
        std::vector<size_t> starts;
        std::string draft = substitute(text, accepted,
                                       std::vector<std::string>(accepted.size(), shape), &starts);
        std::vector<PlaceholderMatch> found = find_all_placeholders(draft);
        for (size_t m = 0; m < found.size() && !dropped; ++m) {
            size_t match_end = found[m].position + found[m].length;
            for (size_t i = 0; i < accepted.size(); ++i) {
                size_t token_end = starts[i] + shape.size();
                bool overlaps = found[m].position < token_end && starts[i] < match_end;
                if (overlaps && (found[m].position != starts[i] || found[m].length != shape.size())) {
                    LOG_DEBUG("[Preservation] Dropping %s candidate [%zu, %zu): token would merge with %s",
                              span_kind_name(kind), accepted[i].start, accepted[i].end,
                              draft.substr(found[m].position, found[m].length).c_str());
                    accepted.erase(accepted.begin() + i);
                    dropped = true;
                    break;
                }
            }
        }
    }
}

// Replace `candidates` with fresh placeholders. Candidates that touch an
// existing placeholder or an earlier candidate are dropped, and so are those
// whose token would merge with the text before it. Numbers are
// assigned right to left, so the rightmost span gets the lowest one.
std::string apply_spans(const std::string& text, SpanList candidates, SpanKind kind,
                        PlaceholderCounter& counter, RestorationMap& map) {
    if (candidates.empty()) {
        return text;
    }
    std::sort(candidates.begin(), candidates.end(), span_less);

    // Registered tokens may sit right after a word character, where
    // find_placeholder() would not see them
    std::vector<std::pair<size_t, size_t> > existing;
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        size_t pos = text.find(it->first);
        if (pos != std::string::npos) {
            existing.push_back(std::make_pair(pos, pos + it->first.size()));
        }
    }

    SpanList accepted;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const ProtectedSpan& candidate = candidates[i];
        if (!accepted.empty() && accepted.back().end > candidate.start) {
            continue;
        }
        bool swallows_token = false;
        for (size_t j = 0; j < existing.size(); ++j) {
            if (candidate.overlaps(existing[j].first, existing[j].second)) {
                swallows_token = true;
                break;
            }
        }
        if (swallows_token) {
            LOG_DEBUG("[Preservation] Dropping %s candidate [%zu, %zu): contains a placeholder",
                      span_kind_name(kind), candidate.start, candidate.end);
            continue;
        }
        accepted.push_back(candidate);
    }

    drop_glued_candidates(text, kind, accepted);

    std::vector<std::string> tokens(accepted.size());
    for (size_t i = accepted.size(); i-- > 0;) {
        tokens[i] = counter.next(kind);
        map[tokens[i]] = text.substr(accepted[i].start, accepted[i].length());
    }
    return substitute(text, accepted, tokens, nullptr);
}

} // anonymous namespace

// ============================================================================
// protect / restore
// ============================================================================

ProtectedText protect(const std::string& text, const ProtectOptions& options) {
    std::string existing;
    if (contains_placeholder(text, &existing)) {
        throw DetectionError("input text contains placeholder-like token: " + existing, existing);
    }

    ProtectedText result;
    result.text = text;
    PlaceholderCounter counter;

    for (size_t i = 0; i < sizeof(EXTRACTION_PASSES) / sizeof(EXTRACTION_PASSES[0]); ++i) {
        const ExtractionPass& pass = EXTRACTION_PASSES[i];
        if (pass.inline_code && options.skip_inline_code) {
            continue;
        }
        result.text = apply_spans(result.text, pass.find(result.text), pass.kind, counter, result.map);
    }

    validate_restoration(result.text, result.map);

    LOG_DEBUG("[Preservation] Protected %zu spans (%zu -> %zu bytes)",
              result.map.size(), text.size(), result.text.size());
    return result;
}

std::string restore(const std::string& protected_text, const RestorationMap& map, bool strict) {
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        if (!is_placeholder(it->first)) {
            throw RestorationError(RestorationError::INVALID_FORMAT,
                                   "invalid placeholder format: " + it->first, it->first);
        }
    }
    if (strict) {
        validate_restoration(protected_text, map);
    }

    std::vector<std::string> present;
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        if (protected_text.find(it->first) != std::string::npos) {
            present.push_back(it->first);
        }
    }
    std::stable_sort(present.begin(), present.end(), longer_first);

    // Single left-to-right pass; substituted values are never rescanned
    std::string restored;
    restored.reserve(protected_text.size());
    size_t i = 0;
    while (i < protected_text.size()) {
        bool replaced = false;
        if (protected_text[i] == '_') {
            for (size_t k = 0; k < present.size(); ++k) {
                if (matches_at(protected_text, i, present[k])) {
                    restored += map.find(present[k])->second;
                    i += present[k].size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            restored += protected_text[i];
            ++i;
        }
    }

    std::string leftover;
    if (contains_placeholder(restored, &leftover)) {
        throw RestorationError(RestorationError::LEFTOVER,
                               "restored text contains placeholder-like token: " + leftover, leftover);
    }
    return restored;
}

void validate_restoration(const std::string& protected_text, const RestorationMap& map) {
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        size_t count = count_occurrences(protected_text, it->first);
        if (count == 0) {
            throw RestorationError(RestorationError::MISSING, "placeholder missing: " + it->first, it->first);
        }
        if (count > 1) {
            throw RestorationError(RestorationError::DUPLICATED,
                                   "placeholder duplicated: " + it->first +
                                   " (count=" + std::to_string(count) + ")",
                                   it->first);
        }
    }

    std::vector<PlaceholderMatch> found = find_all_placeholders(protected_text);
    for (size_t i = 0; i < found.size(); ++i) {
        std::string token = protected_text.substr(found[i].position, found[i].length);
        if (map.find(token) == map.end()) {
            throw RestorationError(RestorationError::UNKNOWN, "unknown placeholder found: " + token, token);
        }
    }
}

std::string strip_unknown_placeholders(const std::string& text, const RestorationMap& map) {
    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    PlaceholderMatch match = find_placeholder(text);
    while (match.found()) {
        std::string token = text.substr(match.position, match.length);
        if (map.find(token) == map.end()) {
            out.append(text, cursor, match.position - cursor);
            cursor = match.position + match.length;
            LOG_DEBUG("[Preservation] Stripped unknown placeholder %s", token.c_str());
        }
        match = find_placeholder(text, match.position + match.length);
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

// ============================================================================
// Records
// ============================================================================

Json restoration_map_to_json(const RestorationMap& map) {
    Json record = Json::object();
    for (RestorationMap::const_iterator it = map.begin(); it != map.end(); ++it) {
        record[it->first] = it->second;
    }
    return record;
}

RestorationMap restoration_map_from_json(const Json& record) {
    schema::require_object<RestorationError>(record, "restoration map");

    RestorationMap map;
    for (Json::const_iterator it = record.begin(); it != record.end(); ++it) {
        map[it.key()] = schema::require_string<RestorationError>(it.value(), "restoration map." + it.key());
    }
    return map;
}

} // namespace mdguard
