/*
 * mdguard C++17 - QA checks Implementation
 */
#include <mdguard/core/qa_checks.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/placeholder.hpp>
#include <mdguard/core/span_detector.hpp>
#include <mdguard/core/utils.hpp>
#include <sstream>

namespace mdguard {

namespace {

// Unescaped occurrences of `token`, advancing past each match
size_t count_literal_sequence(const std::string& text, const std::string& token) {
    size_t count = 0;
    size_t index = 0;
    while (index + token.size() <= text.size()) {
        if (matches_at(text, index, token) && !is_escaped(text, index)) {
            ++count;
            index += token.size();
        } else {
            ++index;
        }
    }
    return count;
}

// `\name{...}` with a non-empty argument, not preceded by another backslash
size_t count_environment_markers(const std::string& text, const std::string& name) {
    std::string prefix = "\\" + name + "{";
    size_t count = 0;
    size_t pos = text.find(prefix);
    while (pos != std::string::npos) {
        size_t arg = pos + prefix.size();
        if ((pos == 0 || text[pos - 1] != '\\') && arg < text.size() && text[arg] != '}') {
            size_t close = text.find('}', arg);
            if (close != std::string::npos) {
                ++count;
                pos = text.find(prefix, close + 1);
                continue;
            }
        }
        pos = text.find(prefix, pos + 1);
    }
    return count;
}

} // anonymous namespace

// ============================================================================
// Counters
// ============================================================================

size_t count_fence_markers(const std::string& text) {
    size_t count = 0;
    size_t line_start = 0;
    while (line_start <= text.size()) {
        size_t i = line_start;
        while (i < text.size() && is_blank(text[i])) ++i;
        if (i < text.size() && (text[i] == '`' || text[i] == '~') && count_run(text, i, text[i]) >= 3) {
            ++count;
        }
        size_t newline = text.find('\n', line_start);
        if (newline == std::string::npos) break;
        line_start = newline + 1;
    }
    return count;
}

bool MathDelimiterCounts::operator==(const MathDelimiterCounts& other) const {
    return single_dollar == other.single_dollar && double_dollar == other.double_dollar &&
           open_paren == other.open_paren && close_paren == other.close_paren &&
           open_bracket == other.open_bracket && close_bracket == other.close_bracket &&
           begin_env == other.begin_env && end_env == other.end_env;
}

std::string MathDelimiterCounts::describe() const {
    std::ostringstream out;
    out << "$=" << single_dollar << " $$=" << double_dollar
        << " \\(=" << open_paren << " \\)=" << close_paren
        << " \\[=" << open_bracket << " \\]=" << close_bracket
        << " begin=" << begin_env << " end=" << end_env;
    return out.str();
}

MathDelimiterCounts count_math_delimiters(const std::string& text) {
    MathDelimiterCounts counts;

    size_t index = 0;
    while (index < text.size()) {
        if (text[index] != '$' || is_escaped(text, index)) {
            ++index;
            continue;
        }
        if (index + 1 < text.size() && text[index + 1] == '$') {
            ++counts.double_dollar;
            index += 2;
            continue;
        }
        ++counts.single_dollar;
        ++index;
    }

    counts.open_paren = count_literal_sequence(text, "\\(");
    counts.close_paren = count_literal_sequence(text, "\\)");
    counts.open_bracket = count_literal_sequence(text, "\\[");
    counts.close_bracket = count_literal_sequence(text, "\\]");
    counts.begin_env = count_environment_markers(text, "begin");
    counts.end_env = count_environment_markers(text, "end");
    return counts;
}

std::vector<std::string> extract_url_targets(const std::string& text) {
    SpanList spans = find_url_spans(text);
    std::vector<std::string> targets;
    targets.reserve(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        targets.push_back(text.substr(spans[i].start, spans[i].length()));
    }
    return targets;
}

// ============================================================================
// Validators
// ============================================================================

void validate_fence_counts(const std::string& original, const std::string& restored) {
    size_t expected = count_fence_markers(original);
    size_t actual = count_fence_markers(restored);
    if (expected != actual) {
        throw FenceCountMismatch("code fence count mismatch: " + std::to_string(expected) +
                                 " fence lines before, " + std::to_string(actual) + " after");
    }
}

void validate_math_delimiters(const std::string& original, const std::string& restored) {
    MathDelimiterCounts expected = count_math_delimiters(original);
    MathDelimiterCounts actual = count_math_delimiters(restored);
    if (expected != actual) {
        throw MathDelimiterMismatch("math delimiter count mismatch: [" + expected.describe() +
                                    "] before, [" + actual.describe() + "] after");
    }
}

void validate_url_targets(const std::string& original, const std::string& restored) {
    std::vector<std::string> expected = extract_url_targets(original);
    std::vector<std::string> actual = extract_url_targets(restored);
    if (expected == actual) {
        return;
    }
    for (size_t i = 0; i < expected.size() && i < actual.size(); ++i) {
        if (expected[i] != actual[i]) {
            throw UrlTargetMismatch("URL target mismatch at #" + std::to_string(i + 1) + ": " +
                                    expected[i] + " became " + actual[i]);
        }
    }
    throw UrlTargetMismatch("URL target mismatch: " + std::to_string(expected.size()) +
                            " targets before, " + std::to_string(actual.size()) + " after");
}

std::vector<std::string> collect_qa_warnings(const std::string& original, const std::string& restored) {
    std::vector<std::string> warnings;
    try {
        validate_fence_counts(original, restored);
    } catch (const QaError& e) {
        warnings.push_back(std::string("QA warning: ") + e.what());
    }
    try {
        validate_math_delimiters(original, restored);
    } catch (const QaError& e) {
        warnings.push_back(std::string("QA warning: ") + e.what());
    }
    try {
        validate_url_targets(original, restored);
    } catch (const QaError& e) {
        warnings.push_back(std::string("QA warning: ") + e.what());
    }

    std::string leftover;
    if (contains_placeholder(restored, &leftover)) {
        warnings.push_back("QA warning: leftover placeholder " + leftover);
    }
    return warnings;
}

} // namespace mdguard
