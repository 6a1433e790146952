/*
 * mdguard C++17 - QA checks
 *
 * Structural comparisons between a source chunk and its restored rewrite.
 * They do not depend on a restoration map, so they also catch damage done
 * to text that was never protected.
 */
#ifndef mdguard_CORE_QA_CHECKS_HPP
#define mdguard_CORE_QA_CHECKS_HPP

#include <string>
#include <vector>

namespace mdguard {

// Lines starting (after spaces/tabs) with 3+ backticks or tildes
size_t count_fence_markers(const std::string& text);

// Unescaped math delimiters. `$$` counts once as a double, never as two singles.
struct MathDelimiterCounts {
    size_t single_dollar;
    size_t double_dollar;
    size_t open_paren;     // \(
    size_t close_paren;    // \)
    size_t open_bracket;   // \[
    size_t close_bracket;  // \]
    size_t begin_env;      // \begin{...}
    size_t end_env;        // \end{...}

    MathDelimiterCounts()
        : single_dollar(0), double_dollar(0), open_paren(0), close_paren(0),
          open_bracket(0), close_bracket(0), begin_env(0), end_env(0) {}

    bool operator==(const MathDelimiterCounts& other) const;
    bool operator!=(const MathDelimiterCounts& other) const { return !(*this == other); }

    // "$=1 $$=0 \(=0 ..." for log lines
    std::string describe() const;
};

MathDelimiterCounts count_math_delimiters(const std::string& text);

// Link destinations: inline links in text order, then reference definitions
std::vector<std::string> extract_url_targets(const std::string& text);

// Each throws its QaError subclass on mismatch
void validate_fence_counts(const std::string& original, const std::string& restored);
void validate_math_delimiters(const std::string& original, const std::string& restored);
void validate_url_targets(const std::string& original, const std::string& restored);

// Runs all three checks plus a leftover-placeholder check and returns
// "QA warning: ..." lines. Never throws.
std::vector<std::string> collect_qa_warnings(const std::string& original, const std::string& restored);

} // namespace mdguard

#endif // mdguard_CORE_QA_CHECKS_HPP
