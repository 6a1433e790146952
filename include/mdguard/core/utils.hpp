#ifndef mdguard_CORE_UTILS_HPP
#define mdguard_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace mdguard {

// ============ Character classes (ASCII) ============

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

inline bool is_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

inline bool is_alnum(char c) {
    return is_alpha(c) || is_digit(c);
}

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if `s` contains `token` starting at `pos`
bool matches_at(const std::string& s, size_t pos, const std::string& token);

// Number of consecutive occurrences of `c` starting at `pos`
size_t count_run(const std::string& s, size_t pos, char c);

// Zero-padded decimal, e.g. zero_pad(7, 3) == "007"
std::string zero_pad(size_t value, size_t width);

// Split into lines keeping line endings; "\n", "\r\n" and a lone "\r" end a line
std::vector<std::string> split_lines_keep_ends(const std::string& s);

// ============ UTF-8 utilities ============

// Largest cut position <= `pos` that does not fall inside a multi-byte
// sequence. Returns 0 when no such position exists after 0.
size_t utf8_floor(const std::string& s, size_t pos);

// ============ File utilities ============

// Read a whole file into `out`. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace mdguard

#endif // mdguard_CORE_UTILS_HPP
