#include <mdguard/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace mdguard {

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

bool matches_at(const std::string& s, size_t pos, const std::string& token) {
    return pos <= s.size() && s.size() - pos >= token.size() &&
           s.compare(pos, token.size(), token) == 0;
}

size_t count_run(const std::string& s, size_t pos, char c) {
    size_t count = 0;
    while (pos + count < s.size() && s[pos + count] == c) {
        ++count;
    }
    return count;
}

std::string zero_pad(size_t value, size_t width) {
    std::string digits = std::to_string(value);
    if (digits.size() >= width) return digits;
    return std::string(width - digits.size(), '0') + digits;
}

std::vector<std::string> split_lines_keep_ends(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n') {
            lines.push_back(s.substr(start, i + 1 - start));
            start = i + 1;
        } else if (s[i] == '\r') {
            size_t end = (i + 1 < s.size() && s[i + 1] == '\n') ? i + 2 : i + 1;
            lines.push_back(s.substr(start, end - start));
            start = end;
            i = end - 1;
        }
    }
    if (start < s.size()) {
        lines.push_back(s.substr(start));
    }
    return lines;
}

// ============ UTF-8 utilities ============

size_t utf8_floor(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    // Back up while positioned on a continuation byte
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    out = oss.str();
    return true;
}

} // namespace mdguard
