/*
 * mdguard C++17 - Logger Implementation
 */
#include <mdguard/core/logger.hpp>
#include <mdguard/core/utils.hpp>
#include <unistd.h>

namespace mdguard {

namespace {

const char* const RESET = "\033[0m";

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return RESET;
    }
}

// "ret ns::Class::method(args)" -> {"Class", "method"}; free functions give {"", "name"}
std::pair<std::string, std::string> split_pretty_function(const char* pretty_function) {
    std::string signature = pretty_function;

    size_t paren_pos = signature.find('(');
    if (paren_pos == std::string::npos) {
        return {"", signature};
    }
    signature.erase(paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        return {"", space_pos != std::string::npos ? signature.substr(space_pos + 1) : signature};
    }

    std::string func_name = signature.substr(last_colon + 2);
    std::string scope = signature.substr(0, last_colon);

    size_t space_pos = scope.rfind(' ');
    if (space_pos != std::string::npos) {
        scope = scope.substr(space_pos + 1);
    }
    size_t template_pos = scope.find('<');
    if (template_pos != std::string::npos) {
        scope.erase(template_pos);
    }
    if (!scope.empty() && scope[0] == '*') {
        scope.erase(0, 1);
    }

    // Drop our own namespace, and anonymous/detail namespaces after it
    const std::string ns = "mdguard::";
    if (starts_with(scope, ns)) {
        scope.erase(0, ns.size());
    }
    if (scope == "mdguard" || starts_with(scope, "{anonymous}")) {
        scope.clear();
    }

    return {scope, func_name};
}

} // anonymous namespace

LogLevel log_level_from_string(const std::string& name, LogLevel fallback) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), color_(isatty(STDERR_FILENO) != 0) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    const char* color = color_ ? level_color(level) : "";
    const char* reset = color_ ? RESET : "";
    const char* func_color = color_ ? "\033[36m" : "";
    const char* location_color = color_ ? "\033[33m" : "";

    // Worker threads log concurrently; build the line first so it goes out in one write
    std::string out;
    char prefix[512];
    if (level_ == LogLevel::DEBUG) {
        auto [scope, func_name] = split_pretty_function(func);
        std::string where = scope.empty() ? func_name : scope + "::" + func_name;
        snprintf(prefix, sizeof(prefix), "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                 timestamp, color, log_level_name(level), reset,
                 func_color, where.c_str(), reset,
                 location_color, file, line, reset);
    } else {
        snprintf(prefix, sizeof(prefix), "[%s] %s[%s]%s ", timestamp, color, log_level_name(level), reset);
    }
    out += prefix;

    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(NULL, 0, fmt, copy);
    va_end(copy);
    if (needed > 0) {
        std::string body(static_cast<size_t>(needed) + 1, '\0');
        vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<size_t>(needed));
        out += body;
    }
    out += '\n';

    fputs(out.c_str(), stderr);
    fflush(stderr);
}

} // namespace mdguard
