#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace epubkit {

static LogLevel g_level = LogLevel::Warn;

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "info") { out = LogLevel::Info; return true; }
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    return false;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

static void emit(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) > static_cast<int>(g_level)) return;
    std::cerr << "[" << to_string(level) << "] " << message << "\n";
}

void log_error(const std::string& message) { emit(LogLevel::Error, message); }
void log_warn(const std::string& message)  { emit(LogLevel::Warn, message); }
void log_info(const std::string& message)  { emit(LogLevel::Info, message); }
void log_debug(const std::string& message) { emit(LogLevel::Debug, message); }

} // namespace epubkit
