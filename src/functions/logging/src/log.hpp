#pragma once
#include <string>

namespace epubkit {

// 로그 레벨: 숫자가 클수록 더 많이 출력
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();

// "error" / "warn" / "info" / "debug" (대소문자 무시). 모르는 값이면 false
bool parse_log_level(const std::string& text, LogLevel& out);
const char* to_string(LogLevel level);

// std::cerr 로 "[warn] ..." 형식 한 줄 출력
void log_error(const std::string& message);
void log_warn(const std::string& message);
void log_info(const std::string& message);
void log_debug(const std::string& message);

} // namespace epubkit
