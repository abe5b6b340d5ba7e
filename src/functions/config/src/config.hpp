#pragma once
#include <filesystem>
#include <string>
#include <unordered_map>

#include "functions/logging/src/log.hpp"

namespace epubkit {

struct Config {
    LogLevel log_level = LogLevel::Warn;
    // 3.x 로 쓸 때 EPUB 2 전용 요소(OPF2 meta, guide) 생략
    bool omit_legacy = false;
    // 0 이면 들여쓰기 없이 한 줄로
    int xml_indent = 2;
};

// .env (key=value) 읽기. 파일이 없으면 빈 맵
std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path);

// 알 수 없는 값은 std::runtime_error
Config config_from_env(const std::unordered_map<std::string, std::string>& env);

Config load_config(const std::filesystem::path& path);

// 로그 레벨 등 프로세스 전역 설정 반영
void apply_config(const Config& config);

} // namespace epubkit
