#pragma once
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace epubkit {

// zip 엔트리 하나. 디렉토리는 name 이 '/' 로 끝난다
struct ZipEntry {
    std::string name;
    bool directory = false;
    std::string data;
    std::time_t modified = 0;
};

// 실패 시 std::runtime_error, 심볼릭 링크가 있으면 SymbolicLinkError
std::vector<ZipEntry> read_zip_file(const std::filesystem::path& path);
std::vector<ZipEntry> read_zip_bytes(const std::string& bytes);

// 순서 그대로 기록. 이름이 "mimetype" 인 엔트리는 압축하지 않는다
std::string write_zip_bytes(const std::vector<ZipEntry>& entries);
void write_zip_file(const std::filesystem::path& path, const std::vector<ZipEntry>& entries);

} // namespace epubkit
