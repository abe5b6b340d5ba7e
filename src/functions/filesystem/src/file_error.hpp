#pragma once
#include <stdexcept>
#include <string>

namespace epubkit {

// 가상 파일시스템 작업 실패. 경로는 "/OEBPS/a.xhtml" 같은 절대 문자열
class FileError : public std::runtime_error {
public:
    enum class Kind {
        NoSuchResource,
        DirectoryNotEmpty,
        ResourceAlreadyExists,
        NotFile,
        NotDirectory,
        NotModifiable,
        NotDeletable,
        NotUnprotected,
        PathEscapesRoot,
        FileSystemClosed,
        Unknown,
    };

    FileError(Kind kind, std::string path, std::string other = {}, std::string detail = {});

    Kind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }
    // move/copy 대상 경로 (없으면 빈 문자열)
    const std::string& other() const noexcept { return other_; }

private:
    Kind kind_;
    std::string path_;
    std::string other_;
};

const char* to_string(FileError::Kind kind);

// 다른 파일시스템 인스턴스의 경로를 섞어 쓴 경우
class ForeignPathError : public std::logic_error {
public:
    explicit ForeignPathError(const std::string& path);
};

// zip 안에 심볼릭 링크가 있으면 즉시 중단
class SymbolicLinkError : public std::logic_error {
public:
    explicit SymbolicLinkError(const std::string& entry);

    const std::string& entry() const noexcept { return entry_; }

private:
    std::string entry_;
};

} // namespace epubkit
