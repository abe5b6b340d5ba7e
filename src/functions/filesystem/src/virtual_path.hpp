#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epubkit {

namespace detail {
class FileSystemState;
}

class EpubFileSystem;

// 한 EpubFileSystem 에 묶인 불변 경로 값. 구분자는 항상 '/'
class VirtualPath {
public:
    std::size_t size() const { return segments_.size(); }
    bool is_absolute() const { return absolute_; }
    bool is_root() const { return absolute_ && segments_.empty(); }
    const std::vector<std::string>& segments() const { return segments_; }

    // 루트나 한 segment 짜리 상대 경로면 nullopt
    std::optional<VirtualPath> parent() const;
    // 마지막 segment. 루트는 빈 문자열
    std::string name() const;
    VirtualPath segment(std::size_t index) const;

    VirtualPath resolve(const VirtualPath& other) const;
    VirtualPath resolve(const std::string& other) const;
    VirtualPath resolve_sibling(const std::string& other) const;
    VirtualPath relativize(const VirtualPath& other) const;
    bool starts_with(const VirtualPath& other) const;
    bool ends_with(const VirtualPath& other) const;

    VirtualPath absolute() const;
    // 루트 위로 올라가는 ".." 는 FileError(PathEscapesRoot)
    VirtualPath normalize() const;

    std::string to_string() const;
    // 정규화된 절대 경로 문자열. 트리 조회 키로 쓴다
    std::string key() const;

    bool exists() const;
    bool belongs_to(const EpubFileSystem& fs) const;
    const std::shared_ptr<detail::FileSystemState>& state() const { return state_; }
    // 닫힌 파일시스템이면 FileError(FileSystemClosed)
    void check_open() const;

    friend bool operator==(const VirtualPath& a, const VirtualPath& b);
    friend bool operator!=(const VirtualPath& a, const VirtualPath& b) { return !(a == b); }
    friend bool operator<(const VirtualPath& a, const VirtualPath& b);

private:
    friend class EpubFileSystem;

    VirtualPath(std::shared_ptr<detail::FileSystemState> state,
                std::vector<std::string> segments, bool absolute);

    static VirtualPath parse(const std::shared_ptr<detail::FileSystemState>& state,
                             const std::string& text);
    void require_same_file_system(const VirtualPath& other) const;

    std::shared_ptr<detail::FileSystemState> state_;
    std::vector<std::string> segments_;
    bool absolute_ = false;
};

} // namespace epubkit
