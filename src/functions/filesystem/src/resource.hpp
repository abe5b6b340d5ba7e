#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "big_unsigned.hpp"
#include "virtual_path.hpp"

namespace epubkit {

// 읽기 전용이 기본. 비트가 더해질수록 허용되는 작업이 늘어난다
enum Capability : unsigned {
    kDeletable = 1u << 0,
    kModifiable = 1u << 1,
    kUnprotected = 1u << 2,
};
using Capabilities = unsigned;

constexpr Capabilities kReadOnly = 0;
constexpr Capabilities kAllCapabilities = kDeletable | kModifiable | kUnprotected;

class Nil;
class File;
class Directory;
using Resource = std::variant<Nil, File, Directory>;

// 경로에 지금 무엇이 있는지 판별. 캐시 없음
Resource classify(const VirtualPath& path);
const VirtualPath& path_of(const Resource& resource);
const char* kind_name(const Resource& resource);

// 파일 하나에 대한 저수준 읽기/쓰기. Unprotected 파일에서만 얻을 수 있다
class ByteChannel {
public:
    std::string read(std::size_t count);
    std::size_t write(const std::string& bytes);
    std::uint64_t position() const { return position_; }
    void seek(std::uint64_t position) { position_ = position; }
    std::uint64_t size() const;
    void truncate(std::uint64_t size);

private:
    friend class File;
    explicit ByteChannel(VirtualPath path);

    VirtualPath path_;
    std::uint64_t position_ = 0;
};

class Nil {
public:
    const VirtualPath& path() const { return path_; }
    std::string name() const { return path_.name(); }
    bool is_same_as(const Resource& other) const;

    // 시스템 파일 이름으로는 만들 수 없다 (NotModifiable)
    File create_file(const std::string& data = {}, bool create_parents = false) const;
    Directory create_directory(bool create_parents = false) const;

private:
    friend Resource classify(const VirtualPath& path);
    explicit Nil(VirtualPath path) : path_(std::move(path)) {}

    VirtualPath path_;
};

class File {
public:
    const VirtualPath& path() const { return path_; }
    std::string name() const { return path_.name(); }
    Capabilities capabilities() const { return capabilities_; }
    bool has(Capability capability) const { return (capabilities_ & capability) != 0; }
    bool is_deletable() const { return has(kDeletable); }
    bool is_modifiable() const { return has(kModifiable); }
    bool is_unprotected() const { return has(kUnprotected); }
    // 권한이 없으면 FileError(NotDeletable / NotModifiable / NotUnprotected)
    const File& require(Capability capability) const;

    Directory parent() const;

    bool is_empty() const;
    std::uint64_t file_size() const;
    std::time_t last_modified_time() const;
    bool is_same_as(const Resource& other) const;

    std::string read_bytes() const;
    std::vector<std::string> read_lines() const;

    // Modifiable
    void write_bytes(const std::string& bytes) const;
    void append_bytes(const std::string& bytes) const;
    void write_lines(const std::vector<std::string>& lines) const;
    void set_last_modified_time(std::time_t time) const;
    // target: Nil(그 경로에 생성), Directory(같은 이름으로 그 안에), File(overwrite 필요)
    File copy_to(const Resource& target, bool overwrite = false) const;
    File move_to(const Resource& target, bool overwrite = false) const;
    File rename_to(const std::string& name, bool overwrite = false) const;

    // Deletable. 이미 지워졌으면 FileError(NoSuchResource)
    Nil remove() const;

    // Unprotected
    ByteChannel open_channel() const;

private:
    friend Resource classify(const VirtualPath& path);
    File(VirtualPath path, Capabilities capabilities)
        : path_(std::move(path)), capabilities_(capabilities) {}

    VirtualPath path_;
    Capabilities capabilities_;
};

class Directory {
public:
    const VirtualPath& path() const { return path_; }
    std::string name() const { return path_.name(); }
    Capabilities capabilities() const { return capabilities_; }
    bool has(Capability capability) const { return (capabilities_ & capability) != 0; }
    bool is_deletable() const { return has(kDeletable); }
    bool is_modifiable() const { return has(kModifiable); }
    bool is_unprotected() const { return has(kUnprotected); }
    const Directory& require(Capability capability) const;

    bool is_root() const { return path_.key() == "/"; }
    std::optional<Directory> parent() const;

    bool is_empty() const;
    std::time_t last_modified_time() const;
    bool is_same_as(const Resource& other) const;

    // 이름 순
    std::vector<Resource> list_entries() const;
    Resource resolve(const std::string& relative) const;

    // Modifiable
    File create_file(const std::string& name, const std::string& data = {}) const;
    Directory create_directory(const std::string& name) const;
    void set_last_modified_time(std::time_t time) const;
    // 디렉토리 자체를 옮기므로 Deletable 도 필요
    Directory move_to(const Resource& target, bool overwrite = false) const;
    Directory rename_to(const std::string& name, bool overwrite = false) const;

    // Deletable. 비어 있어야 한다
    Nil remove() const;

    // 트리 순회 기반 (resource_walk.cpp). 실패하면 멈춘 지점의 FileError
    std::uint64_t calculate_directory_size() const;
    BigUnsigned calculate_large_directory_size() const;
    Directory copy_entries_to(const Directory& target, bool overwrite = false) const;
    Directory move_recursively_to(const Directory& target, bool overwrite = false) const;
    Nil delete_recursively() const;

private:
    friend Resource classify(const VirtualPath& path);
    Directory(VirtualPath path, Capabilities capabilities)
        : path_(std::move(path)), capabilities_(capabilities) {}

    VirtualPath path_;
    Capabilities capabilities_;
};

// classify 후 File/Directory 가 아니면 FileError
File require_file(const VirtualPath& path);
Directory require_directory(const VirtualPath& path);

} // namespace epubkit
