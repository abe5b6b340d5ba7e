#pragma once
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "functions/archive/src/zip_archive.hpp"
#include "file_system_state.hpp"
#include "resource.hpp"
#include "virtual_path.hpp"

namespace epubkit {

// zip 내용을 메모리 트리로 올린 파일시스템. 책 하나당 하나
class EpubFileSystem {
public:
    // 이름이 ".." 로 루트를 벗어나거나 파일/디렉토리가 충돌하면 FileError
    static EpubFileSystem from_entries(const std::vector<ZipEntry>& entries);
    static EpubFileSystem create_empty();

    EpubFileSystem(EpubFileSystem&&) noexcept = default;
    EpubFileSystem& operator=(EpubFileSystem&&) noexcept = default;
    EpubFileSystem(const EpubFileSystem&) = delete;
    EpubFileSystem& operator=(const EpubFileSystem&) = delete;
    ~EpubFileSystem();

    VirtualPath get_path(const std::string& first, const std::vector<std::string>& more = {}) const;
    VirtualPath root() const;

    // 호스트 파일/스트림을 target 디렉토리 아래로 복사
    File import_file(const std::filesystem::path& host_path, const Directory& target) const;
    File import_stream(std::istream& in, const std::string& name, const Directory& target) const;

    // mimetype 먼저, 나머지는 경로 순
    std::vector<ZipEntry> to_entries() const;

    // 되돌릴 수 없다. 이후 이 파일시스템의 모든 경로/핸들은 FileError(FileSystemClosed)
    void close();
    bool is_open() const;

    // ---- 보호 테이블 ----
    void set_package_document(const VirtualPath& path);
    std::optional<VirtualPath> package_document() const;
    void register_local_resource(const VirtualPath& path);
    void unregister_local_resource(const VirtualPath& path);
    void clear_local_resources();
    bool is_local_resource(const VirtualPath& path) const;
    void set_resource_listener(detail::ResourceListener* listener);

    // mimetype, OPF, container.xml 처럼 보호된 파일을 라이브러리 내부에서 갱신할 때
    void write_system_file(const VirtualPath& path, const std::string& data) const;

    const std::shared_ptr<detail::FileSystemState>& state() const { return state_; }

private:
    explicit EpubFileSystem(std::shared_ptr<detail::FileSystemState> state);

    VirtualPath own(const VirtualPath& path) const;

    std::shared_ptr<detail::FileSystemState> state_;
};

} // namespace epubkit
