#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "functions/filesystem/src/epub_file_system.hpp"
#include "functions/metainf/src/container.hpp"
#include "functions/opf/src/package_xml.hpp"
#include "functions/toc/src/table_of_contents.hpp"
#include "reader_error.hpp"

namespace epubkit {

constexpr const char* kEpubMimeType = "application/epub+zip";

// 열린 책 하나. 파일시스템과 파싱된 문서들을 소유한다
class Epub {
public:
    Epub(Epub&&) noexcept;
    Epub& operator=(Epub&&) noexcept;
    ~Epub();

    const EpubVersion& version() const;
    Format format() const;
    // 3.1 이나 지원하지 않는 버전이면 VersionError
    void set_version(const EpubVersion& version);

    PackageDocument& package();
    const PackageDocument& package() const;
    MetaInfContainer& container();
    const MetaInfContainer& container() const;
    EpubFileSystem& file_system();
    const EpubFileSystem& file_system() const;

    File opf_file() const;
    Directory opf_directory() const;

    // EPUB 3 는 nav 문서, 없거나 EPUB 2 면 spine/@toc 의 NCX. 매번 다시 읽는다
    TableOfContents table_of_contents() const;

    // 무시된 선택 요소 (guide, bindings, tours) 의 에러
    const std::vector<ReadError>& warnings() const;

    // manifest 를 직접 고친 뒤 보호 테이블을 다시 만든다
    void refresh_local_resources();

    std::string to_bytes(const PackageWriteOptions& options = PackageWriteOptions());
    void save(const std::filesystem::path& path, const PackageWriteOptions& options = PackageWriteOptions());

    // 이후 파일시스템의 모든 경로/핸들은 FileError(FileSystemClosed)
    void close();

private:
    struct Impl;
    explicit Epub(std::unique_ptr<Impl> impl);

    friend Epub load_epub(const std::vector<ZipEntry>& entries, const PackageReadOptions& options);

    std::unique_ptr<Impl> impl_;
};

} // namespace epubkit
