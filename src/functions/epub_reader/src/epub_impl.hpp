#pragma once
#include <optional>
#include <string>
#include <vector>

#include "epub.hpp"

namespace epubkit {

// 파일시스템에 리스너로 등록되므로 주소가 바뀌면 안 된다 (Epub 이 unique_ptr 로 소유)
struct Epub::Impl : detail::ResourceListener {
    Impl(EpubFileSystem fs, MetaInfContainer container, PackageDocument package, VirtualPath opf_path,
         std::vector<ReadError> warnings);
    ~Impl() override;

    VirtualPath opf_directory_path() const;
    // manifest href → 정규화된 절대 경로 키. 원격이거나 잘못된 href 면 nullopt
    std::optional<std::string> key_of(const ManifestItem& item) const;
    void register_local_resources();

    void on_local_resource_removing(const std::string& path) override;
    void on_local_resource_moved(const std::string& from, const std::string& to) override;

    void write_documents(const PackageWriteOptions& options);

    EpubFileSystem fs;
    MetaInfContainer container;
    PackageDocument package;
    VirtualPath opf_path;
    std::vector<ReadError> warnings;
};

} // namespace epubkit
