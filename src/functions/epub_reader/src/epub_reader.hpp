#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "epub.hpp"

namespace epubkit {

// 실패는 ReaderError. 아카이브 안의 심볼릭 링크는 SymbolicLinkError
Epub open_epub(const std::filesystem::path& path, const PackageReadOptions& options = PackageReadOptions());
Epub open_epub_bytes(const std::string& bytes, const PackageReadOptions& options = PackageReadOptions());
Epub load_epub(const std::vector<ZipEntry>& entries, const PackageReadOptions& options = PackageReadOptions());

} // namespace epubkit
