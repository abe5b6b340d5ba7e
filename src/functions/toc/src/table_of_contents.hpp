#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "functions/filesystem/src/virtual_path.hpp"
#include "functions/opf/src/package_document.hpp"
#include "nav_document.hpp"
#include "ncx.hpp"

namespace epubkit {

// manifest 의 페이지 항목을 OPF 디렉토리 기준 절대 경로로 찾는다
class PageIndex {
public:
    PageIndex(const Manifest& manifest, const VirtualPath& opf_directory);

    // XHTML/HTML/DTBook/SVG 콘텐츠 문서
    static bool is_page(const ManifestItem& item);

    const ManifestItem* find(const VirtualPath& path) const;

private:
    std::map<std::string, const ManifestItem*> pages_;
};

struct TocEntry {
    std::string title;
    // 링크가 없는 span 제목이면 nullopt
    std::optional<std::string> item_id;
    std::optional<std::string> path;
    std::optional<std::string> fragment;
    std::optional<std::string> identifier;
    std::vector<TocEntry> children;
};

struct TableOfContents {
    std::vector<TocEntry> entries;

    // 모든 깊이의 항목 수
    std::size_t size() const;
};

// 해석할 수 없는 src/href 는 ReadError(UnresolvableReference)
TableOfContents table_of_contents_from_ncx(const NcxDocument& ncx, const VirtualPath& ncx_file,
                                           const PageIndex& pages);
TableOfContents table_of_contents_from_nav(const NavigationDocument& nav, const VirtualPath& nav_file,
                                           const PageIndex& pages);

} // namespace epubkit
