#include "table_of_contents.hpp"
#include "functions/filesystem/src/file_error.hpp"
#include "functions/logging/src/log.hpp"
#include "functions/opf/src/href.hpp"

namespace epubkit {

PageIndex::PageIndex(const Manifest& manifest, const VirtualPath& opf_directory) {
    for (const ManifestItem& item : manifest.items) {
        if (!is_page(item)) continue;
        try {
            if (auto path = resolve_href(opf_directory, item.href)) pages_.emplace(path->key(), &item);
        } catch (const FileError& e) {
            log_warn("manifest item '" + item.identifier + "' has an unusable href: " + e.what());
        }
    }
}

bool PageIndex::is_page(const ManifestItem& item) {
    return item.media_type == "application/xhtml+xml" || item.media_type == "text/html" ||
           item.media_type == "application/x-dtbook+xml" || item.media_type == "image/svg+xml";
}

const ManifestItem* PageIndex::find(const VirtualPath& path) const {
    auto it = pages_.find(path.key());
    return it == pages_.end() ? nullptr : it->second;
}

std::size_t TableOfContents::size() const {
    std::size_t n = 0;
    std::vector<const TocEntry*> stack;
    for (const auto& e : entries) stack.push_back(&e);
    while (!stack.empty()) {
        const TocEntry* e = stack.back();
        stack.pop_back();
        ++n;
        for (const auto& c : e->children) stack.push_back(&c);
    }
    return n;
}

namespace {

// 목차 문서 디렉토리 기준으로 href 를 풀어 페이지에 연결한다
class EntryResolver {
public:
    EntryResolver(const VirtualPath& document_file, const PageIndex& pages)
        : document_(document_file.name()), pages_(pages) {
        auto parent = document_file.absolute().parent();
        directory_ = parent ? *parent : document_file.absolute();
    }

    void link(TocEntry& entry, const std::string& href, const std::string& location) const {
        HrefParts parts = split_fragment(href);
        std::optional<VirtualPath> path;
        try {
            path = resolve_href(*directory_, href);
        } catch (const FileError& e) {
            fail(href, location, e.what());
        }
        if (!path) fail(href, location, "not a local resource");
        const ManifestItem* item = pages_.find(*path);
        if (!item) fail(href, location, "'" + path->to_string() + "' is not a manifest page");

        entry.item_id = item->identifier;
        entry.path = path->key();
        entry.fragment = parts.fragment;
    }

    [[noreturn]] void fail(const std::string& href, const std::string& location, const std::string& detail) const {
        throw ReadError(ReadError::Kind::UnresolvableReference, document_, href, location, detail);
    }

private:
    std::string document_;
    std::optional<VirtualPath> directory_;
    const PageIndex& pages_;
};

TocEntry from_nav_point(const NavPoint& point, const EntryResolver& resolver, const std::string& parent) {
    std::string location = parent + "/navPoint[@id='" + point.identifier + "']";
    TocEntry entry;
    entry.title = point.labels.empty() ? std::string() : point.labels.front().text.content;
    entry.identifier = point.identifier;
    resolver.link(entry, point.content.source, location + "/content/@src");
    for (const NavPoint& child : point.children) entry.children.push_back(from_nav_point(child, resolver, location));
    return entry;
}

TocEntry from_list_item(const NavListItem& item, const EntryResolver& resolver, const std::string& location) {
    TocEntry entry;
    entry.title = item.content.text;
    if (item.content.href) {
        resolver.link(entry, *item.content.href, location + "/a/@href");
    } else if (item.children.empty()) {
        resolver.fail("", location + "/span", "leaf entry without a link");
    }
    for (std::size_t i = 0; i < item.children.size(); ++i)
        entry.children.push_back(
            from_list_item(item.children[i], resolver, location + "/ol/li[" + std::to_string(i + 1) + "]"));
    return entry;
}

} // namespace

TableOfContents table_of_contents_from_ncx(const NcxDocument& ncx, const VirtualPath& ncx_file,
                                           const PageIndex& pages) {
    EntryResolver resolver(ncx_file, pages);
    TableOfContents toc;
    for (const NavPoint& point : ncx.nav_map.points) toc.entries.push_back(from_nav_point(point, resolver, "/ncx/navMap"));
    return toc;
}

TableOfContents table_of_contents_from_nav(const NavigationDocument& nav, const VirtualPath& nav_file,
                                           const PageIndex& pages) {
    const Navigation* toc_nav = nav.find(NavigationType::Toc);
    TableOfContents toc;
    if (!toc_nav) return toc;
    EntryResolver resolver(nav_file, pages);
    const std::string base = "/html/body/nav[@epub:type='toc']/ol";
    for (std::size_t i = 0; i < toc_nav->items.size(); ++i)
        toc.entries.push_back(
            from_list_item(toc_nav->items[i], resolver, base + "/li[" + std::to_string(i + 1) + "]"));
    return toc;
}

} // namespace epubkit
