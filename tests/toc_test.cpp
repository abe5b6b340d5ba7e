#include <gtest/gtest.h>

#include <functional>

#include "functions/toc/src/table_of_contents.hpp"
#include "test_helpers.hpp"

using namespace epubkit;

namespace {

const char* kNav =
    "<html xmlns=\"http://www.w3.org/1999/xhtml\" xmlns:epub=\"http://www.idpf.org/2007/ops\">"
    "<head><title> Nav </title></head><body><section>"
    "<nav epub:type=\"toc\"><h2>Contents</h2><ol>"
    "<li><a href=\"text/ch1.xhtml\">One</a></li>"
    "<li><span>Part</span><ol><li><a href=\"text/ch2.xhtml#s1\">Two</a></li></ol></li>"
    "</ol></nav></section>"
    "<nav epub:type=\"page-list\" hidden=\"\"><ol><li><a href=\"text/ch1.xhtml#p1\">1</a></li></ol></nav>"
    "<nav epub:type=\"x-extra\"><ol><li><a href=\"text/ch1.xhtml\">x</a></li></ol></nav>"
    "</body></html>";

class TocTest : public ::testing::Test {
protected:
    EpubFileSystem fs = epubkit_test::file_system({
        {"OEBPS/content.opf", "<package/>"},
        {"OEBPS/nav.xhtml", kNav},
        {"OEBPS/toc.ncx", epubkit_test::ncx_document(3)},
        {"OEBPS/text/ch1.xhtml", "<html/>"},
        {"OEBPS/text/ch2.xhtml", "<html/>"},
    });

    Manifest manifest() const {
        Manifest m;
        m.items.push_back(ManifestItem{"nav", "nav.xhtml", "application/xhtml+xml", {}, {}, {}});
        m.items.push_back(ManifestItem{"ch1", "text/ch1.xhtml", "application/xhtml+xml", {}, {}, {}});
        m.items.push_back(ManifestItem{"ch2", "text/ch2.xhtml", "application/xhtml+xml", {}, {}, {}});
        m.items.push_back(ManifestItem{"ncx", "toc.ncx", kNcxMediaType, {}, {}, {}});
        return m;
    }

    ReadError toc_error(const std::function<void()>& action) {
        try {
            action();
        } catch (const ReadError& e) {
            return e;
        }
        ADD_FAILURE() << "no ReadError thrown";
        return ReadError(ReadError::Kind::MalformedDocument, {}, {}, {});
    }
};

} // namespace

TEST_F(TocTest, NcxTopLevelMatchesNavMap) {
    NcxDocument ncx = parse_ncx(epubkit_test::ncx_document(3), "toc.ncx");
    EXPECT_EQ(ncx.version, "2005-1");
    EXPECT_EQ(ncx.title.content, "Test Book");
    ASSERT_EQ(ncx.authors.size(), 1u);
    ASSERT_EQ(ncx.head.size(), 1u);
    EXPECT_EQ(ncx.head[0].name, "dtb:uid");
    ASSERT_EQ(ncx.nav_map.points.size(), 3u);
    EXPECT_EQ(*ncx.nav_map.points[1].play_order, 2);

    Manifest m = manifest();
    PageIndex pages(m, fs.get_path("/OEBPS"));
    TableOfContents toc = table_of_contents_from_ncx(ncx, fs.get_path("/OEBPS/toc.ncx"), pages);
    ASSERT_EQ(toc.entries.size(), ncx.nav_map.points.size());
    EXPECT_EQ(toc.size(), 4u);
    EXPECT_EQ(toc.entries[0].title, "Entry 1");
    EXPECT_EQ(*toc.entries[0].item_id, "ch1");
    EXPECT_EQ(*toc.entries[0].fragment, "p1");
    EXPECT_EQ(*toc.entries[0].path, "/OEBPS/text/ch1.xhtml");
    ASSERT_EQ(toc.entries[0].children.size(), 1u);
    EXPECT_EQ(*toc.entries[0].children[0].item_id, "ch2");
    EXPECT_FALSE(toc.entries[0].children[0].fragment.has_value());
}

TEST_F(TocTest, NcxStructuralErrors) {
    const std::string head = "<ncx xmlns=\"http://www.daisy.org/z3986/2005/ncx/\" version=\"2005-1\">"
                             "<docTitle><text>T</text></docTitle>";
    auto kind = [&](const std::string& body) {
        return toc_error([&] { parse_ncx(head + body + "</ncx>", "toc.ncx"); }).kind();
    };
    EXPECT_EQ(kind("<navMap/>"), ReadError::Kind::MissingElement);
    EXPECT_EQ(kind("<navMap><navPoint id=\"a\"><content src=\"a.xhtml\"/></navPoint></navMap>"),
              ReadError::Kind::MissingElement);
    EXPECT_EQ(kind("<navMap><navPoint id=\"a\" playOrder=\"x\"><navLabel><text>A</text></navLabel>"
                   "<content src=\"a.xhtml\"/></navPoint></navMap>"),
              ReadError::Kind::MalformedDocument);
    EXPECT_EQ(kind("<navMap><navPoint id=\"a\"><navLabel><text>A</text></navLabel>"
                   "<content src=\"a.xhtml\"/></navPoint></navMap><pageList/>"),
              ReadError::Kind::MissingElement);
    EXPECT_EQ(toc_error([] { parse_ncx("<html/>", "toc.ncx"); }).kind(), ReadError::Kind::MissingElement);
}

TEST_F(TocTest, NcxWritesBackEqual) {
    NcxDocument ncx = parse_ncx(epubkit_test::ncx_document(2), "toc.ncx");
    NcxDocument again = parse_ncx(ncx_to_string(ncx), "toc.ncx");
    ASSERT_EQ(again.nav_map.points.size(), 2u);
    EXPECT_EQ(again.nav_map.points[0].children.size(), 1u);
    EXPECT_EQ(again.nav_map.points[1].content.source, "text/ch2.xhtml#p2");
    EXPECT_EQ(again.title.content, ncx.title.content);
}

TEST_F(TocTest, NavDocumentTypesAndHeadings) {
    NavigationDocument nav = parse_nav_document(kNav, "nav.xhtml");
    EXPECT_EQ(*nav.title, "Nav");
    ASSERT_EQ(nav.navigations.size(), 3u);
    const Navigation* toc = nav.find(NavigationType::Toc);
    ASSERT_NE(toc, nullptr);
    EXPECT_EQ(*toc->heading, "Contents");
    EXPECT_FALSE(toc->hidden);
    EXPECT_TRUE(nav.find(NavigationType::PageList)->hidden);
    EXPECT_EQ(nav.navigations[2].type, NavigationType::Custom);
    EXPECT_EQ(nav.navigations[2].epub_type, "x-extra");
    EXPECT_EQ(nav.find(NavigationType::Landmarks), nullptr);

    EXPECT_EQ(navigation_type_of("frontmatter landmarks"), NavigationType::Landmarks);
    EXPECT_STREQ(to_string(NavigationType::PageList), "page-list");
}

TEST_F(TocTest, NavTocResolvesRelativeToNavDocument) {
    NavigationDocument nav = parse_nav_document(kNav, "nav.xhtml");
    Manifest m = manifest();
    PageIndex pages(m, fs.get_path("/OEBPS"));
    TableOfContents toc = table_of_contents_from_nav(nav, fs.get_path("/OEBPS/nav.xhtml"), pages);
    ASSERT_EQ(toc.entries.size(), 2u);
    EXPECT_EQ(*toc.entries[0].item_id, "ch1");
    EXPECT_EQ(toc.entries[1].title, "Part");
    EXPECT_FALSE(toc.entries[1].item_id.has_value());
    EXPECT_EQ(*toc.entries[1].children[0].fragment, "s1");
    EXPECT_EQ(toc.size(), 3u);
}

TEST_F(TocTest, NavDocumentRequiresTocNav) {
    ReadError e = toc_error([] {
        parse_nav_document("<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><p/></body></html>", "nav.xhtml");
    });
    EXPECT_EQ(e.kind(), ReadError::Kind::MissingElement);
    EXPECT_EQ(e.name(), "nav");

    e = toc_error([] {
        parse_nav_document("<html xmlns=\"http://www.w3.org/1999/xhtml\" xmlns:epub=\"http://www.idpf.org/2007/ops\">"
                           "<body><nav epub:type=\"toc\"><ol/></nav></body></html>",
                           "nav.xhtml");
    });
    EXPECT_EQ(e.name(), "li");
}

TEST_F(TocTest, NavDocumentWritesBackEqual) {
    NavigationDocument nav = parse_nav_document(kNav, "nav.xhtml");
    std::string written = nav_document_to_string(nav);
    EXPECT_NE(written.find("<!DOCTYPE html>"), std::string::npos);
    NavigationDocument again = parse_nav_document(written, "nav.xhtml");
    ASSERT_EQ(again.navigations.size(), 3u);
    EXPECT_TRUE(again.navigations[1].hidden);
    EXPECT_EQ(*again.find(NavigationType::Toc)->items[1].children[0].content.href, "text/ch2.xhtml#s1");
}

TEST_F(TocTest, UnresolvableReferencesNameTheirLocation) {
    Manifest m = manifest();
    m.remove("ch2");
    PageIndex pages(m, fs.get_path("/OEBPS"));

    NcxDocument ncx = parse_ncx(epubkit_test::ncx_document(2), "toc.ncx");
    ReadError e = toc_error([&] { table_of_contents_from_ncx(ncx, fs.get_path("/OEBPS/toc.ncx"), pages); });
    EXPECT_EQ(e.kind(), ReadError::Kind::UnresolvableReference);
    EXPECT_EQ(e.document(), "toc.ncx");
    EXPECT_EQ(e.path(), "/ncx/navMap/navPoint[@id='np1']/navPoint[@id='np1-1']/content/@src");

    NavigationDocument nav = parse_nav_document(kNav, "nav.xhtml");
    e = toc_error([&] { table_of_contents_from_nav(nav, fs.get_path("/OEBPS/nav.xhtml"), pages); });
    EXPECT_EQ(e.path(), "/html/body/nav[@epub:type='toc']/ol/li[2]/ol/li[1]/a/@href");
    EXPECT_EQ(e.name(), "text/ch2.xhtml#s1");
}

TEST_F(TocTest, RemoteAndNonPageTargetsDoNotResolve) {
    Manifest m = manifest();
    PageIndex pages(m, fs.get_path("/OEBPS"));
    EXPECT_TRUE(PageIndex::is_page(*m.find("ch1")));
    EXPECT_FALSE(PageIndex::is_page(*m.find("ncx")));
    EXPECT_EQ(pages.find(fs.get_path("/OEBPS/toc.ncx")), nullptr);

    NavigationDocument nav;
    Navigation toc;
    toc.items.push_back(NavListItem{NavContent{std::string("http://example.org/"), "Web", std::nullopt}, {}});
    nav.navigations.push_back(toc);
    EXPECT_EQ(toc_error([&] { table_of_contents_from_nav(nav, fs.get_path("/OEBPS/nav.xhtml"), pages); }).kind(),
              ReadError::Kind::UnresolvableReference);
}
