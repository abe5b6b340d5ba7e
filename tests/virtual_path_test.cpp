#include <gtest/gtest.h>

#include "functions/filesystem/src/file_error.hpp"
#include "test_helpers.hpp"

using namespace epubkit;
using epubkit_test::file_system;

class VirtualPathTest : public ::testing::Test {
protected:
    EpubFileSystem fs = file_system({{"OEBPS/text/ch1.xhtml", "<html/>"}, {"mimetype", "application/epub+zip"}});
};

TEST_F(VirtualPathTest, SegmentsAndFlags) {
    VirtualPath p = fs.get_path("/OEBPS", {"text", "ch1.xhtml"});
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p.size(), 3u);
    EXPECT_EQ(p.name(), "ch1.xhtml");
    EXPECT_EQ(p.to_string(), "/OEBPS/text/ch1.xhtml");
    EXPECT_EQ(p.parent()->to_string(), "/OEBPS/text");
    EXPECT_EQ(p.segment(0).to_string(), "OEBPS");

    VirtualPath relative = fs.get_path("text/ch1.xhtml");
    EXPECT_FALSE(relative.is_absolute());
    EXPECT_EQ(relative.absolute().to_string(), "/text/ch1.xhtml");
    EXPECT_FALSE(fs.get_path("single").parent().has_value());
    EXPECT_TRUE(fs.root().is_root());
    EXPECT_FALSE(fs.root().parent().has_value());
}

TEST_F(VirtualPathTest, ResolveAndSibling) {
    VirtualPath dir = fs.get_path("/OEBPS");
    EXPECT_EQ(dir.resolve("text/ch1.xhtml").to_string(), "/OEBPS/text/ch1.xhtml");
    EXPECT_EQ(dir.resolve("/mimetype").to_string(), "/mimetype");
    EXPECT_EQ(fs.get_path("/OEBPS/text/ch1.xhtml").resolve_sibling("ch2.xhtml").to_string(),
              "/OEBPS/text/ch2.xhtml");
}

TEST_F(VirtualPathTest, Relativize) {
    VirtualPath from = fs.get_path("/OEBPS/text");
    VirtualPath to = fs.get_path("/OEBPS/images/a.png");
    VirtualPath rel = from.relativize(to);
    EXPECT_EQ(rel.to_string(), "../images/a.png");
    EXPECT_EQ(from.resolve(rel).normalize(), to);
    EXPECT_THROW(from.relativize(fs.get_path("images")), FileError);
}

TEST_F(VirtualPathTest, StartsAndEndsWith) {
    VirtualPath p = fs.get_path("/OEBPS/text/ch1.xhtml");
    EXPECT_TRUE(p.starts_with(fs.get_path("/OEBPS")));
    EXPECT_FALSE(p.starts_with(fs.get_path("OEBPS")));
    EXPECT_FALSE(p.starts_with(fs.get_path("/OEB")));
    EXPECT_TRUE(p.ends_with(fs.get_path("text/ch1.xhtml")));
    EXPECT_FALSE(p.ends_with(fs.get_path("ch1")));
}

TEST_F(VirtualPathTest, NormalizeCannotEscapeRoot) {
    EXPECT_EQ(fs.get_path("/OEBPS/./text/../text/ch1.xhtml").normalize().to_string(), "/OEBPS/text/ch1.xhtml");
    EXPECT_EQ(fs.get_path("../a").normalize().to_string(), "../a");
    try {
        fs.get_path("/OEBPS/../../etc/passwd").normalize();
        FAIL();
    } catch (const FileError& e) {
        EXPECT_EQ(e.kind(), FileError::Kind::PathEscapesRoot);
    }
}

TEST_F(VirtualPathTest, ComparisonIsScopedToOneFileSystem) {
    EpubFileSystem other = file_system({{"OEBPS/text/ch1.xhtml", ""}});
    VirtualPath a = fs.get_path("/OEBPS");
    VirtualPath b = other.get_path("/OEBPS");
    EXPECT_NE(a, b);
    EXPECT_TRUE(a.belongs_to(fs));
    EXPECT_FALSE(b.belongs_to(fs));
    EXPECT_THROW(a.resolve(b), ForeignPathError);
    EXPECT_THROW(a.starts_with(b), ForeignPathError);
    EXPECT_TRUE(fs.get_path("/a") < fs.get_path("/b"));
}

TEST_F(VirtualPathTest, ClosedFileSystemInvalidatesPaths) {
    VirtualPath p = fs.get_path("/OEBPS/text/ch1.xhtml");
    fs.close();
    EXPECT_FALSE(fs.is_open());
    try {
        p.normalize();
        FAIL();
    } catch (const FileError& e) {
        EXPECT_EQ(e.kind(), FileError::Kind::FileSystemClosed);
    }
    EXPECT_THROW(classify(p), FileError);
    EXPECT_THROW(fs.get_path("/OEBPS"), FileError);
}
