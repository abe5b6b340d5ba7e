#include <gtest/gtest.h>

#include "functions/epub_reader/src/epub_reader.hpp"
#include "functions/summary/src/summary.hpp"
#include "test_helpers.hpp"

using namespace epubkit;

TEST(SummaryTest, InfoCarriesPackageFields) {
    Epub epub = open_epub_bytes(epubkit_test::epub3_book().bytes());
    nlohmann::json j = summarize(epub);

    for (const char* key : {"version", "format", "opf", "unique_identifier", "identifiers", "titles",
                            "languages", "creators", "manifest_items", "spine_items", "has_guide", "warnings"})
        EXPECT_TRUE(j.contains(key)) << key;
    EXPECT_EQ(j["version"], "3.0");
    EXPECT_EQ(j["format"], "EPUB 3.0");
    EXPECT_EQ(j["opf"], "/OEBPS/content.opf");
    EXPECT_EQ(j["unique_identifier"], "uid");
    EXPECT_EQ(j["titles"], nlohmann::json::array({"Test Book"}));
    EXPECT_EQ(j["languages"], nlohmann::json::array({"en"}));
    EXPECT_TRUE(j["creators"].empty());
    EXPECT_EQ(j["manifest_items"], 5);
    EXPECT_EQ(j["spine_items"], 2);
    EXPECT_EQ(j["has_guide"], false);
    EXPECT_TRUE(j["warnings"].empty());
}

TEST(SummaryTest, CreatorsComeFromDublinCore) {
    Epub epub = open_epub_bytes(epubkit_test::epub2_book().bytes());
    nlohmann::json j = summarize(epub);
    EXPECT_EQ(j["format"], "EPUB 2.0");
    EXPECT_EQ(j["creators"], nlohmann::json::array({"Some One"}));
    EXPECT_EQ(j["has_guide"], true);
}

TEST(SummaryTest, TableOfContentsNestsChildren) {
    Epub epub = open_epub_bytes(epubkit_test::epub3_book().bytes());
    nlohmann::json toc = toc_to_json(epub.table_of_contents());

    ASSERT_EQ(toc.size(), 2u);
    EXPECT_EQ(toc[0]["title"], "Chapter One");
    EXPECT_EQ(toc[0]["path"], "/OEBPS/text/ch1.xhtml");
    EXPECT_EQ(toc[0]["item"], "ch1");
    EXPECT_FALSE(toc[0].contains("children"));

    // span 제목은 링크가 없다
    EXPECT_EQ(toc[1]["title"], "Part Two");
    EXPECT_FALSE(toc[1].contains("path"));
    ASSERT_EQ(toc[1]["children"].size(), 1u);
    EXPECT_EQ(toc[1]["children"][0]["item"], "ch2");
    EXPECT_EQ(toc[1]["children"][0]["fragment"], "top");
}

TEST(SummaryTest, CapabilityFlags) {
    Epub epub = open_epub_bytes(epubkit_test::epub3_book().bytes());
    EpubFileSystem& fs = epub.file_system();
    require_directory(fs.get_path("/OEBPS")).create_file("notes.txt", "n");

    EXPECT_EQ(capability_flags(classify(fs.get_path("/OEBPS/content.opf"))), "---");
    EXPECT_EQ(capability_flags(classify(fs.get_path("/mimetype"))), "---");
    EXPECT_EQ(capability_flags(classify(fs.get_path("/OEBPS/text/ch1.xhtml"))), "DM-");
    EXPECT_EQ(capability_flags(classify(fs.get_path("/OEBPS/notes.txt"))), "DMU");
    EXPECT_EQ(capability_flags(classify(fs.get_path("/OEBPS"))), "-M-");
    EXPECT_EQ(capability_flags(classify(fs.get_path("/OEBPS/missing.txt"))), "---");
}
