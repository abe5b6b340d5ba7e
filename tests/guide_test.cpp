#include <gtest/gtest.h>

#include "functions/opf/src/package_xml.hpp"
#include "test_helpers.hpp"

using namespace epubkit;

namespace {

Guide read_guide(const std::string& references) {
    std::vector<ReadError> warnings;
    PackageDocument package = parse_package_document(
        epubkit_test::opf("2.0", "", "<item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/>",
                          "<itemref idref=\"a\"/>", "<guide>" + references + "</guide>"),
        "content.opf", PackageReadOptions(), warnings);
    EXPECT_TRUE(warnings.empty());
    return package.guide.value_or(Guide());
}

} // namespace

TEST(GuideTest, ReferenceTypesAreCaseInsensitive) {
    EXPECT_EQ(parse_reference_type("TOC"), ReferenceType::TableOfContents);
    EXPECT_EQ(parse_reference_type("copyright-page"), ReferenceType::CopyrightPage);
    EXPECT_FALSE(parse_reference_type("copyright").has_value());
    EXPECT_STREQ(to_string(ReferenceType::ListOfIllustrations), "loi");
}

TEST(GuideTest, ReadsKnownAndCustomReferences) {
    Guide guide = read_guide("<reference type=\"cover\" href=\"a.xhtml\" title=\"Cover\"/>"
                             "<reference type=\"other.maps\" href=\"a.xhtml#maps\"/>"
                             "<reference type=\"copyright\" href=\"a.xhtml#c\"/>"
                             "<reference type=\"other.toc\" href=\"a.xhtml#toc\"/>");
    ASSERT_NE(guide.find(ReferenceType::Cover), nullptr);
    EXPECT_EQ(*guide.find(ReferenceType::Cover)->title, "Cover");
    ASSERT_NE(guide.find(ReferenceType::TableOfContents), nullptr);
    EXPECT_EQ(guide.find_custom("maps")->href, "a.xhtml#maps");
    EXPECT_NE(guide.find_custom("COPYRIGHT"), nullptr);
    EXPECT_EQ(guide.custom_references().size(), 2u);
}

TEST(GuideTest, CustomTypesAreWrittenWithOtherPrefix) {
    std::vector<ReadError> warnings;
    PackageDocument package = parse_package_document(
        epubkit_test::opf("2.0", "", "<item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/>",
                          "<itemref idref=\"a\"/>", "<guide><reference type=\"maps\" href=\"a.xhtml\"/></guide>"),
        "content.opf", PackageReadOptions(), warnings);
    std::string written = package_document_to_string(package, PackageWriteOptions());
    EXPECT_NE(written.find("type=\"other.maps\""), std::string::npos);
}

TEST(GuideTest, BareOtherPrefixDropsTheGuide) {
    std::vector<ReadError> warnings;
    PackageDocument package = parse_package_document(
        epubkit_test::opf("2.0", "", "<item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/>",
                          "<itemref idref=\"a\"/>", "<guide><reference type=\"other.\" href=\"a.xhtml\"/></guide>"),
        "content.opf", PackageReadOptions(), warnings);
    EXPECT_FALSE(package.guide.has_value());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].kind(), ReadError::Kind::MissingAttribute);
    EXPECT_EQ(warnings[0].name(), "type");

    std::string written = package_document_to_string(package, PackageWriteOptions());
    EXPECT_EQ(written.find("other."), std::string::npos);
}

TEST(GuideTest, KnownTypeCannotBeCustom) {
    Guide guide;
    EXPECT_THROW(guide.add_custom_reference(CustomGuideReference{"Index", "a.xhtml", std::nullopt}),
                 std::invalid_argument);
}

TEST(GuideTest, CorrectorOnlyGrows) {
    GuideReferenceCorrector corrector;
    EXPECT_EQ(corrector.get_correction("copyright"), ReferenceType::CopyrightPage);
    EXPECT_THROW(corrector.get_correction("maps"), std::out_of_range);
    EXPECT_FALSE(corrector.get_correction_or_null("maps").has_value());

    corrector.add_correction("contents", ReferenceType::TableOfContents);
    corrector.add_correction("toc-page", ReferenceType::TableOfContents);
    EXPECT_THROW(corrector.add_correction("contents", ReferenceType::Index), CorrectionAlreadyExists);
    EXPECT_EQ(corrector.get_corrections_for(ReferenceType::TableOfContents),
              (std::vector<std::string>{"contents", "toc-page"}));
    EXPECT_TRUE(corrector.has_correction("toc-page"));

    GuideReferenceCorrector empty(std::map<std::string, ReferenceType>{});
    EXPECT_FALSE(empty.has_correction("copyright"));
}

TEST(GuideTest, CorrectionMovesCustomToKnown) {
    Guide guide = read_guide("<reference type=\"other.copyright\" href=\"a.xhtml#c\"/>");
    guide.correct_custom_types(GuideReferenceCorrector());
    ASSERT_NE(guide.find(ReferenceType::CopyrightPage), nullptr);
    EXPECT_EQ(guide.find(ReferenceType::CopyrightPage)->href, "a.xhtml#c");
    EXPECT_TRUE(guide.custom_references().empty());
}

TEST(GuideTest, DuplicationStrategies) {
    const std::string references = "<reference type=\"copyright-page\" href=\"a.xhtml#old\"/>"
                                   "<reference type=\"other.copyright\" href=\"a.xhtml#new\"/>";
    GuideReferenceCorrector corrector;

    Guide keep = read_guide(references);
    keep.correct_custom_types(corrector);
    EXPECT_EQ(keep.find(ReferenceType::CopyrightPage)->href, "a.xhtml#old");
    EXPECT_EQ(keep.custom_references().size(), 1u);

    Guide replace = read_guide(references);
    replace.correct_custom_types(corrector, [](const CustomGuideReference&, const GuideReference&) {
        return DuplicationStrategy::ReplaceExisting;
    });
    EXPECT_EQ(replace.find(ReferenceType::CopyrightPage)->href, "a.xhtml#new");
    EXPECT_TRUE(replace.custom_references().empty());

    Guide remove = read_guide(references);
    remove.correct_custom_types(corrector, [](const CustomGuideReference& custom, const GuideReference& existing) {
        EXPECT_EQ(custom.href, "a.xhtml#new");
        EXPECT_EQ(existing.href, "a.xhtml#old");
        return DuplicationStrategy::RemoveCustom;
    });
    EXPECT_EQ(remove.find(ReferenceType::CopyrightPage)->href, "a.xhtml#old");
    EXPECT_TRUE(remove.custom_references().empty());
}
