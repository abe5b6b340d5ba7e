#include <gtest/gtest.h>

#include "functions/opf/src/package_xml.hpp"
#include "test_helpers.hpp"

using namespace epubkit;
using epubkit_test::opf;

namespace {

const char* kManifest =
    "<item id=\"nav\" href=\"nav.xhtml\" media-type=\"application/xhtml+xml\" properties=\"nav\"/>\n"
    "<item id=\"ch1\" href=\"ch1.xhtml\" media-type=\"application/xhtml+xml\" fallback=\"nav\" "
    "media-overlay=\"smil\"/>\n"
    "<item id=\"smil\" href=\"ch1.smil\" media-type=\"application/smil+xml\"/>\n";
const char* kSpine = "<itemref idref=\"ch1\" properties=\"page-spread-left\"/>\n<itemref idref=\"nav\" linear=\"no\"/>\n";

PackageDocument read(const std::string& content, std::vector<ReadError>* warnings = nullptr) {
    std::vector<ReadError> ignored;
    return parse_package_document(content, "content.opf", PackageReadOptions(), warnings ? *warnings : ignored);
}

ReadError read_error(const std::string& content) {
    try {
        read(content);
    } catch (const ReadError& e) {
        return e;
    }
    ADD_FAILURE() << "no ReadError thrown";
    return ReadError(ReadError::Kind::MalformedDocument, {}, {}, {});
}

} // namespace

TEST(PackageTest, ReadsManifestAndSpine) {
    PackageDocument package = read(opf("3.0", "", kManifest, kSpine, "", " toc=\"nav\" page-progression-direction=\"rtl\""));
    EXPECT_EQ(package.format(), Format::Epub3_0);
    EXPECT_EQ(package.unique_identifier, "uid");
    ASSERT_EQ(package.manifest.items.size(), 3u);
    EXPECT_EQ(package.manifest.find_by_property("nav")->identifier, "nav");
    EXPECT_EQ(*package.manifest.find("ch1")->fallback, "nav");
    EXPECT_EQ(*package.manifest.find("ch1")->media_overlay, "smil");
    EXPECT_EQ(package.manifest.find("missing"), nullptr);

    ASSERT_EQ(package.spine.references.size(), 2u);
    EXPECT_TRUE(package.spine.references[0].linear);
    EXPECT_FALSE(package.spine.references[1].linear);
    EXPECT_EQ(*package.spine.toc, "nav");
    EXPECT_EQ(*package.spine.page_progression_direction, ReadingDirection::RightToLeft);
}

TEST(PackageTest, EmptyManifestIsNoItemElements) {
    ReadError e = read_error(opf("3.0", "", "", kSpine));
    EXPECT_EQ(e.kind(), ReadError::Kind::NoItemElements);
    EXPECT_EQ(e.path(), "/package/manifest");
}

TEST(PackageTest, EmptySpineIsNoItemRefElements) {
    ReadError e = read_error(opf("3.0", "", kManifest, ""));
    EXPECT_EQ(e.kind(), ReadError::Kind::NoItemRefElements);
    EXPECT_EQ(e.path(), "/package/spine");
}

TEST(PackageTest, LinearMustBeYesOrNo) {
    PackageDocument yes = read(opf("3.0", "", kManifest, "<itemref idref=\"ch1\" linear=\"yes\"/>"));
    EXPECT_TRUE(yes.spine.references[0].linear);

    ReadError e = read_error(opf("3.0", "", kManifest, "<itemref idref=\"ch1\" linear=\"true\"/>"));
    EXPECT_EQ(e.kind(), ReadError::Kind::InvalidLinearValue);
    EXPECT_EQ(e.name(), "true");
}

TEST(PackageTest, RootAndVersionErrors) {
    EXPECT_EQ(read_error("<packages xmlns=\"http://www.idpf.org/2007/opf\"/>").kind(),
              ReadError::Kind::MissingElement);
    EXPECT_EQ(read_error(opf("three", "", kManifest, kSpine)).kind(), ReadError::Kind::InvalidVersion);
    EXPECT_THROW(read(opf("3.1", "", kManifest, kSpine)), VersionError);
    EXPECT_THROW(read(opf("4.0", "", kManifest, kSpine)), VersionError);
    EXPECT_EQ(read_error(opf("3.0", "", "<item id=\"a\" href=\"a\" media-type=\"text\"/>", kSpine)).kind(),
              ReadError::Kind::InvalidMediaType);
}

TEST(PackageTest, SetVersionKeepsOldValueOnFailure) {
    PackageDocument package = read(opf("3.0", "", kManifest, kSpine));
    EXPECT_THROW(package.set_version(EpubVersion{3, 1, 0}), VersionError);
    EXPECT_EQ(package.format(), Format::Epub3_0);
    package.set_version(EpubVersion{3, 2, 0});
    EXPECT_EQ(package.format(), Format::Epub3_2);
    EXPECT_EQ(package.version().to_string(), "3.2");
}

TEST(PackageTest, InvalidOptionalElementsBecomeWarnings) {
    std::vector<ReadError> warnings;
    PackageDocument package = read(opf("2.0", "", kManifest, kSpine,
                                       "<guide><reference href=\"ch1.xhtml\"/></guide>\n"
                                       "<tours><tour id=\"t\" title=\"T\"/></tours>\n"),
                                   &warnings);
    EXPECT_FALSE(package.guide.has_value());
    EXPECT_FALSE(package.tours.has_value());
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].kind(), ReadError::Kind::MissingAttribute);
    EXPECT_EQ(warnings[1].kind(), ReadError::Kind::NoTourSiteElements);
}

TEST(PackageTest, ReadsBindingsToursAndCollections) {
    PackageDocument package = read(opf("3.0", "", kManifest, kSpine,
                                       "<bindings><mediaType media-type=\"application/x-demo\" handler=\"nav\"/></bindings>\n"
                                       "<collection role=\"index\"><link href=\"ch1.xhtml\"/></collection>\n"));
    ASSERT_TRUE(package.bindings.has_value());
    EXPECT_EQ(package.bindings->media_types[0].handler, "nav");
    ASSERT_EQ(package.collections.size(), 1u);
    EXPECT_NE(package.collections[0].xml.find("role=\"index\""), std::string::npos);

    std::vector<ReadError> warnings;
    read(opf("3.0", "", kManifest, kSpine, "<bindings/>"), &warnings);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].kind(), ReadError::Kind::NoMediaTypeElements);

    PackageDocument epub2 = read(opf("2.0", "", kManifest, kSpine,
                                     "<tours><tour id=\"t\" title=\"T\"><site href=\"ch1.xhtml\" title=\"S\"/></tour></tours>"));
    ASSERT_TRUE(epub2.tours.has_value());
    EXPECT_EQ(epub2.tours->tours[0].sites[0].title, "S");
}

TEST(PackageTest, WriteGatesVersionSpecificAttributes) {
    PackageDocument package = read(opf("3.0", "", kManifest, kSpine));
    package.prefixes.push_back(PrefixMapping{"foaf", "http://xmlns.com/foaf/spec/"});
    std::string epub3 = package_document_to_string(package, PackageWriteOptions());
    EXPECT_NE(epub3.find("properties=\"nav\""), std::string::npos);
    EXPECT_NE(epub3.find("properties=\"page-spread-left\""), std::string::npos);
    EXPECT_NE(epub3.find("linear=\"no\""), std::string::npos);
    EXPECT_EQ(epub3.find("linear=\"yes\""), std::string::npos);
    EXPECT_NE(epub3.find("prefix=\"foaf: http://xmlns.com/foaf/spec/\""), std::string::npos);

    package.set_version(EpubVersion{2, 0, 1});
    std::string epub2 = package_document_to_string(package, PackageWriteOptions());
    EXPECT_EQ(epub2.find("properties="), std::string::npos);
    EXPECT_EQ(epub2.find("prefix="), std::string::npos);
    EXPECT_NE(epub2.find("version=\"2.0.1\""), std::string::npos);
}

TEST(PackageTest, OmitLegacyDropsOpf2MetaAndGuide) {
    PackageDocument package = read(opf("3.0", epubkit_test::default_metadata() + "<meta name=\"cover\" content=\"c\"/>",
                                       kManifest, kSpine,
                                       "<guide><reference type=\"toc\" href=\"nav.xhtml\"/></guide>"));
    ASSERT_TRUE(package.guide.has_value());
    PackageWriteOptions options;
    EXPECT_NE(package_document_to_string(package, options).find("<guide>"), std::string::npos);
    options.omit_legacy = true;
    std::string written = package_document_to_string(package, options);
    EXPECT_EQ(written.find("<guide>"), std::string::npos);
    EXPECT_EQ(written.find("name=\"cover\""), std::string::npos);
}

TEST(PackageTest, WrittenDocumentReadsBackEqual) {
    PackageDocument package = read(opf("3.0", "", kManifest, kSpine, "", " page-progression-direction=\"ltr\""));
    PackageWriteOptions compact;
    compact.indent = 0;
    std::string written = package_document_to_string(package, compact);
    EXPECT_EQ(written.find('\n'), std::string::npos);

    PackageDocument again = read(written);
    EXPECT_EQ(again.metadata.identifiers, package.metadata.identifiers);
    EXPECT_EQ(again.metadata.titles, package.metadata.titles);
    EXPECT_EQ(again.metadata.languages, package.metadata.languages);
    EXPECT_EQ(again.manifest.items, package.manifest.items);
    EXPECT_EQ(again.spine.references, package.spine.references);
    EXPECT_EQ(again.spine.page_progression_direction, package.spine.page_progression_direction);
}
