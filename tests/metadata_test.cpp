#include <gtest/gtest.h>

#include <pugixml.hpp>

#include "functions/opf/src/package_xml.hpp"
#include "functions/xml/src/xml_helpers.hpp"
#include "test_helpers.hpp"

using namespace epubkit;
using epubkit_test::opf;

namespace {

const char* kManifest = "<item id=\"ch1\" href=\"ch1.xhtml\" media-type=\"application/xhtml+xml\"/>\n";
const char* kSpine = "<itemref idref=\"ch1\"/>\n";

PackageDocument read(const std::string& version, const std::string& metadata) {
    std::vector<ReadError> warnings;
    return parse_package_document(opf(version, metadata, kManifest, kSpine), "content.opf",
                                  PackageReadOptions(), warnings);
}

// metadata 자식 요소를 "이름[@id]" 목록으로
std::vector<std::string> written_metadata(const PackageDocument& package) {
    pugi::xml_document doc;
    xml::load_document(doc, package_document_to_string(package, PackageWriteOptions()), "content.opf");
    std::vector<std::string> out;
    pugi::xml_node metadata = doc.document_element().child("metadata");
    for (pugi::xml_node c : xml::child_elements(metadata)) {
        std::string step = c.name();
        if (pugi::xml_attribute id = c.attribute("id")) step += std::string("#") + id.value();
        if (pugi::xml_attribute p = c.attribute("property")) step += std::string("@") + p.value();
        out.push_back(step);
    }
    return out;
}

} // namespace

TEST(MetadataTest, RequiredElementsAreCollected) {
    PackageDocument package = read("3.0", epubkit_test::default_metadata() +
                                              "<dc:creator id=\"c\">Someone</dc:creator>\n"
                                              "<dc:subject>Fiction</dc:subject>\n");
    ASSERT_EQ(package.metadata.identifiers.size(), 1u);
    EXPECT_EQ(*package.metadata.identifiers[0].identifier, "uid");
    EXPECT_EQ(package.metadata.titles[0].content, "Test Book");
    EXPECT_EQ(package.metadata.languages[0].content, "en");
    ASSERT_EQ(package.metadata.dublin_core.size(), 2u);
    EXPECT_EQ(package.metadata.dublin_core[0].kind, DublinCoreKind::Creator);
    EXPECT_EQ(package.metadata.dublin_core[1].kind, DublinCoreKind::Subject);
}

TEST(MetadataTest, MissingRequiredElementsAreTyped) {
    struct Case {
        std::string metadata;
        ReadError::Kind kind;
    };
    const Case cases[] = {
        {"<dc:title>T</dc:title><dc:language>en</dc:language>", ReadError::Kind::MissingIdentifier},
        {"<dc:identifier id=\"uid\">x</dc:identifier><dc:language>en</dc:language>", ReadError::Kind::MissingTitle},
        {"<dc:identifier id=\"uid\">x</dc:identifier><dc:title>T</dc:title>", ReadError::Kind::MissingLanguage},
        {epubkit_test::default_metadata() + "<dc:author>x</dc:author>", ReadError::Kind::UnknownDublinCoreElement},
    };
    for (const Case& c : cases) {
        try {
            read("3.0", c.metadata);
            ADD_FAILURE() << "expected ReadError for " << c.metadata;
        } catch (const ReadError& e) {
            EXPECT_EQ(e.kind(), c.kind) << c.metadata;
            EXPECT_EQ(e.document(), "content.opf");
        }
    }
}

TEST(MetadataTest, MetaFormatFollowsPropertyAndText) {
    PackageDocument package = read("3.0", epubkit_test::default_metadata() +
                                              "<meta property=\"dcterms:modified\">2020-01-01T00:00:00Z</meta>\n"
                                              "<meta property=\"dcterms:modified\"/>\n"
                                              "<meta name=\"cover\" content=\"img\" data-x=\"1\"/>\n");
    auto opf3 = package.metadata.opf3_metas();
    auto opf2 = package.metadata.opf2_metas();
    ASSERT_EQ(opf3.size(), 1u);
    ASSERT_EQ(opf2.size(), 2u);
    EXPECT_EQ(opf3[0]->property().to_string(), "dcterms:modified");
    EXPECT_EQ(opf3[0]->value_string(), "2020-01-01T00:00:00Z");
    EXPECT_FALSE(opf3[0]->is_typed());

    // 텍스트 없는 property meta 는 모르는 속성을 보존한 OPF2 meta
    ASSERT_EQ(opf2[0]->extra_attributes.size(), 1u);
    EXPECT_EQ(opf2[0]->extra_attributes[0].qualified_name, "property");
    EXPECT_EQ(*opf2[1]->name, "cover");
    EXPECT_EQ(*opf2[1]->content, "img");
    EXPECT_EQ(opf2[1]->extra_attributes[0].value, "1");
}

TEST(MetadataTest, MarcRelatorSchemeDecodesToCreativeRole) {
    PackageDocument package = read("3.0", epubkit_test::default_metadata() +
                                              "<dc:creator id=\"c\">Someone</dc:creator>\n"
                                              "<meta refines=\"#c\" property=\"role\" scheme=\"marc:relators\">aut</meta>\n"
                                              "<meta refines=\"#c\" property=\"role\" scheme=\"marc:relators\">zzz</meta>\n");
    auto metas = package.metadata.opf3_metas();
    ASSERT_EQ(metas.size(), 2u);
    ASSERT_TRUE(metas[0]->is_typed());
    const CreativeRole* role = metas[0]->value_as<CreativeRole>();
    ASSERT_NE(role, nullptr);
    EXPECT_EQ(role->code(), "aut");
    EXPECT_EQ(*role->name(), "Author");
    EXPECT_EQ(*metas[0]->refines_target(), "c");

    const CreativeRole* custom = metas[1]->value_as<CreativeRole>();
    ASSERT_NE(custom, nullptr);
    EXPECT_TRUE(custom->is_custom());
    EXPECT_EQ(custom->code(), "oth.zzz");
}

TEST(MetadataTest, ExplicitPrefixWinsOverReservedScheme) {
    std::vector<PrefixMapping> prefixes{{"marc", "http://example.org/not-marc/"}};
    auto registry = MetaSchemeRegistry::standard();
    Opf3Meta meta = Opf3Meta::decode(*registry, prefixes, parse_property("role"), "aut",
                                     parse_property("marc:relators"));
    EXPECT_FALSE(meta.is_typed());
    EXPECT_EQ(meta.value_string(), "aut");
}

TEST(MetadataTest, RegistryRejectsStringValuesForKnownSchemes) {
    auto registry = MetaSchemeRegistry::standard();
    EXPECT_THROW(Opf3Meta::string_meta(*registry, {}, parse_property("role"), "aut",
                                       parse_property("marc:relators")),
                 std::invalid_argument);
    EXPECT_NO_THROW(Opf3Meta::string_meta(*registry, {}, parse_property("role"), "aut",
                                          parse_property("onix:codelist5")));

    MetaSchemeRegistry own = MetaSchemeRegistry::with_defaults();
    EXPECT_THROW(own.add(kMarcRelatorsScheme, registry->find(kMarcRelatorsScheme)), std::invalid_argument);
}

TEST(MetadataTest, Epub2AttributesAreReadAndWrittenForEpub2Only) {
    PackageDocument package = read("2.0",
                                   "<dc:identifier id=\"uid\" opf:scheme=\"ISBN\">123</dc:identifier>\n"
                                   "<dc:title>T</dc:title><dc:language>en</dc:language>\n"
                                   "<dc:creator opf:role=\"ill\" opf:file-as=\"Doe, J\">J Doe</dc:creator>\n"
                                   "<dc:date opf:event=\"publication\">2001</dc:date>\n");
    EXPECT_EQ(*package.metadata.identifiers[0].scheme, "ISBN");
    const DublinCore& creator = package.metadata.dublin_core[0];
    EXPECT_EQ(creator.role->code(), "ill");
    EXPECT_EQ(*creator.file_as, "Doe, J");
    EXPECT_EQ(*package.metadata.dublin_core[1].event, "publication");

    std::string epub2 = package_document_to_string(package, PackageWriteOptions());
    EXPECT_NE(epub2.find("opf:role=\"ill\""), std::string::npos);
    EXPECT_NE(epub2.find("opf:scheme=\"ISBN\""), std::string::npos);

    package.set_version(EpubVersion{3, 0, 0});
    std::string epub3 = package_document_to_string(package, PackageWriteOptions());
    EXPECT_EQ(epub3.find("opf:role"), std::string::npos);
    EXPECT_EQ(epub3.find("opf:event"), std::string::npos);
}

TEST(MetadataTest, RefinementsAreNestedAfterTheirTargets) {
    PackageDocument package = read("3.0", epubkit_test::default_metadata() +
                                              "<meta refines=\"#role\" property=\"alternate-script\">X</meta>\n"
                                              "<meta property=\"dcterms:modified\">2020-01-01T00:00:00Z</meta>\n"
                                              "<meta refines=\"#c\" id=\"role\" property=\"role\">aut</meta>\n"
                                              "<link refines=\"#c\" rel=\"record\" href=\"r.xml\"/>\n"
                                              "<meta refines=\"#nowhere\" property=\"x\">orphan</meta>\n"
                                              "<dc:creator id=\"c\">Someone</dc:creator>\n");
    EXPECT_EQ(written_metadata(package), (std::vector<std::string>{
                                             "dc:identifier#uid",
                                             "dc:title",
                                             "dc:language",
                                             "dc:creator#c",
                                             "link",
                                             "meta#role@role",
                                             "meta@alternate-script",
                                             "meta@dcterms:modified",
                                             "meta@x",
                                         }));
}

TEST(MetadataTest, ForeignElementsKeepTheirNamespace) {
    std::string content = opf("2.0", epubkit_test::default_metadata() + "<calibre:series>S</calibre:series>\n",
                              kManifest, kSpine);
    content.replace(content.find("<metadata "), 10,
                    "<metadata xmlns:calibre=\"http://calibre.kovidgoyal.net/2009/metadata\" ");
    std::vector<ReadError> warnings;
    PackageDocument package = parse_package_document(content, "content.opf", PackageReadOptions(), warnings);
    ASSERT_EQ(package.metadata.foreign_elements.size(), 1u);
    const std::string& raw = package.metadata.foreign_elements[0];
    EXPECT_NE(raw.find("xmlns:calibre=\"http://calibre.kovidgoyal.net/2009/metadata\""), std::string::npos);

    std::string written = package_document_to_string(package, PackageWriteOptions());
    EXPECT_NE(written.find("calibre:series"), std::string::npos);
}

TEST(MetadataTest, CreativeRoleCodes) {
    EXPECT_EQ(CreativeRole::create("AUT").code(), "aut");
    EXPECT_FALSE(CreativeRole::create("aut").is_custom());
    EXPECT_EQ(CreativeRole::create("oth.editor").code(), "oth.editor");
    EXPECT_FALSE(CreativeRole::defaults().empty());
}
