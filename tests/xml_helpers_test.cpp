#include <gtest/gtest.h>

#include <functional>

#include "functions/xml/src/xml_helpers.hpp"

using namespace epubkit;
using namespace epubkit::xml;

namespace {

const char* kDocument = R"(<?xml version="1.0"?>
<package xmlns="http://www.idpf.org/2007/opf" xmlns:dc="http://purl.org/dc/elements/1.1/" version="3.0">
  <metadata>
    <dc:title xml:lang="en" dir="rtl">Title</dc:title>
    <dc:creator>A<b>B</b>C</dc:creator>
  </metadata>
  <manifest>
    <item id="a" href="a.xhtml" media-type="application/xhtml+xml"/>
    <item id="b" href="b.xhtml" media-type="bad"/>
  </manifest>
  <spine/>
</package>)";

class XmlHelpersTest : public ::testing::Test {
protected:
    void SetUp() override { load_document(doc, kDocument, "content.opf"); }

    static ReadError::Kind error_kind(const std::function<void()>& action, std::string* path = nullptr) {
        try {
            action();
        } catch (const ReadError& e) {
            if (path) *path = e.path();
            EXPECT_EQ(e.document(), "content.opf");
            return e.kind();
        }
        ADD_FAILURE() << "no ReadError thrown";
        return ReadError::Kind::MalformedDocument;
    }

    pugi::xml_document doc;
    ElementReader reader{"content.opf"};
};

} // namespace

TEST_F(XmlHelpersTest, NamespaceAwareLookup) {
    pugi::xml_node package = doc.document_element();
    EXPECT_TRUE(is_element(package, "package", ns::kOpf));
    EXPECT_FALSE(is_element(package, "package", ns::kNcx));
    pugi::xml_node metadata = reader.child(package, "metadata", ns::kOpf);
    pugi::xml_node title = reader.child(metadata, "title", ns::kDublinCore);
    EXPECT_EQ(namespace_of(title), ns::kDublinCore);
    EXPECT_FALSE(find_child(metadata, "title", ns::kOpf));
    EXPECT_EQ(*reader.language(title), "en");
    EXPECT_EQ(*reader.direction(title), ReadingDirection::RightToLeft);
}

TEST_F(XmlHelpersTest, TextHelpers) {
    pugi::xml_node metadata = find_child(doc.document_element(), "metadata", ns::kOpf);
    pugi::xml_node creator = find_child(metadata, "creator", ns::kDublinCore);
    EXPECT_EQ(*own_text(creator), "AC");
    EXPECT_EQ(text_content(creator), "ABC");
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_FALSE(own_text(find_child(doc.document_element(), "spine", ns::kOpf)).has_value());
}

TEST_F(XmlHelpersTest, AbsolutePathIndexesRepeatedSiblings) {
    pugi::xml_node manifest = find_child(doc.document_element(), "manifest", ns::kOpf);
    auto items = find_children(manifest, "item", ns::kOpf);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(absolute_path(items[1]), "/package/manifest/item[2]");
    EXPECT_EQ(absolute_path(manifest), "/package/manifest");
}

TEST_F(XmlHelpersTest, ErrorsCarryKindAndLocation) {
    pugi::xml_node package = doc.document_element();
    pugi::xml_node manifest = find_child(package, "manifest", ns::kOpf);
    auto items = find_children(manifest, "item", ns::kOpf);
    std::string path;

    EXPECT_EQ(error_kind([&] { reader.child(package, "guide", ns::kOpf); }, &path),
              ReadError::Kind::MissingElement);
    EXPECT_EQ(path, "/package");
    EXPECT_EQ(error_kind([&] { reader.attr(items[0], "properties"); }), ReadError::Kind::MissingAttribute);
    EXPECT_FALSE(reader.optional_attr(items[0], "properties").has_value());
    EXPECT_EQ(reader.media_type(items[0]), "application/xhtml+xml");
    EXPECT_EQ(error_kind([&] { reader.media_type(items[1]); }, &path), ReadError::Kind::InvalidMediaType);
    EXPECT_EQ(path, "/package/manifest/item[2]");
    EXPECT_EQ(error_kind([&] { reader.text(find_child(package, "spine", ns::kOpf)); }),
              ReadError::Kind::MissingText);
}

TEST_F(XmlHelpersTest, WrapperRules) {
    pugi::xml_node package = doc.document_element();
    EXPECT_EQ(reader.children_wrapper(package, "manifest", "item", ns::kOpf, ReadError::Kind::NoItemElements)
                  .size(),
              2u);
    EXPECT_EQ(error_kind([&] {
                  reader.children_wrapper(package, "spine", "itemref", ns::kOpf,
                                          ReadError::Kind::NoItemRefElements);
              }),
              ReadError::Kind::NoItemRefElements);
    EXPECT_FALSE(reader.optional_children_wrapper(package, "tours", "tour", ns::kOpf,
                                                  ReadError::Kind::NoTourSiteElements)
                     .has_value());
    EXPECT_EQ(error_kind([&] {
                  reader.optional_children_wrapper(package, "spine", "itemref", ns::kOpf,
                                                   ReadError::Kind::NoItemRefElements);
              }),
              ReadError::Kind::NoItemRefElements);
}

TEST_F(XmlHelpersTest, UnknownDirectionIsRejected) {
    pugi::xml_document d;
    load_document(d, "<a dir='up'/>", "x.xml");
    EXPECT_EQ(error_kind([&] { ElementReader("content.opf").direction(d.document_element()); }),
              ReadError::Kind::UnknownReadingDirection);
}

TEST(XmlDocumentTest, MalformedInputIsReadError) {
    pugi::xml_document doc;
    try {
        load_document(doc, "<a><b></a>", "toc.ncx");
        FAIL() << "expected ReadError";
    } catch (const ReadError& e) {
        EXPECT_EQ(e.kind(), ReadError::Kind::MalformedDocument);
        EXPECT_EQ(e.document(), "toc.ncx");
    }
}

TEST(XmlWriteTest, NullOmittingSettersAndWrappers) {
    pugi::xml_document doc;
    add_declaration(doc);
    pugi::xml_node root = add_element(doc, "root");
    set_attr(root, "id", std::string("r"));
    set_attr(root, "dir", std::nullopt);
    set_attr(root, "id", std::nullopt);
    std::vector<std::string> values{"x", "y"};
    add_children_with_wrapper(root, "list", values, [](pugi::xml_node parent, const std::string& v) {
        add_text_element(parent, "v", v);
    });
    add_children_with_wrapper(root, "empty", std::vector<std::string>{},
                              [](pugi::xml_node, const std::string&) {});
    EXPECT_EQ(save_document(doc, 0),
              "<?xml version=\"1.0\" encoding=\"UTF-8\"?><root><list><v>x</v><v>y</v></list><empty/></root>");
}
