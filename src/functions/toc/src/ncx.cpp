#include "ncx.hpp"
#include "functions/xml/src/xml_helpers.hpp"
#include <stdexcept>

namespace epubkit {

using xml::ElementReader;
namespace ns = xml::ns;

namespace {

// ---- 읽기 ----
std::optional<int> read_int(const ElementReader& reader, pugi::xml_node element, const char* name) {
    auto value = reader.optional_attr(element, name);
    if (!value) return std::nullopt;
    try {
        std::size_t used = 0;
        int n = std::stoi(*value, &used);
        if (used != value->size()) throw std::invalid_argument(*value);
        return n;
    } catch (const std::logic_error&) {
        reader.fail(ReadError::Kind::MalformedDocument, name, element, "'" + *value + "' is not a number");
    }
}

NcxText read_text(const ElementReader& reader, pugi::xml_node parent) {
    pugi::xml_node element = reader.child(parent, "text", ns::kNcx);
    NcxText text;
    text.content = xml::trim(xml::text_content(element));
    text.identifier = reader.optional_attr(element, "id");
    text.clazz = reader.optional_attr(element, "class");
    return text;
}

std::vector<NcxLabel> read_labels(const ElementReader& reader, pugi::xml_node parent, bool required) {
    std::vector<NcxLabel> labels;
    for (pugi::xml_node c : reader.children(parent, "navLabel", ns::kNcx))
        labels.push_back(NcxLabel{read_text(reader, c), reader.language(c), reader.direction(c)});
    if (required && labels.empty()) reader.fail(ReadError::Kind::MissingElement, "navLabel", parent);
    return labels;
}

NcxContent read_content(const ElementReader& reader, pugi::xml_node parent) {
    pugi::xml_node element = reader.child(parent, "content", ns::kNcx);
    return NcxContent{reader.attr(element, "src"), reader.optional_attr(element, "id")};
}

NavPoint read_nav_point(const ElementReader& reader, pugi::xml_node element) {
    NavPoint point;
    point.identifier = reader.attr(element, "id");
    point.clazz = reader.optional_attr(element, "class");
    point.play_order = read_int(reader, element, "playOrder");
    point.labels = read_labels(reader, element, true);
    point.content = read_content(reader, element);
    for (pugi::xml_node c : reader.children(element, "navPoint", ns::kNcx))
        point.children.push_back(read_nav_point(reader, c));
    return point;
}

PageList read_page_list(const ElementReader& reader, pugi::xml_node element) {
    PageList list;
    list.identifier = reader.optional_attr(element, "id");
    list.clazz = reader.optional_attr(element, "class");
    list.labels = read_labels(reader, element, false);
    for (pugi::xml_node c : reader.children(element, "pageTarget", ns::kNcx)) {
        PageTarget target;
        target.identifier = reader.attr(c, "id");
        target.type = reader.attr(c, "type");
        target.value = read_int(reader, c, "value");
        target.clazz = reader.optional_attr(c, "class");
        target.play_order = read_int(reader, c, "playOrder");
        target.labels = read_labels(reader, c, false);
        target.content = read_content(reader, c);
        list.targets.push_back(std::move(target));
    }
    if (list.targets.empty()) reader.fail(ReadError::Kind::MissingElement, "pageTarget", element);
    return list;
}

// ---- 쓰기 ----
std::optional<std::string> direction_attr(const std::optional<ReadingDirection>& dir) {
    if (!dir) return std::nullopt;
    return std::string(to_string(*dir));
}

std::optional<std::string> int_attr(const std::optional<int>& n) {
    if (!n) return std::nullopt;
    return std::to_string(*n);
}

void write_text(pugi::xml_node parent, const NcxText& text) {
    pugi::xml_node e = xml::add_text_element(parent, "text", text.content);
    xml::set_attr(e, "id", text.identifier);
    xml::set_attr(e, "class", text.clazz);
}

void write_labels(pugi::xml_node parent, const std::vector<NcxLabel>& labels) {
    xml::add_children(parent, labels, [](pugi::xml_node p, const NcxLabel& label) {
        pugi::xml_node e = xml::add_element(p, "navLabel");
        xml::set_attr(e, "xml:lang", label.language);
        xml::set_attr(e, "dir", direction_attr(label.direction));
        write_text(e, label.text);
    });
}

void write_content(pugi::xml_node parent, const NcxContent& content) {
    pugi::xml_node e = xml::add_element(parent, "content");
    xml::set_attr(e, "src", content.source);
    xml::set_attr(e, "id", content.identifier);
}

void write_nav_point(pugi::xml_node parent, const NavPoint& point) {
    pugi::xml_node e = xml::add_element(parent, "navPoint");
    xml::set_attr(e, "id", point.identifier);
    xml::set_attr(e, "class", point.clazz);
    xml::set_attr(e, "playOrder", int_attr(point.play_order));
    write_labels(e, point.labels);
    write_content(e, point.content);
    for (const NavPoint& child : point.children) write_nav_point(e, child);
}

} // namespace

NcxDocument read_ncx(pugi::xml_node root, const std::string& document) {
    ElementReader reader(document);
    if (!xml::is_element(root, "ncx", ns::kNcx))
        throw ReadError(ReadError::Kind::MissingElement, document, "ncx", xml::absolute_path(root));

    NcxDocument ncx;
    ncx.version = reader.attr(root, "version");
    ncx.language = reader.language(root);
    ncx.direction = reader.direction(root);
    if (pugi::xml_node head = reader.optional_child(root, "head", ns::kNcx)) {
        for (pugi::xml_node m : reader.children(head, "meta", ns::kNcx))
            ncx.head.push_back(NcxMeta{reader.attr(m, "name"), reader.attr(m, "content"),
                                       reader.optional_attr(m, "scheme")});
    }
    ncx.title = read_text(reader, reader.child(root, "docTitle", ns::kNcx));
    for (pugi::xml_node a : reader.children(root, "docAuthor", ns::kNcx))
        ncx.authors.push_back(read_text(reader, a));

    pugi::xml_node map = reader.child(root, "navMap", ns::kNcx);
    ncx.nav_map.identifier = reader.optional_attr(map, "id");
    ncx.nav_map.labels = read_labels(reader, map, false);
    for (pugi::xml_node c : reader.children(map, "navPoint", ns::kNcx))
        ncx.nav_map.points.push_back(read_nav_point(reader, c));
    if (ncx.nav_map.points.empty()) reader.fail(ReadError::Kind::MissingElement, "navPoint", map);

    if (pugi::xml_node pages = reader.optional_child(root, "pageList", ns::kNcx))
        ncx.page_list = read_page_list(reader, pages);
    return ncx;
}

NcxDocument parse_ncx(const std::string& content, const std::string& document) {
    pugi::xml_document doc;
    xml::load_document(doc, content, document);
    return read_ncx(doc.document_element(), document);
}

void write_ncx(const NcxDocument& ncx, pugi::xml_document& doc) {
    xml::add_declaration(doc);
    pugi::xml_node root = xml::add_element(doc, "ncx");
    xml::set_attr(root, "xmlns", std::string(ns::kNcx));
    xml::set_attr(root, "version", ncx.version);
    xml::set_attr(root, "xml:lang", ncx.language);
    xml::set_attr(root, "dir", direction_attr(ncx.direction));

    pugi::xml_node head = xml::add_element(root, "head");
    for (const NcxMeta& m : ncx.head) {
        pugi::xml_node e = xml::add_element(head, "meta");
        xml::set_attr(e, "name", m.name);
        xml::set_attr(e, "content", m.content);
        xml::set_attr(e, "scheme", m.scheme);
    }

    write_text(xml::add_element(root, "docTitle"), ncx.title);
    for (const NcxText& author : ncx.authors) write_text(xml::add_element(root, "docAuthor"), author);

    pugi::xml_node map = xml::add_element(root, "navMap");
    xml::set_attr(map, "id", ncx.nav_map.identifier);
    write_labels(map, ncx.nav_map.labels);
    for (const NavPoint& p : ncx.nav_map.points) write_nav_point(map, p);

    if (ncx.page_list) {
        pugi::xml_node list = xml::add_element(root, "pageList");
        xml::set_attr(list, "id", ncx.page_list->identifier);
        xml::set_attr(list, "class", ncx.page_list->clazz);
        write_labels(list, ncx.page_list->labels);
        for (const PageTarget& t : ncx.page_list->targets) {
            pugi::xml_node e = xml::add_element(list, "pageTarget");
            xml::set_attr(e, "id", t.identifier);
            xml::set_attr(e, "type", t.type);
            xml::set_attr(e, "value", int_attr(t.value));
            xml::set_attr(e, "class", t.clazz);
            xml::set_attr(e, "playOrder", int_attr(t.play_order));
            write_labels(e, t.labels);
            write_content(e, t.content);
        }
    }
}

std::string ncx_to_string(const NcxDocument& ncx, int indent) {
    pugi::xml_document doc;
    write_ncx(ncx, doc);
    return xml::save_document(doc, indent);
}

} // namespace epubkit
