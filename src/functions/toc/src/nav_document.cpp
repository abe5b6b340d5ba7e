#include "nav_document.hpp"
#include "functions/xml/src/xml_helpers.hpp"
#include <sstream>

namespace epubkit {

using xml::ElementReader;
namespace ns = xml::ns;

NavigationType navigation_type_of(const std::string& epub_type) {
    std::istringstream in(epub_type);
    std::string token;
    while (in >> token) {
        if (token == "toc") return NavigationType::Toc;
        if (token == "page-list") return NavigationType::PageList;
        if (token == "landmarks") return NavigationType::Landmarks;
    }
    return NavigationType::Custom;
}

const char* to_string(NavigationType type) {
    switch (type) {
        case NavigationType::Toc:       return "toc";
        case NavigationType::PageList:  return "page-list";
        case NavigationType::Landmarks: return "landmarks";
        case NavigationType::Custom:    return "custom";
    }
    return "custom";
}

const Navigation* NavigationDocument::find(NavigationType type) const {
    for (const auto& n : navigations)
        if (n.type == type) return &n;
    return nullptr;
}

namespace {

bool is_heading(pugi::xml_node node) {
    std::string name = xml::local_name(node.name());
    return name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6';
}

std::vector<NavListItem> read_list(const ElementReader& reader, pugi::xml_node ol);

NavListItem read_item(const ElementReader& reader, pugi::xml_node li) {
    NavListItem item;
    pugi::xml_node content;
    for (pugi::xml_node c : xml::child_elements(li)) {
        std::string name = xml::local_name(c.name());
        if (name == "a" || name == "span") {
            content = c;
            break;
        }
    }
    if (!content) reader.fail(ReadError::Kind::MissingElement, "a", li);

    if (xml::local_name(content.name()) == "a") item.content.href = reader.attr(content, "href");
    item.content.text = xml::trim(xml::text_content(content));
    item.content.epub_type = reader.optional_attr(content, "type", ns::kOps);

    if (pugi::xml_node ol = xml::find_child(li, "ol", nullptr)) item.children = read_list(reader, ol);
    return item;
}

std::vector<NavListItem> read_list(const ElementReader& reader, pugi::xml_node ol) {
    std::vector<NavListItem> items;
    for (pugi::xml_node li : xml::find_children(ol, "li", nullptr)) items.push_back(read_item(reader, li));
    if (items.empty()) reader.fail(ReadError::Kind::MissingElement, "li", ol);
    return items;
}

Navigation read_navigation(const ElementReader& reader, pugi::xml_node nav) {
    Navigation navigation;
    navigation.epub_type = reader.optional_attr(nav, "type", ns::kOps).value_or("");
    navigation.type = navigation_type_of(navigation.epub_type);
    navigation.hidden = static_cast<bool>(xml::find_attribute(nav, "hidden"));
    for (pugi::xml_node c : xml::child_elements(nav)) {
        if (is_heading(c)) {
            navigation.heading = xml::trim(xml::text_content(c));
            break;
        }
    }
    pugi::xml_node ol = xml::find_child(nav, "ol", nullptr);
    if (!ol) reader.fail(ReadError::Kind::MissingElement, "ol", nav);
    navigation.items = read_list(reader, ol);
    return navigation;
}

// nav 는 body 아래 어디에나 올 수 있다
void collect_navs(pugi::xml_node parent, std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node c : xml::child_elements(parent)) {
        if (xml::is_element(c, "nav", nullptr)) out.push_back(c);
        else collect_navs(c, out);
    }
}

void write_list(pugi::xml_node parent, const std::vector<NavListItem>& items) {
    pugi::xml_node ol = xml::add_element(parent, "ol");
    for (const NavListItem& item : items) {
        pugi::xml_node li = xml::add_element(ol, "li");
        pugi::xml_node c = xml::add_text_element(li, item.content.href ? "a" : "span", item.content.text);
        if (item.content.epub_type) xml::set_attr(c, "epub:type", item.content.epub_type);
        xml::set_attr(c, "href", item.content.href);
        if (!item.children.empty()) write_list(li, item.children);
    }
}

} // namespace

NavigationDocument parse_nav_document(const std::string& content, const std::string& document) {
    ElementReader reader(document);
    pugi::xml_document doc;
    xml::load_document(doc, content, document);
    pugi::xml_node html = doc.document_element();
    if (!xml::is_element(html, "html", nullptr))
        throw ReadError(ReadError::Kind::MissingElement, document, "html", xml::absolute_path(html));

    NavigationDocument nav;
    if (pugi::xml_node head = xml::find_child(html, "head", nullptr))
        if (pugi::xml_node title = xml::find_child(head, "title", nullptr))
            nav.title = xml::trim(xml::text_content(title));

    pugi::xml_node body = reader.child(html, "body", nullptr);
    std::vector<pugi::xml_node> navs;
    collect_navs(body, navs);
    for (pugi::xml_node n : navs) nav.navigations.push_back(read_navigation(reader, n));
    if (!nav.find(NavigationType::Toc)) reader.fail(ReadError::Kind::MissingElement, "nav", body, "no toc nav");
    return nav;
}

std::string nav_document_to_string(const NavigationDocument& nav, int indent) {
    pugi::xml_document doc;
    xml::add_declaration(doc);
    doc.append_child(pugi::node_doctype).set_value("html");
    pugi::xml_node html = xml::add_element(doc, "html");
    xml::set_attr(html, "xmlns", std::string(ns::kXhtml));
    xml::set_attr(html, "xmlns:epub", std::string(ns::kOps));

    pugi::xml_node head = xml::add_element(html, "head");
    xml::add_text_element(head, "title", nav.title.value_or("Table of Contents"));

    pugi::xml_node body = xml::add_element(html, "body");
    for (const Navigation& n : nav.navigations) {
        pugi::xml_node e = xml::add_element(body, "nav");
        xml::set_attr(e, "epub:type", n.epub_type);
        if (n.hidden) xml::set_attr(e, "hidden", std::string("hidden"));
        if (n.heading) xml::add_text_element(e, "h1", *n.heading);
        write_list(e, n.items);
    }
    return xml::save_document(doc, indent);
}

} // namespace epubkit
