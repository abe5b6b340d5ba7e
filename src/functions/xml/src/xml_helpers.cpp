#include "xml_helpers.hpp"
#include <cctype>
#include <cstring>
#include <sstream>

namespace epubkit {
namespace xml {

std::string local_name(const char* qualified_name) {
    const char* colon = std::strchr(qualified_name, ':');
    return colon ? std::string(colon + 1) : std::string(qualified_name);
}

std::string prefix_of(const char* qualified_name) {
    const char* colon = std::strchr(qualified_name, ':');
    return colon ? std::string(qualified_name, colon) : std::string();
}

std::string lookup_namespace(pugi::xml_node scope, const std::string& prefix) {
    if (prefix == "xml") return ns::kXml;
    std::string attribute = prefix.empty() ? "xmlns" : "xmlns:" + prefix;
    for (pugi::xml_node n = scope; n && n.type() == pugi::node_element; n = n.parent()) {
        pugi::xml_attribute a = n.attribute(attribute.c_str());
        if (a) return a.value();
    }
    return std::string();
}

std::string namespace_of(pugi::xml_node element) {
    return lookup_namespace(element, prefix_of(element.name()));
}

bool is_element(pugi::xml_node node, const char* name, const char* ns) {
    if (node.type() != pugi::node_element) return false;
    if (local_name(node.name()) != name) return false;
    if (ns == nullptr) return true;
    return namespace_of(node) == ns;
}

pugi::xml_node find_child(pugi::xml_node parent, const char* name, const char* ns) {
    for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling())
        if (is_element(c, name, ns)) return c;
    return pugi::xml_node();
}

std::vector<pugi::xml_node> find_children(pugi::xml_node parent, const char* name, const char* ns) {
    std::vector<pugi::xml_node> out;
    for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling())
        if (is_element(c, name, ns)) out.push_back(c);
    return out;
}

std::vector<pugi::xml_node> child_elements(pugi::xml_node parent) {
    std::vector<pugi::xml_node> out;
    for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling())
        if (c.type() == pugi::node_element) out.push_back(c);
    return out;
}

pugi::xml_attribute find_attribute(pugi::xml_node element, const char* name, const char* ns) {
    for (pugi::xml_attribute a = element.first_attribute(); a; a = a.next_attribute()) {
        std::string prefix = prefix_of(a.name());
        if (prefix == "xmlns" || local_name(a.name()) != name) continue;
        if (ns == nullptr) return a;
        if (*ns == '\0') {
            if (prefix.empty()) return a;
        } else if (!prefix.empty() && lookup_namespace(element, prefix) == ns) {
            return a;
        }
    }
    return pugi::xml_attribute();
}

std::string absolute_path(pugi::xml_node node) {
    std::string path;
    for (pugi::xml_node n = node; n && n.type() == pugi::node_element; n = n.parent()) {
        std::string step = n.name();
        int index = 0, count = 0;
        for (pugi::xml_node s = n.parent().first_child(); s; s = s.next_sibling()) {
            if (s.type() != pugi::node_element || std::strcmp(s.name(), n.name()) != 0) continue;
            ++count;
            if (s == n) index = count;
        }
        if (count > 1) step += "[" + std::to_string(index) + "]";
        path = "/" + step + path;
    }
    return path.empty() ? "/" : path;
}

std::optional<std::string> own_text(pugi::xml_node element) {
    std::optional<std::string> out;
    for (pugi::xml_node c = element.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_pcdata && c.type() != pugi::node_cdata) continue;
        if (!out) out.emplace();
        out->append(c.value());
    }
    return out;
}

static void collect_text(pugi::xml_node node, std::string& out) {
    if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
        out.append(node.value());
        return;
    }
    for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling()) collect_text(c, out);
}

std::string text_content(pugi::xml_node node) {
    std::string out;
    collect_text(node, out);
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// ---- ElementReader ----
ElementReader::ElementReader(std::string document) : document_(std::move(document)) {}

void ElementReader::fail(ReadError::Kind kind, const std::string& name, pugi::xml_node at,
                         const std::string& detail) const {
    throw ReadError(kind, document_, name, absolute_path(at), detail);
}

pugi::xml_node ElementReader::child(pugi::xml_node parent, const char* name, const char* ns) const {
    pugi::xml_node c = find_child(parent, name, ns);
    if (!c) fail(ReadError::Kind::MissingElement, name, parent);
    return c;
}

pugi::xml_node ElementReader::optional_child(pugi::xml_node parent, const char* name, const char* ns) const {
    return find_child(parent, name, ns);
}

std::vector<pugi::xml_node> ElementReader::children(pugi::xml_node parent, const char* name,
                                                    const char* ns) const {
    return find_children(parent, name, ns);
}

std::string ElementReader::attr(pugi::xml_node element, const char* name, const char* ns) const {
    pugi::xml_attribute a = find_attribute(element, name, ns);
    if (!a) fail(ReadError::Kind::MissingAttribute, name, element);
    return a.value();
}

std::optional<std::string> ElementReader::optional_attr(pugi::xml_node element, const char* name,
                                                        const char* ns) const {
    pugi::xml_attribute a = find_attribute(element, name, ns);
    if (!a) return std::nullopt;
    return std::string(a.value());
}

std::string ElementReader::text(pugi::xml_node element) const {
    auto t = own_text(element);
    if (!t) fail(ReadError::Kind::MissingText, element.name(), element);
    return *t;
}

std::vector<pugi::xml_node> ElementReader::children_wrapper(pugi::xml_node parent, const char* wrapper,
                                                            const char* child_name, const char* ns,
                                                            ReadError::Kind empty_kind) const {
    pugi::xml_node w = child(parent, wrapper, ns);
    std::vector<pugi::xml_node> items = find_children(w, child_name, ns);
    if (items.empty()) fail(empty_kind, child_name, w);
    return items;
}

std::optional<std::vector<pugi::xml_node>> ElementReader::optional_children_wrapper(
    pugi::xml_node parent, const char* wrapper, const char* child_name, const char* ns,
    ReadError::Kind empty_kind) const {
    pugi::xml_node w = find_child(parent, wrapper, ns);
    if (!w) return std::nullopt;
    std::vector<pugi::xml_node> items = find_children(w, child_name, ns);
    if (items.empty()) fail(empty_kind, child_name, w);
    return items;
}

std::optional<ReadingDirection> ElementReader::direction(pugi::xml_node element) const {
    auto value = optional_attr(element, "dir");
    if (!value) return std::nullopt;
    auto dir = parse_reading_direction(*value);
    if (!dir) fail(ReadError::Kind::UnknownReadingDirection, *value, element);
    return dir;
}

std::optional<std::string> ElementReader::language(pugi::xml_node element) const {
    return optional_attr(element, "lang", ns::kXml);
}

static bool is_token(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s)
        if (std::isspace(c) || std::iscntrl(c) || c == '/' || c == ';') return false;
    return true;
}

std::string ElementReader::media_type(pugi::xml_node element, const char* name) const {
    std::string value = attr(element, name);
    std::string essence = trim(value.substr(0, value.find(';')));
    auto slash = essence.find('/');
    if (slash == std::string::npos || !is_token(essence.substr(0, slash)) ||
        !is_token(essence.substr(slash + 1)))
        fail(ReadError::Kind::InvalidMediaType, value, element);
    return value;
}

// ---- 문서 ----
void load_document(pugi::xml_document& doc, const std::string& content, const std::string& document) {
    pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size());
    if (!result)
        throw ReadError(ReadError::Kind::MalformedDocument, document, {}, {},
                        std::string(result.description()) + " at offset " + std::to_string(result.offset));
    if (!doc.document_element())
        throw ReadError(ReadError::Kind::MalformedDocument, document, {}, {}, "no root element");
}

std::string save_document(const pugi::xml_document& doc, int indent) {
    std::ostringstream oss;
    if (indent <= 0) {
        doc.save(oss, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    } else {
        std::string spaces(static_cast<size_t>(indent), ' ');
        doc.save(oss, spaces.c_str(), pugi::format_indent | pugi::format_no_declaration, pugi::encoding_utf8);
    }
    return oss.str();
}

void add_declaration(pugi::xml_document& doc) {
    pugi::xml_node decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
}

// ---- 쓰기 ----
pugi::xml_node add_element(pugi::xml_node parent, const std::string& qualified_name) {
    return parent.append_child(qualified_name.c_str());
}

pugi::xml_node add_text_element(pugi::xml_node parent, const std::string& qualified_name,
                                const std::string& text) {
    pugi::xml_node node = add_element(parent, qualified_name);
    set_text(node, text);
    return node;
}

void set_attr(pugi::xml_node element, const std::string& qualified_name,
              const std::optional<std::string>& value) {
    if (!value) {
        element.remove_attribute(qualified_name.c_str());
        return;
    }
    pugi::xml_attribute a = element.attribute(qualified_name.c_str());
    if (!a) a = element.append_attribute(qualified_name.c_str());
    a.set_value(value->c_str());
}

void set_text(pugi::xml_node element, const std::string& text) {
    element.append_child(pugi::node_pcdata).set_value(text.c_str());
}

} // namespace xml
} // namespace epubkit
