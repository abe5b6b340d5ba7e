#include "package_xml.hpp"
#include "functions/logging/src/log.hpp"
#include "functions/xml/src/xml_helpers.hpp"
#include <sstream>
#include <stdexcept>

namespace epubkit {

using xml::ElementReader;
namespace ns = xml::ns;

namespace {

// 요소 하나를 XML 원문으로. 조상에 선언된 prefix 는 요소에 옮겨 적는다
std::string node_to_string(pugi::xml_node node) {
    pugi::xml_document copy;
    pugi::xml_node element = copy.append_copy(node);
    std::string prefix = xml::prefix_of(node.name());
    std::string declaration = "xmlns:" + prefix;
    if (!prefix.empty() && !element.attribute(declaration.c_str())) {
        std::string uri = xml::lookup_namespace(node, prefix);
        if (!uri.empty()) element.append_attribute(declaration.c_str()) = uri.c_str();
    }
    std::ostringstream oss;
    element.print(oss, "", pugi::format_raw, pugi::encoding_utf8);
    return oss.str();
}

Property read_property(const ElementReader& reader, pugi::xml_node element, const std::string& value) {
    try {
        return parse_property(value);
    } catch (const PropertyParseError& e) {
        reader.fail(ReadError::Kind::InvalidProperty, value, element, e.what());
    }
}

std::optional<std::vector<Property>> read_properties(const ElementReader& reader, pugi::xml_node element,
                                                     const char* name) {
    auto value = reader.optional_attr(element, name);
    if (!value) return std::nullopt;
    try {
        return parse_properties(*value);
    } catch (const PropertyParseError& e) {
        reader.fail(ReadError::Kind::InvalidProperty, *value, element, e.what());
    }
}

// ---- metadata ----
DublinCore read_dublin_core(const ElementReader& reader, pugi::xml_node element, DublinCoreKind kind) {
    DublinCore dc;
    dc.kind = kind;
    dc.identifier = reader.optional_attr(element, "id");
    dc.content = xml::trim(xml::text_content(element));
    if (is_localized(kind)) {
        dc.direction = reader.direction(element);
        dc.language = reader.language(element);
    }
    switch (kind) {
        case DublinCoreKind::Creator:
        case DublinCoreKind::Contributor:
            if (auto role = reader.optional_attr(element, "role", ns::kOpf)) dc.role = CreativeRole::create(*role);
            dc.file_as = reader.optional_attr(element, "file-as", ns::kOpf);
            break;
        case DublinCoreKind::Identifier:
            dc.scheme = reader.optional_attr(element, "scheme", ns::kOpf);
            break;
        case DublinCoreKind::Date:
            dc.event = reader.optional_attr(element, "event", ns::kOpf);
            break;
        default:
            break;
    }
    return dc;
}

// property 속성이 있고 직속 텍스트가 비어 있지 않으면 OPF3 형식
bool is_opf3_meta(pugi::xml_node element) {
    if (!xml::find_attribute(element, "property")) return false;
    auto text = xml::own_text(element);
    return text && !text->empty();
}

Opf3Meta read_opf3_meta(const ElementReader& reader, pugi::xml_node element,
                        const MetaSchemeRegistry& registry, const std::vector<PrefixMapping>& prefixes) {
    Property property = read_property(reader, element, reader.attr(element, "property"));
    std::optional<Property> scheme;
    if (auto s = reader.optional_attr(element, "scheme")) scheme = read_property(reader, element, *s);
    std::string value = xml::trim(*xml::own_text(element));

    try {
        Opf3Meta meta = Opf3Meta::decode(registry, prefixes, property, value, scheme);
        meta.identifier = reader.optional_attr(element, "id");
        meta.refines = reader.optional_attr(element, "refines");
        meta.direction = reader.direction(element);
        meta.language = reader.language(element);
        return meta;
    } catch (const std::invalid_argument& e) {
        reader.fail(ReadError::Kind::InvalidProperty, value, element, e.what());
    }
}

Opf2Meta read_opf2_meta(pugi::xml_node element) {
    Opf2Meta meta;
    for (pugi::xml_attribute a = element.first_attribute(); a; a = a.next_attribute()) {
        std::string name = a.name();
        if (name == "charset") meta.charset = a.value();
        else if (name == "content") meta.content = a.value();
        else if (name == "http-equiv") meta.http_equiv = a.value();
        else if (name == "name") meta.name = a.value();
        else if (name == "scheme") meta.scheme = a.value();
        else if (name != "xmlns" && name.compare(0, 6, "xmlns:") != 0)
            meta.extra_attributes.push_back(XmlAttribute{name, a.value()});
    }
    return meta;
}

Link read_link(const ElementReader& reader, pugi::xml_node element) {
    Link link;
    link.href = reader.attr(element, "href");
    link.relation = read_properties(reader, element, "rel");
    if (xml::find_attribute(element, "media-type")) link.media_type = reader.media_type(element);
    link.identifier = reader.optional_attr(element, "id");
    link.properties = read_properties(reader, element, "properties");
    link.refines = reader.optional_attr(element, "refines");
    return link;
}

void collect_metadata_elements(pugi::xml_node parent, std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node c : xml::child_elements(parent)) {
        // OPF 2.0 의 dc-metadata / x-metadata 묶음
        if (xml::is_element(c, "dc-metadata", ns::kOpf) || xml::is_element(c, "x-metadata", ns::kOpf))
            collect_metadata_elements(c, out);
        else
            out.push_back(c);
    }
}

Metadata read_metadata(const ElementReader& reader, pugi::xml_node root, const MetaSchemeRegistry& registry,
                       const std::vector<PrefixMapping>& prefixes) {
    pugi::xml_node element = reader.child(root, "metadata", ns::kOpf);
    std::vector<pugi::xml_node> children;
    collect_metadata_elements(element, children);

    Metadata metadata;
    for (pugi::xml_node c : children) {
        std::string uri = xml::namespace_of(c);
        std::string local = xml::local_name(c.name());
        if (uri == ns::kDublinCore) {
            auto kind = dublin_core_kind(local);
            if (!kind) reader.fail(ReadError::Kind::UnknownDublinCoreElement, local, c);
            DublinCore dc = read_dublin_core(reader, c, *kind);
            switch (*kind) {
                case DublinCoreKind::Identifier: metadata.identifiers.push_back(std::move(dc)); break;
                case DublinCoreKind::Title:      metadata.titles.push_back(std::move(dc)); break;
                case DublinCoreKind::Language:   metadata.languages.push_back(std::move(dc)); break;
                default:                         metadata.dublin_core.push_back(std::move(dc)); break;
            }
        } else if (uri == ns::kOpf && local == "meta") {
            if (is_opf3_meta(c)) metadata.metas.emplace_back(read_opf3_meta(reader, c, registry, prefixes));
            else metadata.metas.emplace_back(read_opf2_meta(c));
        } else if (uri == ns::kOpf && local == "link") {
            metadata.links.push_back(read_link(reader, c));
        } else {
            log_debug("keeping foreign metadata element '" + std::string(c.name()) + "'");
            metadata.foreign_elements.push_back(node_to_string(c));
        }
    }

    if (metadata.identifiers.empty()) reader.fail(ReadError::Kind::MissingIdentifier, "identifier", element);
    if (metadata.titles.empty()) reader.fail(ReadError::Kind::MissingTitle, "title", element);
    if (metadata.languages.empty()) reader.fail(ReadError::Kind::MissingLanguage, "language", element);
    return metadata;
}

// ---- manifest / spine ----
Manifest read_manifest(const ElementReader& reader, pugi::xml_node root) {
    pugi::xml_node element = reader.child(root, "manifest", ns::kOpf);
    std::vector<pugi::xml_node> items = reader.children(element, "item", ns::kOpf);
    if (items.empty()) reader.fail(ReadError::Kind::NoItemElements, "item", element);

    Manifest manifest;
    manifest.identifier = reader.optional_attr(element, "id");
    for (pugi::xml_node c : items) {
        ManifestItem item;
        item.identifier = reader.attr(c, "id");
        item.href = reader.attr(c, "href");
        item.media_type = reader.media_type(c);
        item.fallback = reader.optional_attr(c, "fallback");
        item.media_overlay = reader.optional_attr(c, "media-overlay");
        item.properties = read_properties(reader, c, "properties");
        manifest.items.push_back(std::move(item));
    }
    return manifest;
}

bool read_linear(const ElementReader& reader, pugi::xml_node element) {
    auto value = reader.optional_attr(element, "linear");
    if (!value) return true;
    if (*value == "yes") return true;
    if (*value == "no") return false;
    reader.fail(ReadError::Kind::InvalidLinearValue, *value, element);
}

Spine read_spine(const ElementReader& reader, pugi::xml_node root) {
    pugi::xml_node element = reader.child(root, "spine", ns::kOpf);
    std::vector<pugi::xml_node> refs = reader.children(element, "itemref", ns::kOpf);
    if (refs.empty()) reader.fail(ReadError::Kind::NoItemRefElements, "itemref", element);

    Spine spine;
    spine.identifier = reader.optional_attr(element, "id");
    spine.toc = reader.optional_attr(element, "toc");
    if (auto dir = reader.optional_attr(element, "page-progression-direction")) {
        spine.page_progression_direction = parse_reading_direction(*dir);
        if (!spine.page_progression_direction)
            reader.fail(ReadError::Kind::UnknownReadingDirection, *dir, element);
    }
    for (pugi::xml_node c : refs) {
        ItemRef ref;
        ref.idref = reader.attr(c, "idref");
        ref.identifier = reader.optional_attr(c, "id");
        ref.linear = read_linear(reader, c);
        ref.properties = read_properties(reader, c, "properties");
        spine.references.push_back(std::move(ref));
    }
    return spine;
}

// ---- 선택 요소 ----
Guide read_guide(const ElementReader& reader, pugi::xml_node element) {
    Guide guide;
    for (pugi::xml_node c : reader.children(element, "reference", ns::kOpf)) {
        std::string type = reader.attr(c, "type");
        std::string href = reader.attr(c, "href");
        auto title = reader.optional_attr(c, "title");
        if (type.compare(0, 6, "other.") == 0 || type.compare(0, 6, "OTHER.") == 0) {
            std::string custom = type.substr(6);
            if (custom.empty()) reader.fail(ReadError::Kind::MissingAttribute, "type", c, "empty custom guide type");
            if (auto known = parse_reference_type(custom)) {
                log_info("guide type '" + type + "' names a standard type; reading it as '" + custom + "'");
                guide.add_reference(GuideReference{*known, href, title});
            } else {
                guide.add_custom_reference(CustomGuideReference{custom, href, title});
            }
        } else if (auto known = parse_reference_type(type)) {
            guide.add_reference(GuideReference{*known, href, title});
        } else {
            log_info("fixing unknown guide type '" + type + "' to 'other." + type + "'");
            guide.add_custom_reference(CustomGuideReference{type, href, title});
        }
    }
    return guide;
}

Bindings read_bindings(const ElementReader& reader, pugi::xml_node root) {
    Bindings bindings;
    auto items = reader.optional_children_wrapper(root, "bindings", "mediaType", ns::kOpf,
                                                  ReadError::Kind::NoMediaTypeElements);
    for (pugi::xml_node c : *items)
        bindings.media_types.push_back(MediaTypeBinding{reader.media_type(c), reader.attr(c, "handler")});
    return bindings;
}

Tours read_tours(const ElementReader& reader, pugi::xml_node element) {
    Tours tours;
    std::vector<pugi::xml_node> items = reader.children(element, "tour", ns::kOpf);
    if (items.empty()) reader.fail(ReadError::Kind::MissingElement, "tour", element);
    for (pugi::xml_node c : items) {
        Tour tour;
        tour.identifier = reader.attr(c, "id");
        tour.title = reader.attr(c, "title");
        std::vector<pugi::xml_node> sites = reader.children(c, "site", ns::kOpf);
        if (sites.empty()) reader.fail(ReadError::Kind::NoTourSiteElements, "site", c);
        for (pugi::xml_node s : sites)
            tour.sites.push_back(TourSite{reader.attr(s, "href"), reader.attr(s, "title")});
        tours.tours.push_back(std::move(tour));
    }
    return tours;
}

template <class Fn>
void read_optional(const char* what, std::vector<ReadError>& warnings, Fn read) {
    try {
        read();
    } catch (const ReadError& e) {
        log_warn(std::string("ignoring invalid ") + what + ": " + e.what());
        warnings.push_back(e);
    }
}

} // namespace

PackageDocument read_package_document(pugi::xml_node root, const std::string& document,
                                      const PackageReadOptions& options, std::vector<ReadError>& warnings) {
    ElementReader reader(document);
    if (!xml::is_element(root, "package", ns::kOpf))
        throw ReadError(ReadError::Kind::MissingElement, document, "package", xml::absolute_path(root));

    PackageDocument package;
    std::string version = reader.attr(root, "version");
    try {
        package.set_version(parse_version(version));
    } catch (const VersionError& e) {
        if (e.kind() != VersionError::Kind::Blank && e.kind() != VersionError::Kind::Malformed) throw;
        reader.fail(ReadError::Kind::InvalidVersion, version, root, e.what());
    }

    package.unique_identifier = reader.attr(root, "unique-identifier");
    package.identifier = reader.optional_attr(root, "id");
    package.direction = reader.direction(root);
    package.language = reader.language(root);
    if (auto prefix = reader.optional_attr(root, "prefix")) {
        try {
            package.prefixes = parse_prefixes(*prefix);
        } catch (const PropertyParseError& e) {
            reader.fail(ReadError::Kind::InvalidProperty, *prefix, root, e.what());
        }
    }

    const MetaSchemeRegistry& registry = options.registry ? *options.registry : *MetaSchemeRegistry::standard();
    package.metadata = read_metadata(reader, root, registry, package.prefixes);
    package.manifest = read_manifest(reader, root);
    package.spine = read_spine(reader, root);

    if (pugi::xml_node g = reader.optional_child(root, "guide", ns::kOpf))
        read_optional("guide", warnings, [&] { package.guide = read_guide(reader, g); });
    if (reader.optional_child(root, "bindings", ns::kOpf))
        read_optional("bindings", warnings, [&] { package.bindings = read_bindings(reader, root); });
    if (pugi::xml_node t = reader.optional_child(root, "tours", ns::kOpf))
        read_optional("tours", warnings, [&] { package.tours = read_tours(reader, t); });
    for (pugi::xml_node c : reader.children(root, "collection", ns::kOpf))
        package.collections.push_back(Collection{node_to_string(c)});

    return package;
}

PackageDocument parse_package_document(const std::string& content, const std::string& document,
                                       const PackageReadOptions& options, std::vector<ReadError>& warnings) {
    pugi::xml_document doc;
    xml::load_document(doc, content, document);
    return read_package_document(doc.document_element(), document, options, warnings);
}

} // namespace epubkit
