#include "package_xml.hpp"
#include "functions/xml/src/xml_helpers.hpp"
#include <map>
#include <set>

namespace epubkit {

namespace ns = xml::ns;

namespace {

std::optional<std::string> direction_attr(const std::optional<ReadingDirection>& dir) {
    if (!dir) return std::nullopt;
    return std::string(to_string(*dir));
}

std::optional<std::string> properties_attr(const std::optional<std::vector<Property>>& props) {
    if (!props || props->empty()) return std::nullopt;
    return to_string(*props);
}

// 원문 XML 조각을 parent 아래에 붙인다
void append_raw(pugi::xml_node parent, const std::string& raw) {
    parent.append_buffer(raw.data(), raw.size(), pugi::parse_default, pugi::encoding_utf8);
}

class MetadataWriter {
public:
    MetadataWriter(const PackageDocument& package, const PackageWriteOptions& options, pugi::xml_node parent)
        : package_(package), options_(options), parent_(parent),
          epub3_(supports_epub3_features(package.format())) {
        for (const Opf3Meta* meta : package.metadata.opf3_metas()) {
            if (auto target = meta->refines_target()) refinements_[*target].push_back(meta);
            else top_level_.push_back(meta);
        }
        for (const Link& link : package.metadata.links) {
            if (auto target = link.refines_target()) link_refinements_[*target].push_back(&link);
            else top_links_.push_back(&link);
        }
    }

    void write() {
        const Metadata& m = package_.metadata;
        for (const auto* group : {&m.identifiers, &m.titles, &m.languages, &m.dublin_core})
            for (const DublinCore& dc : *group) write_dublin_core(dc);

        if (epub3_) {
            for (const Link* link : top_links_) write_link(*link);
            for (const Opf3Meta* meta : top_level_) write_meta(*meta);
            // 대상이 없는 refines 는 뒤에 모아 쓴다
            for (const auto& entry : refinements_)
                for (const Opf3Meta* meta : entry.second)
                    if (!written_.count(meta)) write_meta(*meta);
            for (const auto& entry : link_refinements_)
                for (const Link* link : entry.second)
                    if (!written_links_.count(link)) write_link(*link);
        }

        if (!(epub3_ && options_.omit_legacy))
            for (const Opf2Meta* meta : m.opf2_metas()) write_opf2_meta(*meta);

        for (const std::string& raw : m.foreign_elements) append_raw(parent_, raw);
    }

private:
    void write_refinements(const std::optional<std::string>& id) {
        if (!epub3_ || !id) return;
        auto links = link_refinements_.find(*id);
        if (links != link_refinements_.end())
            for (const Link* link : links->second)
                if (!written_links_.count(link)) write_link(*link);
        auto metas = refinements_.find(*id);
        if (metas != refinements_.end())
            for (const Opf3Meta* meta : metas->second)
                if (!written_.count(meta)) write_meta(*meta);
    }

    void write_dublin_core(const DublinCore& dc) {
        pugi::xml_node e = xml::add_text_element(parent_, std::string("dc:") + element_name(dc.kind), dc.content);
        xml::set_attr(e, "id", dc.identifier);
        if (is_localized(dc.kind)) {
            xml::set_attr(e, "dir", direction_attr(dc.direction));
            xml::set_attr(e, "xml:lang", dc.language);
        }
        if (!epub3_) {
            if (dc.role) xml::set_attr(e, "opf:role", dc.role->code());
            xml::set_attr(e, "opf:file-as", dc.file_as);
            xml::set_attr(e, "opf:scheme", dc.scheme);
            xml::set_attr(e, "opf:event", dc.event);
        }
        write_refinements(dc.identifier);
    }

    void write_meta(const Opf3Meta& meta) {
        written_.insert(&meta);
        pugi::xml_node e = xml::add_text_element(parent_, "meta", meta.value_string());
        xml::set_attr(e, "property", meta.property().to_string());
        if (meta.scheme()) xml::set_attr(e, "scheme", meta.scheme()->to_string());
        xml::set_attr(e, "id", meta.identifier);
        xml::set_attr(e, "refines", meta.refines);
        xml::set_attr(e, "dir", direction_attr(meta.direction));
        xml::set_attr(e, "xml:lang", meta.language);
        write_refinements(meta.identifier);
    }

    void write_link(const Link& link) {
        written_links_.insert(&link);
        pugi::xml_node e = xml::add_element(parent_, "link");
        xml::set_attr(e, "href", link.href);
        xml::set_attr(e, "rel", properties_attr(link.relation));
        xml::set_attr(e, "media-type", link.media_type);
        xml::set_attr(e, "id", link.identifier);
        xml::set_attr(e, "properties", properties_attr(link.properties));
        xml::set_attr(e, "refines", link.refines);
        write_refinements(link.identifier);
    }

    void write_opf2_meta(const Opf2Meta& meta) {
        pugi::xml_node e = xml::add_element(parent_, "meta");
        xml::set_attr(e, "charset", meta.charset);
        xml::set_attr(e, "content", meta.content);
        xml::set_attr(e, "http-equiv", meta.http_equiv);
        xml::set_attr(e, "name", meta.name);
        xml::set_attr(e, "scheme", meta.scheme);
        for (const XmlAttribute& a : meta.extra_attributes) xml::set_attr(e, a.qualified_name, a.value);
    }

    const PackageDocument& package_;
    const PackageWriteOptions& options_;
    pugi::xml_node parent_;
    bool epub3_;

    std::vector<const Opf3Meta*> top_level_;
    std::map<std::string, std::vector<const Opf3Meta*>> refinements_;
    std::vector<const Link*> top_links_;
    std::map<std::string, std::vector<const Link*>> link_refinements_;
    std::set<const Opf3Meta*> written_;
    std::set<const Link*> written_links_;
};

void write_manifest(pugi::xml_node root, const Manifest& manifest, bool epub3) {
    pugi::xml_node e = xml::add_element(root, "manifest");
    xml::set_attr(e, "id", manifest.identifier);
    xml::add_children(e, manifest.items, [&](pugi::xml_node parent, const ManifestItem& item) {
        pugi::xml_node c = xml::add_element(parent, "item");
        xml::set_attr(c, "id", item.identifier);
        xml::set_attr(c, "href", item.href);
        xml::set_attr(c, "media-type", item.media_type);
        xml::set_attr(c, "fallback", item.fallback);
        xml::set_attr(c, "media-overlay", item.media_overlay);
        if (epub3) xml::set_attr(c, "properties", properties_attr(item.properties));
    });
}

void write_spine(pugi::xml_node root, const Spine& spine, bool epub3) {
    pugi::xml_node e = xml::add_element(root, "spine");
    xml::set_attr(e, "id", spine.identifier);
    xml::set_attr(e, "toc", spine.toc);
    xml::set_attr(e, "page-progression-direction", direction_attr(spine.page_progression_direction));
    xml::add_children(e, spine.references, [&](pugi::xml_node parent, const ItemRef& ref) {
        pugi::xml_node c = xml::add_element(parent, "itemref");
        xml::set_attr(c, "idref", ref.idref);
        xml::set_attr(c, "id", ref.identifier);
        if (!ref.linear) xml::set_attr(c, "linear", std::string("no"));
        if (epub3) xml::set_attr(c, "properties", properties_attr(ref.properties));
    });
}

void write_guide(pugi::xml_node root, const Guide& guide) {
    pugi::xml_node e = xml::add_element(root, "guide");
    for (const auto& entry : guide.references()) {
        pugi::xml_node c = xml::add_element(e, "reference");
        xml::set_attr(c, "type", std::string(to_string(entry.second.type)));
        xml::set_attr(c, "href", entry.second.href);
        xml::set_attr(c, "title", entry.second.title);
    }
    for (const auto& entry : guide.custom_references()) {
        pugi::xml_node c = xml::add_element(e, "reference");
        xml::set_attr(c, "type", "other." + entry.second.type);
        xml::set_attr(c, "href", entry.second.href);
        xml::set_attr(c, "title", entry.second.title);
    }
}

void write_bindings(pugi::xml_node root, const Bindings& bindings) {
    xml::add_children_with_wrapper(root, "bindings", bindings.media_types,
                                   [](pugi::xml_node parent, const MediaTypeBinding& b) {
                                       pugi::xml_node c = xml::add_element(parent, "mediaType");
                                       xml::set_attr(c, "media-type", b.media_type);
                                       xml::set_attr(c, "handler", b.handler);
                                   });
}

void write_tours(pugi::xml_node root, const Tours& tours) {
    xml::add_children_with_wrapper(root, "tours", tours.tours, [](pugi::xml_node parent, const Tour& tour) {
        pugi::xml_node c = xml::add_element(parent, "tour");
        xml::set_attr(c, "id", tour.identifier);
        xml::set_attr(c, "title", tour.title);
        for (const TourSite& site : tour.sites) {
            pugi::xml_node s = xml::add_element(c, "site");
            xml::set_attr(s, "title", site.title);
            xml::set_attr(s, "href", site.href);
        }
    });
}

} // namespace

void write_package_document(const PackageDocument& package, pugi::xml_document& doc,
                            const PackageWriteOptions& options) {
    const bool epub3 = supports_epub3_features(package.format());

    xml::add_declaration(doc);
    pugi::xml_node root = xml::add_element(doc, "package");
    xml::set_attr(root, "xmlns", std::string(ns::kOpf));
    xml::set_attr(root, "version", package.version().to_string());
    xml::set_attr(root, "unique-identifier", package.unique_identifier);
    xml::set_attr(root, "dir", direction_attr(package.direction));
    xml::set_attr(root, "id", package.identifier);
    if (epub3 && !package.prefixes.empty()) xml::set_attr(root, "prefix", to_string(package.prefixes));
    xml::set_attr(root, "xml:lang", package.language);

    pugi::xml_node metadata = xml::add_element(root, "metadata");
    xml::set_attr(metadata, "xmlns:dc", std::string(ns::kDublinCore));
    xml::set_attr(metadata, "xmlns:opf", std::string(ns::kOpf));
    MetadataWriter(package, options, metadata).write();

    write_manifest(root, package.manifest, epub3);
    write_spine(root, package.spine, epub3);

    if (package.guide && !(epub3 && options.omit_legacy)) write_guide(root, *package.guide);
    if (epub3 && package.bindings) write_bindings(root, *package.bindings);
    if (!epub3 && package.tours) write_tours(root, *package.tours);
    if (epub3)
        for (const Collection& c : package.collections) append_raw(root, c.xml);
}

std::string package_document_to_string(const PackageDocument& package, const PackageWriteOptions& options) {
    pugi::xml_document doc;
    write_package_document(package, doc, options);
    return xml::save_document(doc, options.indent);
}

} // namespace epubkit
