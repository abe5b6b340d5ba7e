#include "container.hpp"
#include "functions/xml/src/xml_helpers.hpp"

namespace epubkit {

namespace ns = xml::ns;

const RootFile* MetaInfContainer::package_root_file() const {
    for (const auto& r : root_files)
        if (r.media_type == kOebpsPackageMediaType) return &r;
    return nullptr;
}

bool operator==(const RootFile& a, const RootFile& b) {
    return a.full_path == b.full_path && a.media_type == b.media_type;
}

bool operator==(const ContainerLink& a, const ContainerLink& b) {
    return a.href == b.href && a.relation == b.relation && a.media_type == b.media_type;
}

MetaInfContainer read_container(pugi::xml_node root) {
    xml::ElementReader reader(kContainerDocument);
    if (!xml::is_element(root, "container", ns::kContainer))
        throw ReadError(ReadError::Kind::MissingElement, kContainerDocument, "container", xml::absolute_path(root));

    MetaInfContainer container;
    container.version = reader.attr(root, "version");
    for (pugi::xml_node c : reader.children_wrapper(root, "rootfiles", "rootfile", ns::kContainer,
                                                    ReadError::Kind::EmptyRootFiles)) {
        container.root_files.push_back(RootFile{reader.attr(c, "full-path"), reader.media_type(c)});
    }
    if (auto links = reader.optional_children_wrapper(root, "links", "link", ns::kContainer,
                                                      ReadError::Kind::MissingElement)) {
        for (pugi::xml_node c : *links) {
            ContainerLink link;
            link.href = reader.attr(c, "href");
            link.relation = reader.optional_attr(c, "rel");
            if (xml::find_attribute(c, "mediaType")) link.media_type = reader.media_type(c, "mediaType");
            container.links.push_back(std::move(link));
        }
    }
    return container;
}

MetaInfContainer parse_container(const std::string& content) {
    pugi::xml_document doc;
    xml::load_document(doc, content, kContainerDocument);
    return read_container(doc.document_element());
}

void write_container(const MetaInfContainer& container, pugi::xml_document& doc) {
    xml::add_declaration(doc);
    pugi::xml_node root = xml::add_element(doc, "container");
    xml::set_attr(root, "version", container.version);
    xml::set_attr(root, "xmlns", std::string(ns::kContainer));

    xml::add_children_with_wrapper(root, "rootfiles", container.root_files,
                                   [](pugi::xml_node parent, const RootFile& r) {
                                       pugi::xml_node c = xml::add_element(parent, "rootfile");
                                       xml::set_attr(c, "full-path", r.full_path);
                                       xml::set_attr(c, "media-type", r.media_type);
                                   });
    if (!container.links.empty()) {
        xml::add_children_with_wrapper(root, "links", container.links,
                                       [](pugi::xml_node parent, const ContainerLink& l) {
                                           pugi::xml_node c = xml::add_element(parent, "link");
                                           xml::set_attr(c, "href", l.href);
                                           xml::set_attr(c, "rel", l.relation);
                                           xml::set_attr(c, "mediaType", l.media_type);
                                       });
    }
}

std::string container_to_string(const MetaInfContainer& container, int indent) {
    pugi::xml_document doc;
    write_container(container, doc);
    return xml::save_document(doc, indent);
}

} // namespace epubkit
