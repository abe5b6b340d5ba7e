#include "summary.hpp"

namespace epubkit {

namespace {

nlohmann::json contents_of(const std::vector<DublinCore>& elements) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : elements) out.push_back(e.content);
    return out;
}

nlohmann::json entry_to_json(const TocEntry& entry) {
    nlohmann::json j;
    j["title"] = entry.title;
    if (entry.path) j["path"] = *entry.path;
    if (entry.fragment) j["fragment"] = *entry.fragment;
    if (entry.item_id) j["item"] = *entry.item_id;
    if (!entry.children.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& c : entry.children) children.push_back(entry_to_json(c));
        j["children"] = children;
    }
    return j;
}

} // namespace

nlohmann::json summarize(const Epub& epub) {
    const PackageDocument& package = epub.package();
    nlohmann::json j;
    j["version"] = package.version().to_string();
    j["format"] = to_string(package.format());
    j["opf"] = epub.opf_file().path().to_string();
    j["unique_identifier"] = package.unique_identifier;
    j["identifiers"] = contents_of(package.metadata.identifiers);
    j["titles"] = contents_of(package.metadata.titles);
    j["languages"] = contents_of(package.metadata.languages);

    nlohmann::json creators = nlohmann::json::array();
    for (const auto& dc : package.metadata.dublin_core)
        if (dc.kind == DublinCoreKind::Creator) creators.push_back(dc.content);
    j["creators"] = creators;

    j["manifest_items"] = package.manifest.items.size();
    j["spine_items"] = package.spine.references.size();
    j["has_guide"] = package.guide.has_value();

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : epub.warnings()) warnings.push_back(w.what());
    j["warnings"] = warnings;
    return j;
}

nlohmann::json toc_to_json(const TableOfContents& toc) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : toc.entries) out.push_back(entry_to_json(e));
    return out;
}

std::string capability_flags(const Resource& resource) {
    Capabilities caps = kReadOnly;
    if (const File* f = std::get_if<File>(&resource)) caps = f->capabilities();
    else if (const Directory* d = std::get_if<Directory>(&resource)) caps = d->capabilities();
    std::string flags = "---";
    if (caps & kDeletable) flags[0] = 'D';
    if (caps & kModifiable) flags[1] = 'M';
    if (caps & kUnprotected) flags[2] = 'U';
    return flags;
}

} // namespace epubkit
