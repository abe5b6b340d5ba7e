#include "package_document.hpp"

namespace epubkit {

std::vector<const Opf3Meta*> Metadata::opf3_metas() const {
    std::vector<const Opf3Meta*> out;
    for (const auto& m : metas)
        if (const Opf3Meta* meta = std::get_if<Opf3Meta>(&m)) out.push_back(meta);
    return out;
}

std::vector<const Opf2Meta*> Metadata::opf2_metas() const {
    std::vector<const Opf2Meta*> out;
    for (const auto& m : metas)
        if (const Opf2Meta* meta = std::get_if<Opf2Meta>(&m)) out.push_back(meta);
    return out;
}

bool ManifestItem::has_property(const std::string& reference) const {
    if (!properties) return false;
    for (const auto& p : *properties)
        if (!p.prefix && p.reference == reference) return true;
    return false;
}

const ManifestItem* Manifest::find(const std::string& id) const {
    for (const auto& item : items)
        if (item.identifier == id) return &item;
    return nullptr;
}

const ManifestItem* Manifest::find_by_property(const std::string& reference) const {
    for (const auto& item : items)
        if (item.has_property(reference)) return &item;
    return nullptr;
}

bool Manifest::remove(const std::string& id) {
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it->identifier == id) {
            items.erase(it);
            return true;
        }
    }
    return false;
}

void PackageDocument::set_version(const EpubVersion& version) {
    Format format = require_supported(version);
    version_ = version;
    format_ = format;
}

bool operator==(const ManifestItem& a, const ManifestItem& b) {
    return a.identifier == b.identifier && a.href == b.href && a.media_type == b.media_type &&
           a.fallback == b.fallback && a.media_overlay == b.media_overlay && a.properties == b.properties;
}

bool operator==(const ItemRef& a, const ItemRef& b) {
    return a.idref == b.idref && a.identifier == b.identifier && a.linear == b.linear &&
           a.properties == b.properties;
}

bool operator==(const MediaTypeBinding& a, const MediaTypeBinding& b) {
    return a.media_type == b.media_type && a.handler == b.handler;
}

bool operator==(const TourSite& a, const TourSite& b) { return a.href == b.href && a.title == b.title; }

bool operator==(const Tour& a, const Tour& b) {
    return a.identifier == b.identifier && a.title == b.title && a.sites == b.sites;
}

} // namespace epubkit
