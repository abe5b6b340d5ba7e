#pragma once
#include <optional>
#include <string>
#include <vector>

#include "dublin_core.hpp"
#include "functions/version/src/epub_version.hpp"
#include "functions/xml/src/property.hpp"
#include "functions/xml/src/reading_direction.hpp"
#include "guide.hpp"
#include "opf_meta.hpp"

namespace epubkit {

// identifiers / titles / languages 는 읽을 때 최소 하나씩 보장된다
struct Metadata {
    std::vector<DublinCore> identifiers;
    std::vector<DublinCore> titles;
    std::vector<DublinCore> languages;
    // 나머지 dc:* 요소, 문서 순서
    std::vector<DublinCore> dublin_core;
    std::vector<MetaElement> metas;
    std::vector<Link> links;
    // 다른 네임스페이스 요소 (예: calibre:*), XML 원문
    std::vector<std::string> foreign_elements;

    std::vector<const Opf3Meta*> opf3_metas() const;
    std::vector<const Opf2Meta*> opf2_metas() const;
};

struct ManifestItem {
    std::string identifier;
    std::string href;
    std::string media_type;
    std::optional<std::string> fallback;
    std::optional<std::string> media_overlay;
    std::optional<std::vector<Property>> properties;

    bool has_property(const std::string& reference) const;
};

struct Manifest {
    std::optional<std::string> identifier;
    std::vector<ManifestItem> items;

    const ManifestItem* find(const std::string& identifier) const;
    // properties 에 reference 가 들어 있는 첫 항목 (예: "nav")
    const ManifestItem* find_by_property(const std::string& reference) const;
    bool remove(const std::string& identifier);
};

struct ItemRef {
    std::string idref;
    std::optional<std::string> identifier;
    bool linear = true;
    std::optional<std::vector<Property>> properties;
};

struct Spine {
    std::optional<std::string> identifier;
    std::optional<ReadingDirection> page_progression_direction;
    // EPUB 2 NCX 의 manifest id
    std::optional<std::string> toc;
    std::vector<ItemRef> references;
};

struct MediaTypeBinding {
    std::string media_type;
    std::string handler;
};

struct Bindings {
    std::vector<MediaTypeBinding> media_types;
};

struct TourSite {
    std::string href;
    std::string title;
};

struct Tour {
    std::string identifier;
    std::string title;
    std::vector<TourSite> sites;
};

struct Tours {
    std::vector<Tour> tours;
};

// 해석하지 않고 XML 원문으로 보존
struct Collection {
    std::string xml;
};

class PackageDocument {
public:
    const EpubVersion& version() const { return version_; }
    Format format() const { return format_; }
    // 3.1 이나 지원하지 않는 버전이면 VersionError 를 던지고 기존 값을 유지
    void set_version(const EpubVersion& version);

    std::string unique_identifier;
    std::optional<std::string> identifier;
    std::optional<ReadingDirection> direction;
    std::optional<std::string> language;
    std::vector<PrefixMapping> prefixes;

    Metadata metadata;
    Manifest manifest;
    Spine spine;
    std::optional<Guide> guide;
    std::optional<Bindings> bindings;
    std::optional<Tours> tours;
    std::vector<Collection> collections;

private:
    EpubVersion version_{3, 0, 0};
    Format format_ = Format::Epub3_0;
};

bool operator==(const ManifestItem& a, const ManifestItem& b);
bool operator==(const ItemRef& a, const ItemRef& b);
bool operator==(const MediaTypeBinding& a, const MediaTypeBinding& b);
bool operator==(const TourSite& a, const TourSite& b);
bool operator==(const Tour& a, const Tour& b);

} // namespace epubkit
