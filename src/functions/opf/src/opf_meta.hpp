#pragma once
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "functions/xml/src/property.hpp"
#include "functions/xml/src/reading_direction.hpp"

namespace epubkit {

struct XmlAttribute {
    std::string qualified_name;
    std::string value;
};

bool operator==(const XmlAttribute& a, const XmlAttribute& b);

// <meta name=".." content=".."/> 형태. 모르는 속성도 그대로 보존
struct Opf2Meta {
    std::optional<std::string> charset;
    std::optional<std::string> content;
    std::optional<std::string> http_equiv;
    std::optional<std::string> name;
    std::optional<std::string> scheme;
    std::vector<XmlAttribute> extra_attributes;
};

bool operator==(const Opf2Meta& a, const Opf2Meta& b);

// scheme 값 변환기. decode 는 잘못된 값에 std::invalid_argument
struct MetaCodec {
    std::string name;
    std::function<std::any(const std::string&)> decode;
    std::function<std::string(const std::any&)> encode;
};

constexpr const char* kMarcRelatorsScheme = "http://id.loc.gov/vocabulary/relators";

// 확장된 scheme IRI → 변환기
class MetaSchemeRegistry {
public:
    // marc:relators → CreativeRole
    static std::shared_ptr<const MetaSchemeRegistry> standard();
    static MetaSchemeRegistry with_defaults();

    // 이미 있으면 std::invalid_argument
    void add(const std::string& scheme_iri, std::shared_ptr<const MetaCodec> codec);
    std::shared_ptr<const MetaCodec> find(const std::string& scheme_iri) const;
    std::shared_ptr<const MetaCodec> find(const Property& scheme,
                                          const std::vector<PrefixMapping>& prefixes) const;

private:
    std::map<std::string, std::shared_ptr<const MetaCodec>> codecs_;
};

// <meta property=".." scheme="..">value</meta> 형태
class Opf3Meta {
public:
    // scheme 이 registry 에 등록돼 있으면 std::invalid_argument (typed_meta 를 써야 한다)
    static Opf3Meta string_meta(const MetaSchemeRegistry& registry,
                                const std::vector<PrefixMapping>& prefixes, Property property,
                                std::string value, std::optional<Property> scheme = std::nullopt);
    static Opf3Meta typed_meta(std::shared_ptr<const MetaCodec> codec, Property property,
                               std::any value, Property scheme);
    // registry 로 디코딩. 실패하면 std::invalid_argument
    static Opf3Meta decode(const MetaSchemeRegistry& registry, const std::vector<PrefixMapping>& prefixes,
                           Property property, const std::string& text, std::optional<Property> scheme);

    const Property& property() const { return property_; }
    const std::optional<Property>& scheme() const { return scheme_; }
    bool is_typed() const { return codec_ != nullptr; }
    const MetaCodec* codec() const { return codec_.get(); }

    template <class T>
    const T* value_as() const { return std::any_cast<T>(&value_); }
    // 직렬화될 문자열 값
    std::string value_string() const;

    // "#id" 에서 '#' 뒤 부분. refines 가 없으면 nullopt
    std::optional<std::string> refines_target() const;

    std::optional<std::string> identifier;
    std::optional<std::string> refines;
    std::optional<ReadingDirection> direction;
    std::optional<std::string> language;

private:
    Opf3Meta(std::shared_ptr<const MetaCodec> codec, Property property, std::any value,
             std::optional<Property> scheme);

    std::shared_ptr<const MetaCodec> codec_;
    Property property_;
    std::any value_;
    std::optional<Property> scheme_;
};

bool operator==(const Opf3Meta& a, const Opf3Meta& b);

using MetaElement = std::variant<Opf2Meta, Opf3Meta>;

struct Link {
    std::string href;
    std::optional<std::vector<Property>> relation;
    std::optional<std::string> media_type;
    std::optional<std::string> identifier;
    std::optional<std::vector<Property>> properties;
    std::optional<std::string> refines;

    std::optional<std::string> refines_target() const;
};

bool operator==(const Link& a, const Link& b);

// "#id" → "id"
std::optional<std::string> fragment_of(const std::optional<std::string>& refines);

} // namespace epubkit
