#include "opf_meta.hpp"
#include "creative_role.hpp"
#include <stdexcept>

namespace epubkit {

bool operator==(const XmlAttribute& a, const XmlAttribute& b) {
    return a.qualified_name == b.qualified_name && a.value == b.value;
}

bool operator==(const Opf2Meta& a, const Opf2Meta& b) {
    return a.charset == b.charset && a.content == b.content && a.http_equiv == b.http_equiv &&
           a.name == b.name && a.scheme == b.scheme && a.extra_attributes == b.extra_attributes;
}

// ---- registry ----
static std::shared_ptr<const MetaCodec> creative_role_codec() {
    auto codec = std::make_shared<MetaCodec>();
    codec->name = "creative-role";
    codec->decode = [](const std::string& text) -> std::any {
        if (text.empty()) throw std::invalid_argument("empty relator code");
        return CreativeRole::create(text);
    };
    codec->encode = [](const std::any& value) {
        return std::any_cast<const CreativeRole&>(value).code();
    };
    return codec;
}

MetaSchemeRegistry MetaSchemeRegistry::with_defaults() {
    MetaSchemeRegistry registry;
    registry.add(kMarcRelatorsScheme, creative_role_codec());
    return registry;
}

std::shared_ptr<const MetaSchemeRegistry> MetaSchemeRegistry::standard() {
    static const std::shared_ptr<const MetaSchemeRegistry> registry =
        std::make_shared<const MetaSchemeRegistry>(with_defaults());
    return registry;
}

void MetaSchemeRegistry::add(const std::string& scheme_iri, std::shared_ptr<const MetaCodec> codec) {
    if (!codec) throw std::invalid_argument("null codec for scheme " + scheme_iri);
    if (!codecs_.emplace(scheme_iri, std::move(codec)).second)
        throw std::invalid_argument("a codec for scheme '" + scheme_iri + "' is already registered");
}

std::shared_ptr<const MetaCodec> MetaSchemeRegistry::find(const std::string& scheme_iri) const {
    auto it = codecs_.find(scheme_iri);
    return it == codecs_.end() ? nullptr : it->second;
}

std::shared_ptr<const MetaCodec> MetaSchemeRegistry::find(const Property& scheme,
                                                          const std::vector<PrefixMapping>& prefixes) const {
    auto iri = expand_property(scheme, prefixes);
    if (!iri) return nullptr;
    return find(*iri);
}

// ---- Opf3Meta ----
Opf3Meta::Opf3Meta(std::shared_ptr<const MetaCodec> codec, Property property, std::any value,
                   std::optional<Property> scheme)
    : codec_(std::move(codec)), property_(std::move(property)), value_(std::move(value)),
      scheme_(std::move(scheme)) {}

Opf3Meta Opf3Meta::string_meta(const MetaSchemeRegistry& registry, const std::vector<PrefixMapping>& prefixes,
                               Property property, std::string value, std::optional<Property> scheme) {
    if (scheme && registry.find(*scheme, prefixes))
        throw std::invalid_argument("scheme '" + scheme->to_string() +
                                    "' has a registered value type; use a typed meta");
    return Opf3Meta(nullptr, std::move(property), std::any(std::move(value)), std::move(scheme));
}

Opf3Meta Opf3Meta::typed_meta(std::shared_ptr<const MetaCodec> codec, Property property, std::any value,
                              Property scheme) {
    if (!codec) throw std::invalid_argument("typed meta needs a codec");
    return Opf3Meta(std::move(codec), std::move(property), std::move(value), std::move(scheme));
}

Opf3Meta Opf3Meta::decode(const MetaSchemeRegistry& registry, const std::vector<PrefixMapping>& prefixes,
                          Property property, const std::string& text, std::optional<Property> scheme) {
    if (scheme) {
        if (auto codec = registry.find(*scheme, prefixes)) {
            std::any value = codec->decode(text);
            return typed_meta(std::move(codec), std::move(property), std::move(value), std::move(*scheme));
        }
    }
    return string_meta(registry, prefixes, std::move(property), text, std::move(scheme));
}

std::string Opf3Meta::value_string() const {
    if (codec_) return codec_->encode(value_);
    return std::any_cast<const std::string&>(value_);
}

std::optional<std::string> Opf3Meta::refines_target() const { return fragment_of(refines); }

bool operator==(const Opf3Meta& a, const Opf3Meta& b) {
    return a.property() == b.property() && a.scheme() == b.scheme() &&
           a.value_string() == b.value_string() && a.identifier == b.identifier &&
           a.refines == b.refines && a.direction == b.direction && a.language == b.language;
}

// ---- Link ----
std::optional<std::string> Link::refines_target() const { return fragment_of(refines); }

bool operator==(const Link& a, const Link& b) {
    return a.href == b.href && a.relation == b.relation && a.media_type == b.media_type &&
           a.identifier == b.identifier && a.properties == b.properties && a.refines == b.refines;
}

std::optional<std::string> fragment_of(const std::optional<std::string>& refines) {
    if (!refines) return std::nullopt;
    auto hash = refines->find('#');
    if (hash == std::string::npos) return *refines;
    return refines->substr(hash + 1);
}

} // namespace epubkit
