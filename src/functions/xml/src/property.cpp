#include "property.hpp"
#include <cctype>

namespace epubkit {

std::string Property::to_string() const {
    return prefix ? *prefix + ":" + reference : reference;
}

bool operator==(const Property& a, const Property& b) {
    return a.prefix == b.prefix && a.reference == b.reference;
}

bool operator!=(const Property& a, const Property& b) { return !(a == b); }

PropertyParseError::PropertyParseError(const std::string& value, std::size_t position,
                                       const std::string& reason)
    : std::runtime_error("invalid property '" + value + "' at " + std::to_string(position) + ": " + reason),
      position_(position) {}

static bool is_name_start(unsigned char c) {
    // 비 ASCII 바이트는 UTF-8 이름 문자로 본다
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

static bool is_name_char(unsigned char c) {
    return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

bool is_ncname(const std::string& s) {
    if (s.empty() || !is_name_start(static_cast<unsigned char>(s[0]))) return false;
    for (unsigned char c : s)
        if (!is_name_char(c)) return false;
    return true;
}

Property parse_property(const std::string& value) {
    if (value.empty()) throw PropertyParseError(value, 0, "empty property");
    for (size_t i = 0; i < value.size(); ++i)
        if (std::isspace(static_cast<unsigned char>(value[i])))
            throw PropertyParseError(value, i, "whitespace inside property");

    auto colon = value.find(':');
    if (colon != std::string::npos) {
        std::string prefix = value.substr(0, colon);
        if (is_ncname(prefix)) {
            std::string reference = value.substr(colon + 1);
            if (reference.empty()) throw PropertyParseError(value, colon + 1, "empty reference");
            return Property{prefix, reference};
        }
    }
    // prefix 로 볼 수 없는 ':' 는 reference 의 일부
    return Property{std::nullopt, value};
}

std::vector<Property> parse_properties(const std::string& value) {
    std::vector<Property> out;
    size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        size_t j = i;
        while (j < value.size() && !std::isspace(static_cast<unsigned char>(value[j]))) ++j;
        if (j > i) out.push_back(parse_property(value.substr(i, j - i)));
        i = j;
    }
    return out;
}

std::string to_string(const std::vector<Property>& properties) {
    std::string out;
    for (const auto& p : properties) {
        if (!out.empty()) out.push_back(' ');
        out += p.to_string();
    }
    return out;
}

// ---- prefix ----
std::vector<PrefixMapping> parse_prefixes(const std::string& value) {
    std::vector<PrefixMapping> out;
    size_t i = 0;
    auto skip_space = [&] {
        while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i]))) ++i;
    };
    while (true) {
        skip_space();
        if (i >= value.size()) break;
        size_t colon = value.find(':', i);
        if (colon == std::string::npos) throw PropertyParseError(value, i, "expected 'prefix:'");
        std::string prefix = value.substr(i, colon - i);
        if (!is_ncname(prefix)) throw PropertyParseError(value, i, "invalid prefix name");
        i = colon + 1;
        if (i >= value.size() || !std::isspace(static_cast<unsigned char>(value[i])))
            throw PropertyParseError(value, i, "expected whitespace after ':'");
        skip_space();
        size_t start = i;
        while (i < value.size() && !std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        if (i == start) throw PropertyParseError(value, i, "missing IRI");
        out.push_back(PrefixMapping{prefix, value.substr(start, i - start)});
    }
    return out;
}

std::string to_string(const std::vector<PrefixMapping>& prefixes) {
    std::string out;
    for (const auto& p : prefixes) {
        if (!out.empty()) out.push_back(' ');
        out += p.prefix + ": " + p.iri;
    }
    return out;
}

std::optional<std::string> reserved_prefix_iri(const std::string& prefix) {
    struct Reserved { const char* prefix; const char* iri; };
    static const Reserved reserved[] = {
        {"a11y", "http://www.idpf.org/epub/vocab/package/a11y/#"},
        {"dcterms", "http://purl.org/dc/terms/"},
        {"epubsc", "http://idpf.org/epub/vocab/sc/#"},
        {"marc", "http://id.loc.gov/vocabulary/"},
        {"media", "http://www.idpf.org/epub/vocab/overlays/#"},
        {"onix", "http://www.editeur.org/ONIX/book/codelists/current.html#"},
        {"rendition", "http://www.idpf.org/vocab/rendition/#"},
        {"schema", "http://schema.org/"},
        {"xsd", "http://www.w3.org/2001/XMLSchema#"},
        {"msv", "http://www.idpf.org/epub/vocab/structure/magazine/#"},
        {"prism", "http://www.prismstandard.org/specifications/3.0/PRISM_CV_Spec_3.0.htm#"},
    };
    for (const auto& r : reserved)
        if (prefix == r.prefix) return std::string(r.iri);
    return std::nullopt;
}

std::optional<std::string> expand_property(const Property& property,
                                           const std::vector<PrefixMapping>& prefixes,
                                           const std::string& default_vocabulary) {
    if (!property.prefix) {
        if (default_vocabulary.empty()) return property.reference;
        return default_vocabulary + property.reference;
    }
    for (const auto& p : prefixes)
        if (p.prefix == *property.prefix) return p.iri + property.reference;
    if (auto iri = reserved_prefix_iri(*property.prefix)) return *iri + property.reference;
    return std::nullopt;
}

} // namespace epubkit
