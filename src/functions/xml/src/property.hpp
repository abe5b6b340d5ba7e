#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace epubkit {

// [prefix ":"] reference. 파싱한 값은 원문 그대로 다시 직렬화된다
struct Property {
    std::optional<std::string> prefix;
    std::string reference;

    std::string to_string() const;
};

bool operator==(const Property& a, const Property& b);
bool operator!=(const Property& a, const Property& b);

class PropertyParseError : public std::runtime_error {
public:
    PropertyParseError(const std::string& value, std::size_t position, const std::string& reason);

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

bool is_ncname(const std::string& s);

Property parse_property(const std::string& value);
// 공백으로 구분된 목록
std::vector<Property> parse_properties(const std::string& value);
std::string to_string(const std::vector<Property>& properties);

// package/@prefix 의 "name: iri" 하나
struct PrefixMapping {
    std::string prefix;
    std::string iri;
};

std::vector<PrefixMapping> parse_prefixes(const std::string& value);
std::string to_string(const std::vector<PrefixMapping>& prefixes);

// a11y, dcterms, marc 등 선언 없이 쓸 수 있는 prefix
std::optional<std::string> reserved_prefix_iri(const std::string& prefix);

// 명시적 선언이 예약 prefix 보다 우선. 모르는 prefix 는 nullopt
std::optional<std::string> expand_property(const Property& property,
                                           const std::vector<PrefixMapping>& prefixes,
                                           const std::string& default_vocabulary = {});

} // namespace epubkit
