#pragma once
#include <pugixml.hpp>
#include <optional>
#include <string>
#include <vector>

#include "read_error.hpp"
#include "reading_direction.hpp"

namespace epubkit {
namespace xml {

namespace ns {
constexpr const char* kOpf = "http://www.idpf.org/2007/opf";
constexpr const char* kDublinCore = "http://purl.org/dc/elements/1.1/";
constexpr const char* kXml = "http://www.w3.org/XML/1998/namespace";
constexpr const char* kContainer = "urn:oasis:names:tc:opendocument:xmlns:container";
constexpr const char* kNcx = "http://www.daisy.org/z3986/2005/ncx/";
constexpr const char* kXhtml = "http://www.w3.org/1999/xhtml";
constexpr const char* kOps = "http://www.idpf.org/2007/ops";
}

std::string local_name(const char* qualified_name);
std::string prefix_of(const char* qualified_name);
// 조상 요소의 xmlns 선언에서 prefix 를 찾는다. 없으면 빈 문자열
std::string lookup_namespace(pugi::xml_node scope, const std::string& prefix);
std::string namespace_of(pugi::xml_node element);

// ns 가 nullptr 이면 네임스페이스 무시, "" 이면 네임스페이스 없음
bool is_element(pugi::xml_node node, const char* name, const char* ns);
pugi::xml_node find_child(pugi::xml_node parent, const char* name, const char* ns);
std::vector<pugi::xml_node> find_children(pugi::xml_node parent, const char* name, const char* ns);
std::vector<pugi::xml_node> child_elements(pugi::xml_node parent);
// ns 가 "" 이면 prefix 없는 속성
pugi::xml_attribute find_attribute(pugi::xml_node element, const char* name, const char* ns = "");

// "/package/manifest/item[2]" 처럼 에러 위치를 나타내는 절대 경로
std::string absolute_path(pugi::xml_node node);

// 직속 텍스트 노드만 이어 붙인 값. 텍스트 노드가 없으면 nullopt
std::optional<std::string> own_text(pugi::xml_node element);
// 하위 텍스트 전부
std::string text_content(pugi::xml_node node);
std::string trim(const std::string& s);

// 한 문서의 요소를 읽으면서 실패하면 문서 이름과 위치가 붙은 ReadError 를 던진다
class ElementReader {
public:
    explicit ElementReader(std::string document);

    const std::string& document() const { return document_; }

    pugi::xml_node child(pugi::xml_node parent, const char* name, const char* ns) const;
    pugi::xml_node optional_child(pugi::xml_node parent, const char* name, const char* ns) const;
    std::vector<pugi::xml_node> children(pugi::xml_node parent, const char* name, const char* ns) const;

    std::string attr(pugi::xml_node element, const char* name, const char* ns = "") const;
    std::optional<std::string> optional_attr(pugi::xml_node element, const char* name,
                                             const char* ns = "") const;

    // 직속 텍스트 (MissingText)
    std::string text(pugi::xml_node element) const;

    // <wrapper><child/>...</wrapper>. wrapper 가 없으면 MissingElement,
    // child 가 하나도 없으면 empty_kind
    std::vector<pugi::xml_node> children_wrapper(pugi::xml_node parent, const char* wrapper,
                                                 const char* child, const char* ns,
                                                 ReadError::Kind empty_kind) const;
    // wrapper 는 없어도 되지만 있으면 child 가 하나 이상 필요
    std::optional<std::vector<pugi::xml_node>> optional_children_wrapper(
        pugi::xml_node parent, const char* wrapper, const char* child, const char* ns,
        ReadError::Kind empty_kind) const;

    // dir 속성 (UnknownReadingDirection)
    std::optional<ReadingDirection> direction(pugi::xml_node element) const;
    // xml:lang
    std::optional<std::string> language(pugi::xml_node element) const;
    // "type/subtype" 형식 확인 (InvalidMediaType)
    std::string media_type(pugi::xml_node element, const char* name = "media-type") const;

    [[noreturn]] void fail(ReadError::Kind kind, const std::string& name, pugi::xml_node at,
                           const std::string& detail = {}) const;

private:
    std::string document_;
};

// 파싱 실패 시 ReadError(MalformedDocument)
void load_document(pugi::xml_document& doc, const std::string& content, const std::string& document);
// indent 가 0 이면 한 줄로
std::string save_document(const pugi::xml_document& doc, int indent);
void add_declaration(pugi::xml_document& doc);

// ---- 쓰기 ----
pugi::xml_node add_element(pugi::xml_node parent, const std::string& qualified_name);
pugi::xml_node add_text_element(pugi::xml_node parent, const std::string& qualified_name,
                                const std::string& text);
// nullopt 이면 속성 자체를 만들지 않는다 (기존 속성은 제거)
void set_attr(pugi::xml_node element, const std::string& qualified_name,
              const std::optional<std::string>& value);
void set_text(pugi::xml_node element, const std::string& text);

template <class T, class Writer>
void add_children(pugi::xml_node parent, const std::vector<T>& items, Writer write) {
    for (const auto& item : items) write(parent, item);
}

template <class T, class Writer>
pugi::xml_node add_children_with_wrapper(pugi::xml_node parent, const std::string& wrapper,
                                         const std::vector<T>& items, Writer write) {
    pugi::xml_node node = add_element(parent, wrapper);
    add_children(node, items, write);
    return node;
}

} // namespace xml
} // namespace epubkit
