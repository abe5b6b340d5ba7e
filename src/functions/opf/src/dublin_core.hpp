#pragma once
#include <optional>
#include <string>

#include "creative_role.hpp"
#include "functions/xml/src/reading_direction.hpp"

namespace epubkit {

enum class DublinCoreKind {
    Identifier,
    Title,
    Language,
    Contributor,
    Coverage,
    Creator,
    Date,
    Description,
    Format,
    Publisher,
    Relation,
    Rights,
    Source,
    Subject,
    Type,
};

// "identifier", "title" ... (dc: 없이)
const char* element_name(DublinCoreKind kind);
std::optional<DublinCoreKind> dublin_core_kind(const std::string& local_name);
// dir, xml:lang 을 갖는 요소
bool is_localized(DublinCoreKind kind);

// dc:* 요소 하나. kind 에 해당하지 않는 필드는 읽지도 쓰지도 않는다
struct DublinCore {
    DublinCoreKind kind = DublinCoreKind::Identifier;
    std::optional<std::string> identifier;
    std::string content;

    // localized
    std::optional<ReadingDirection> direction;
    std::optional<std::string> language;

    // EPUB 2 전용 opf:* 속성
    std::optional<CreativeRole> role;     // creator, contributor
    std::optional<std::string> file_as;   // creator, contributor
    std::optional<std::string> scheme;    // identifier
    std::optional<std::string> event;     // date

    static DublinCore make(DublinCoreKind kind, std::string content);
};

bool operator==(const DublinCore& a, const DublinCore& b);
bool operator!=(const DublinCore& a, const DublinCore& b);

} // namespace epubkit
