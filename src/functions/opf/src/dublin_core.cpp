#include "dublin_core.hpp"

namespace epubkit {

namespace {

struct KindName {
    DublinCoreKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {DublinCoreKind::Identifier, "identifier"},
    {DublinCoreKind::Title, "title"},
    {DublinCoreKind::Language, "language"},
    {DublinCoreKind::Contributor, "contributor"},
    {DublinCoreKind::Coverage, "coverage"},
    {DublinCoreKind::Creator, "creator"},
    {DublinCoreKind::Date, "date"},
    {DublinCoreKind::Description, "description"},
    {DublinCoreKind::Format, "format"},
    {DublinCoreKind::Publisher, "publisher"},
    {DublinCoreKind::Relation, "relation"},
    {DublinCoreKind::Rights, "rights"},
    {DublinCoreKind::Source, "source"},
    {DublinCoreKind::Subject, "subject"},
    {DublinCoreKind::Type, "type"},
};

} // namespace

const char* element_name(DublinCoreKind kind) {
    for (const auto& k : kKindNames)
        if (k.kind == kind) return k.name;
    return "identifier";
}

std::optional<DublinCoreKind> dublin_core_kind(const std::string& local_name) {
    for (const auto& k : kKindNames)
        if (local_name == k.name) return k.kind;
    return std::nullopt;
}

bool is_localized(DublinCoreKind kind) {
    switch (kind) {
        case DublinCoreKind::Title:
        case DublinCoreKind::Contributor:
        case DublinCoreKind::Creator:
        case DublinCoreKind::Coverage:
        case DublinCoreKind::Description:
        case DublinCoreKind::Publisher:
        case DublinCoreKind::Relation:
        case DublinCoreKind::Rights:
        case DublinCoreKind::Subject:
            return true;
        default:
            return false;
    }
}

DublinCore DublinCore::make(DublinCoreKind kind, std::string content) {
    DublinCore dc;
    dc.kind = kind;
    dc.content = std::move(content);
    return dc;
}

bool operator==(const DublinCore& a, const DublinCore& b) {
    return a.kind == b.kind && a.identifier == b.identifier && a.content == b.content &&
           a.direction == b.direction && a.language == b.language && a.role == b.role &&
           a.file_as == b.file_as && a.scheme == b.scheme && a.event == b.event;
}

bool operator!=(const DublinCore& a, const DublinCore& b) { return !(a == b); }

} // namespace epubkit
