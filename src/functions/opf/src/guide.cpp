#include "guide.hpp"
#include "functions/logging/src/log.hpp"
#include <algorithm>
#include <cctype>

namespace epubkit {

namespace {

struct TypeName {
    ReferenceType type;
    const char* name;
};

const TypeName kTypeNames[] = {
    {ReferenceType::Cover, "cover"},
    {ReferenceType::TitlePage, "title-page"},
    {ReferenceType::TableOfContents, "toc"},
    {ReferenceType::Index, "index"},
    {ReferenceType::Glossary, "glossary"},
    {ReferenceType::Acknowledgements, "acknowledgements"},
    {ReferenceType::Bibliography, "bibliography"},
    {ReferenceType::Colophon, "colophon"},
    {ReferenceType::CopyrightPage, "copyright-page"},
    {ReferenceType::Dedication, "dedication"},
    {ReferenceType::Epigraph, "epigraph"},
    {ReferenceType::Foreword, "foreword"},
    {ReferenceType::ListOfIllustrations, "loi"},
    {ReferenceType::ListOfTables, "lot"},
    {ReferenceType::Notes, "notes"},
    {ReferenceType::Preface, "preface"},
    {ReferenceType::Text, "text"},
};

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* to_string(ReferenceType type) {
    for (const auto& t : kTypeNames)
        if (t.type == type) return t.name;
    return "text";
}

std::optional<ReferenceType> parse_reference_type(const std::string& value) {
    std::string v = lower(value);
    for (const auto& t : kTypeNames)
        if (v == t.name) return t.type;
    return std::nullopt;
}

bool operator==(const GuideReference& a, const GuideReference& b) {
    return a.type == b.type && a.href == b.href && a.title == b.title;
}

bool operator==(const CustomGuideReference& a, const CustomGuideReference& b) {
    return a.type == b.type && a.href == b.href && a.title == b.title;
}

// ---- corrector ----
CorrectionAlreadyExists::CorrectionAlreadyExists(const std::string& custom_type)
    : std::runtime_error("a correction for the custom type '" + custom_type + "' already exists") {}

std::map<std::string, ReferenceType> GuideReferenceCorrector::default_corrections() {
    return {{"copyright", ReferenceType::CopyrightPage}};
}

GuideReferenceCorrector::GuideReferenceCorrector(std::map<std::string, ReferenceType> corrections)
    : corrections_(std::move(corrections)) {}

void GuideReferenceCorrector::add_correction(const std::string& custom_type, ReferenceType type) {
    if (!corrections_.emplace(custom_type, type).second) throw CorrectionAlreadyExists(custom_type);
}

ReferenceType GuideReferenceCorrector::get_correction(const std::string& custom_type) const {
    auto it = corrections_.find(custom_type);
    if (it == corrections_.end())
        throw std::out_of_range("no correction exists for type '" + custom_type + "'");
    return it->second;
}

std::optional<ReferenceType> GuideReferenceCorrector::get_correction_or_null(const std::string& custom_type) const {
    auto it = corrections_.find(custom_type);
    if (it == corrections_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> GuideReferenceCorrector::get_corrections_for(ReferenceType type) const {
    std::vector<std::string> out;
    for (const auto& kv : corrections_)
        if (kv.second == type) out.push_back(kv.first);
    return out;
}

bool GuideReferenceCorrector::has_correction(const std::string& custom_type) const {
    return corrections_.count(custom_type) != 0;
}

// ---- guide ----
void Guide::add_reference(GuideReference reference) {
    ReferenceType type = reference.type;
    references_[type] = std::move(reference);
}

bool Guide::remove_reference(ReferenceType type) { return references_.erase(type) != 0; }

const GuideReference* Guide::find(ReferenceType type) const {
    auto it = references_.find(type);
    return it == references_.end() ? nullptr : &it->second;
}

void Guide::add_custom_reference(CustomGuideReference reference) {
    if (parse_reference_type(reference.type))
        throw std::invalid_argument("'" + reference.type + "' is a known reference type");
    std::string key = lower(reference.type);
    custom_[key] = std::move(reference);
}

bool Guide::remove_custom_reference(const std::string& type) { return custom_.erase(lower(type)) != 0; }

const CustomGuideReference* Guide::find_custom(const std::string& type) const {
    auto it = custom_.find(lower(type));
    return it == custom_.end() ? nullptr : &it->second;
}

void Guide::correct_custom_types(const GuideReferenceCorrector& corrector, const DuplicationResolver& resolver) {
    std::vector<std::string> keys;
    for (const auto& kv : custom_) keys.push_back(kv.first);

    for (const auto& key : keys) {
        const CustomGuideReference custom = custom_.at(key);
        auto type = corrector.get_correction_or_null(custom.type);
        if (!type) type = corrector.get_correction_or_null(key);
        if (!type) continue;

        GuideReference corrected{*type, custom.href, custom.title};
        auto existing = references_.find(*type);
        if (existing == references_.end()) {
            log_debug("correcting guide type 'other." + custom.type + "' to '" + to_string(*type) + "'");
            references_.emplace(*type, std::move(corrected));
            custom_.erase(key);
            continue;
        }

        DuplicationStrategy strategy = resolver ? resolver(custom, existing->second) : DuplicationStrategy::DoNothing;
        switch (strategy) {
            case DuplicationStrategy::ReplaceExisting:
                log_debug("replacing guide reference '" + std::string(to_string(*type)) + "' with custom '" +
                          custom.type + "'");
                existing->second = std::move(corrected);
                custom_.erase(key);
                break;
            case DuplicationStrategy::RemoveCustom:
                log_debug("removing custom guide reference '" + custom.type + "'");
                custom_.erase(key);
                break;
            case DuplicationStrategy::DoNothing:
                break;
        }
    }
}

bool operator==(const Guide& a, const Guide& b) {
    return a.references() == b.references() && a.custom_references() == b.custom_references();
}

} // namespace epubkit
