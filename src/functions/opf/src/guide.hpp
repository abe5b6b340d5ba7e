#pragma once
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace epubkit {

enum class ReferenceType {
    Cover,
    TitlePage,
    TableOfContents,
    Index,
    Glossary,
    Acknowledgements,
    Bibliography,
    Colophon,
    CopyrightPage,
    Dedication,
    Epigraph,
    Foreword,
    ListOfIllustrations,
    ListOfTables,
    Notes,
    Preface,
    Text,
};

// "cover", "title-page", "toc" ...
const char* to_string(ReferenceType type);
// 대소문자 무시
std::optional<ReferenceType> parse_reference_type(const std::string& value);

struct GuideReference {
    ReferenceType type = ReferenceType::Text;
    std::string href;
    std::optional<std::string> title;
};

// "other." 없이 저장하고 쓸 때 붙인다
struct CustomGuideReference {
    std::string type;
    std::string href;
    std::optional<std::string> title;
};

bool operator==(const GuideReference& a, const GuideReference& b);
bool operator==(const CustomGuideReference& a, const CustomGuideReference& b);

class CorrectionAlreadyExists : public std::runtime_error {
public:
    explicit CorrectionAlreadyExists(const std::string& custom_type);
};

// 잘못 쓰인 사용자 정의 타입 → 표준 타입. 추가만 가능하고 제거는 없다
class GuideReferenceCorrector {
public:
    // copyright → copyright-page
    static std::map<std::string, ReferenceType> default_corrections();

    explicit GuideReferenceCorrector(std::map<std::string, ReferenceType> corrections = default_corrections());

    void add_correction(const std::string& custom_type, ReferenceType type);
    // 없으면 std::out_of_range
    ReferenceType get_correction(const std::string& custom_type) const;
    std::optional<ReferenceType> get_correction_or_null(const std::string& custom_type) const;
    std::vector<std::string> get_corrections_for(ReferenceType type) const;
    bool has_correction(const std::string& custom_type) const;

private:
    std::map<std::string, ReferenceType> corrections_;
};

enum class DuplicationStrategy {
    ReplaceExisting,
    RemoveCustom,
    DoNothing,
};

using DuplicationResolver =
    std::function<DuplicationStrategy(const CustomGuideReference& custom, const GuideReference& existing)>;

class Guide {
public:
    const std::map<ReferenceType, GuideReference>& references() const { return references_; }
    // 키는 소문자로 정규화된 사용자 정의 타입
    const std::map<std::string, CustomGuideReference>& custom_references() const { return custom_; }

    void add_reference(GuideReference reference);
    bool remove_reference(ReferenceType type);
    const GuideReference* find(ReferenceType type) const;

    // 표준 타입 이름이면 std::invalid_argument
    void add_custom_reference(CustomGuideReference reference);
    bool remove_custom_reference(const std::string& type);
    const CustomGuideReference* find_custom(const std::string& type) const;

    // 교정 가능한 사용자 정의 참조를 표준 참조로 옮긴다
    void correct_custom_types(const GuideReferenceCorrector& corrector,
                              const DuplicationResolver& resolver = DuplicationResolver());

    bool empty() const { return references_.empty() && custom_.empty(); }

private:
    std::map<ReferenceType, GuideReference> references_;
    std::map<std::string, CustomGuideReference> custom_;
};

bool operator==(const Guide& a, const Guide& b);

} // namespace epubkit
