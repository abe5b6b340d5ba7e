#pragma once
#include <stdexcept>
#include <string>

namespace epubkit {

// XML 문서 해석 실패. path 는 "/package/manifest/item[3]" 형식
class ReadError : public std::runtime_error {
public:
    enum class Kind {
        MissingAttribute,
        MissingElement,
        MissingText,
        UnknownReadingDirection,
        InvalidIri,
        InvalidMediaType,
        InvalidProperty,
        InvalidVersion,
        MissingIdentifier,
        MissingTitle,
        MissingLanguage,
        UnknownDublinCoreElement,
        NoItemElements,
        NoItemRefElements,
        InvalidLinearValue,
        NoMediaTypeElements,
        NoTourSiteElements,
        EmptyRootFiles,
        UnresolvableReference,
        KnownMetaScheme,
        MalformedDocument,
    };

    ReadError(Kind kind, std::string document, std::string name, std::string path,
              std::string detail = {});

    Kind kind() const noexcept { return kind_; }
    // "content.opf", "container.xml" 등
    const std::string& document() const noexcept { return document_; }
    // 문제가 된 속성/요소 이름 또는 값
    const std::string& name() const noexcept { return name_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    Kind kind_;
    std::string document_;
    std::string name_;
    std::string path_;
    std::string detail_;
};

const char* to_string(ReadError::Kind kind);

} // namespace epubkit
