#pragma once
#include <stdexcept>
#include <string>

namespace epubkit {

// 컨테이너를 여는 단계의 실패. cause 는 안쪽 에러 메시지
class ReaderError : public std::runtime_error {
public:
    enum class Kind {
        FailedToOpenFile,
        MissingMetaInf,
        MissingMetaInfContainer,
        MissingMimeType,
        CorruptMimeType,
        MimeTypeContentMismatch,
        MissingOebpsRootFileElement,
        MissingOpfFile,
        OpfParseError,
        MetaInfError,
        FailedToCreateFileSystem,
        UnsupportedVersion,
    };

    explicit ReaderError(Kind kind, std::string detail = {}, std::string cause = {});

    Kind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    Kind kind_;
    std::string detail_;
    std::string cause_;
};

const char* to_string(ReaderError::Kind kind);

} // namespace epubkit
