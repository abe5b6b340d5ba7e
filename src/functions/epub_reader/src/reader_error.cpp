#include "reader_error.hpp"

namespace epubkit {

namespace {

std::string make_message(ReaderError::Kind kind, const std::string& detail, const std::string& cause) {
    std::string msg = to_string(kind);
    if (!detail.empty()) msg += ": " + detail;
    if (!cause.empty()) msg += " (" + cause + ")";
    return msg;
}

} // namespace

ReaderError::ReaderError(Kind kind, std::string detail, std::string cause)
    : std::runtime_error(make_message(kind, detail, cause)),
      kind_(kind), detail_(std::move(detail)), cause_(std::move(cause)) {}

const char* to_string(ReaderError::Kind kind) {
    switch (kind) {
        case ReaderError::Kind::FailedToOpenFile:            return "failed to open file";
        case ReaderError::Kind::MissingMetaInf:              return "missing META-INF directory";
        case ReaderError::Kind::MissingMetaInfContainer:     return "missing META-INF/container.xml";
        case ReaderError::Kind::MissingMimeType:             return "missing mimetype";
        case ReaderError::Kind::CorruptMimeType:             return "corrupt mimetype";
        case ReaderError::Kind::MimeTypeContentMismatch:     return "mimetype content mismatch";
        case ReaderError::Kind::MissingOebpsRootFileElement: return "missing OEBPS rootfile";
        case ReaderError::Kind::MissingOpfFile:              return "missing OPF file";
        case ReaderError::Kind::OpfParseError:               return "OPF parse error";
        case ReaderError::Kind::MetaInfError:                return "META-INF error";
        case ReaderError::Kind::FailedToCreateFileSystem:    return "failed to create file system";
        case ReaderError::Kind::UnsupportedVersion:          return "unsupported version";
    }
    return "unknown";
}

} // namespace epubkit
