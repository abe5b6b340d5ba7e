#include "file_error.hpp"

namespace epubkit {

static std::string describe(FileError::Kind kind, const std::string& path,
                            const std::string& other, const std::string& detail) {
    std::string msg = std::string(to_string(kind)) + ": " + path;
    if (!other.empty()) msg += " -> " + other;
    if (!detail.empty()) msg += " (" + detail + ")";
    return msg;
}

FileError::FileError(Kind kind, std::string path, std::string other, std::string detail)
    : std::runtime_error(describe(kind, path, other, detail)),
      kind_(kind), path_(std::move(path)), other_(std::move(other)) {}

const char* to_string(FileError::Kind kind) {
    switch (kind) {
        case FileError::Kind::NoSuchResource:        return "no such resource";
        case FileError::Kind::DirectoryNotEmpty:     return "directory not empty";
        case FileError::Kind::ResourceAlreadyExists: return "resource already exists";
        case FileError::Kind::NotFile:               return "not a file";
        case FileError::Kind::NotDirectory:          return "not a directory";
        case FileError::Kind::NotModifiable:         return "not modifiable";
        case FileError::Kind::NotDeletable:          return "not deletable";
        case FileError::Kind::NotUnprotected:        return "raw access not permitted";
        case FileError::Kind::PathEscapesRoot:       return "path escapes root";
        case FileError::Kind::FileSystemClosed:      return "file system closed";
        case FileError::Kind::Unknown:               return "file error";
    }
    return "file error";
}

ForeignPathError::ForeignPathError(const std::string& path)
    : std::logic_error("path '" + path + "' belongs to another file system") {}

SymbolicLinkError::SymbolicLinkError(const std::string& entry)
    : std::logic_error("symbolic link inside archive: " + entry), entry_(entry) {}

} // namespace epubkit
