#include "read_error.hpp"

namespace epubkit {

static std::string describe(ReadError::Kind kind, const std::string& document, const std::string& name,
                            const std::string& path, const std::string& detail) {
    std::string msg = document + ": " + to_string(kind);
    if (!name.empty()) msg += " '" + name + "'";
    if (!path.empty()) msg += " at " + path;
    if (!detail.empty()) msg += " (" + detail + ")";
    return msg;
}

ReadError::ReadError(Kind kind, std::string document, std::string name, std::string path,
                     std::string detail)
    : std::runtime_error(describe(kind, document, name, path, detail)),
      kind_(kind), document_(std::move(document)), name_(std::move(name)),
      path_(std::move(path)), detail_(std::move(detail)) {}

const char* to_string(ReadError::Kind kind) {
    switch (kind) {
        case ReadError::Kind::MissingAttribute:         return "missing attribute";
        case ReadError::Kind::MissingElement:           return "missing element";
        case ReadError::Kind::MissingText:              return "missing text";
        case ReadError::Kind::UnknownReadingDirection:  return "unknown reading direction";
        case ReadError::Kind::InvalidIri:               return "invalid IRI";
        case ReadError::Kind::InvalidMediaType:         return "invalid media type";
        case ReadError::Kind::InvalidProperty:          return "invalid property";
        case ReadError::Kind::InvalidVersion:           return "invalid version";
        case ReadError::Kind::MissingIdentifier:        return "missing dc:identifier";
        case ReadError::Kind::MissingTitle:             return "missing dc:title";
        case ReadError::Kind::MissingLanguage:          return "missing dc:language";
        case ReadError::Kind::UnknownDublinCoreElement: return "unknown dublin core element";
        case ReadError::Kind::NoItemElements:           return "missing item";
        case ReadError::Kind::NoItemRefElements:        return "missing itemref";
        case ReadError::Kind::InvalidLinearValue:       return "invalid linear value";
        case ReadError::Kind::NoMediaTypeElements:      return "missing mediaType";
        case ReadError::Kind::NoTourSiteElements:       return "missing site";
        case ReadError::Kind::EmptyRootFiles:           return "no rootfile";
        case ReadError::Kind::UnresolvableReference:    return "unresolvable reference";
        case ReadError::Kind::KnownMetaScheme:          return "scheme needs a typed value";
        case ReadError::Kind::MalformedDocument:        return "malformed document";
    }
    return "read error";
}

} // namespace epubkit
