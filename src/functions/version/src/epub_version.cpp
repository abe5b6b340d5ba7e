#include "epub_version.hpp"
#include <cctype>
#include <vector>

namespace epubkit {

std::string EpubVersion::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor);
    if (patch != 0) s += "." + std::to_string(patch);
    return s;
}

static int compare(const EpubVersion& a, const EpubVersion& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;
    return 0;
}

bool operator==(const EpubVersion& a, const EpubVersion& b) { return compare(a, b) == 0; }
bool operator!=(const EpubVersion& a, const EpubVersion& b) { return compare(a, b) != 0; }
bool operator<(const EpubVersion& a, const EpubVersion& b)  { return compare(a, b) < 0; }
bool operator<=(const EpubVersion& a, const EpubVersion& b) { return compare(a, b) <= 0; }
bool operator>(const EpubVersion& a, const EpubVersion& b)  { return compare(a, b) > 0; }
bool operator>=(const EpubVersion& a, const EpubVersion& b) { return compare(a, b) >= 0; }

const char* to_string(Format format) {
    switch (format) {
        case Format::Unknown:      return "unknown";
        case Format::Epub2_0:      return "EPUB 2.0";
        case Format::Epub3_0:      return "EPUB 3.0";
        case Format::Epub3_1:      return "EPUB 3.1";
        case Format::Epub3_2:      return "EPUB 3.2";
        case Format::NotSupported: return "not supported";
    }
    return "unknown";
}

VersionError::VersionError(Kind kind, std::string value, const std::string& message)
    : std::runtime_error(message), kind_(kind), value_(std::move(value)) {}

EpubVersion parse_version(const std::string& text) {
    if (text.empty() || text.find_first_not_of(" \t\r\n") == std::string::npos)
        throw VersionError(VersionError::Kind::Blank, text, "version is blank");

    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else {
            throw VersionError(VersionError::Kind::Malformed, text,
                               "illegal character in version '" + text + "'");
        }
    }
    parts.push_back(current);

    if (parts.size() < 2 || parts.size() > 3)
        throw VersionError(VersionError::Kind::Malformed, text,
                           "expected 'major.minor' or 'major.minor.patch', got '" + text + "'");

    int values[3] = {0, 0, 0};
    for (size_t i = 0; i < parts.size(); ++i) {
        // int 범위를 넘지 않도록 자리수 제한
        if (parts[i].empty() || parts[i].size() > 9)
            throw VersionError(VersionError::Kind::Malformed, text,
                               "bad version component in '" + text + "'");
        values[i] = std::stoi(parts[i]);
    }
    return EpubVersion{values[0], values[1], values[2]};
}

Format format_of(const EpubVersion& v) {
    if (v < EpubVersion{2, 0, 0}) return Format::Unknown;
    if (v < EpubVersion{3, 0, 0}) return Format::Epub2_0;
    if (v < EpubVersion{3, 1, 0}) return Format::Epub3_0;
    if (v < EpubVersion{3, 2, 0}) return Format::Epub3_1;
    if (v < EpubVersion{4, 0, 0}) return Format::Epub3_2;
    return Format::NotSupported;
}

Format resolve(const EpubVersion& version) {
    Format format = format_of(version);
    if (format == Format::Epub3_1)
        throw VersionError(VersionError::Kind::Withdrawn, version.to_string(),
                           "EPUB 3.1 has been withdrawn and is not supported (" +
                               version.to_string() + ")");
    return format;
}

Format resolve(const std::string& text) { return resolve(parse_version(text)); }

Format require_supported(const EpubVersion& version) {
    Format format = resolve(version);
    if (format == Format::NotSupported)
        throw VersionError(VersionError::Kind::NotSupported, version.to_string(),
                           "unsupported EPUB version " + version.to_string());
    if (format == Format::Unknown)
        throw VersionError(VersionError::Kind::NotSupported, version.to_string(),
                           "unknown EPUB version " + version.to_string());
    return format;
}

bool is_epub2(Format format) { return format == Format::Epub2_0; }

bool is_epub3(Format format) {
    return format == Format::Epub3_0 || format == Format::Epub3_1 || format == Format::Epub3_2;
}

bool supports_epub3_features(Format format) { return is_epub3(format); }

} // namespace epubkit
