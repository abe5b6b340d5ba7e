#include "href.hpp"
#include <cctype>

namespace epubkit {

HrefParts split_fragment(const std::string& href) {
    auto pos = href.find('#');
    if (pos == std::string::npos) return HrefParts{href, std::nullopt};
    return HrefParts{href.substr(0, pos), href.substr(pos + 1)};
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

bool is_remote_href(const std::string& href) {
    // RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    if (href.empty() || !std::isalpha(static_cast<unsigned char>(href[0]))) return false;
    for (std::size_t i = 1; i < href.size(); ++i) {
        char c = href[i];
        if (c == ':') return true;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}

std::optional<VirtualPath> resolve_href(const VirtualPath& directory, const std::string& href) {
    if (is_remote_href(href)) return std::nullopt;
    std::string path = percent_decode(split_fragment(href).path);
    if (path.empty()) return std::nullopt;
    return directory.resolve(path).normalize();
}

} // namespace epubkit
