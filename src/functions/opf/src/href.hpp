#pragma once
#include <optional>
#include <string>

#include "functions/filesystem/src/virtual_path.hpp"

namespace epubkit {

// "a.xhtml#p1" → {"a.xhtml", "p1"}
struct HrefParts {
    std::string path;
    std::optional<std::string> fragment;
};

HrefParts split_fragment(const std::string& href);
// "%20" 같은 escape 를 푼다. 잘못된 escape 는 그대로 둔다
std::string percent_decode(const std::string& text);
// scheme 이 붙은 href (http:, mailto: ...)
bool is_remote_href(const std::string& href);

// directory 기준으로 href 를 풀어 정규화한 경로. 원격 href 나 빈 경로면 nullopt,
// 루트 밖으로 나가면 FileError(PathEscapesRoot)
std::optional<VirtualPath> resolve_href(const VirtualPath& directory, const std::string& href);

} // namespace epubkit
