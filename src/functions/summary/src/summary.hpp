#pragma once
#include <nlohmann/json.hpp>
#include <string>

#include "functions/epub_reader/src/epub.hpp"

namespace epubkit {

// info 명령 출력. 버전, 필수 메타데이터, manifest/spine 개수, 경고
nlohmann::json summarize(const Epub& epub);

nlohmann::json toc_to_json(const TableOfContents& toc);

// "DMU" 형식. 없는 권한은 '-'
std::string capability_flags(const Resource& resource);

} // namespace epubkit
