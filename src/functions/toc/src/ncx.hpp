#pragma once
#include <pugixml.hpp>
#include <optional>
#include <string>
#include <vector>

#include "functions/xml/src/read_error.hpp"
#include "functions/xml/src/reading_direction.hpp"

namespace epubkit {

constexpr const char* kNcxMediaType = "application/x-dtbncx+xml";

struct NcxText {
    std::string content;
    std::optional<std::string> identifier;
    std::optional<std::string> clazz;
};

struct NcxLabel {
    NcxText text;
    std::optional<std::string> language;
    std::optional<ReadingDirection> direction;
};

// head/meta. dtb:uid 가 OPF 의 unique identifier 를 가리킨다
struct NcxMeta {
    std::string name;
    std::string content;
    std::optional<std::string> scheme;
};

struct NcxContent {
    std::string source;
    std::optional<std::string> identifier;
};

struct NavPoint {
    std::string identifier;
    std::optional<std::string> clazz;
    std::optional<int> play_order;
    std::vector<NcxLabel> labels;   // 최소 하나
    NcxContent content;
    std::vector<NavPoint> children;
};

struct PageTarget {
    std::string identifier;
    std::string type;               // front | normal | special
    std::optional<int> value;
    std::optional<std::string> clazz;
    std::optional<int> play_order;
    std::vector<NcxLabel> labels;
    NcxContent content;
};

struct PageList {
    std::optional<std::string> identifier;
    std::optional<std::string> clazz;
    std::vector<NcxLabel> labels;
    std::vector<PageTarget> targets; // 최소 하나
};

struct NavMap {
    std::optional<std::string> identifier;
    std::vector<NcxLabel> labels;
    std::vector<NavPoint> points;    // 최소 하나
};

struct NcxDocument {
    std::string version = "2005-1";
    std::optional<std::string> language;
    std::optional<ReadingDirection> direction;
    std::vector<NcxMeta> head;
    NcxText title;
    std::vector<NcxText> authors;
    NavMap nav_map;
    std::optional<PageList> page_list;
};

NcxDocument read_ncx(pugi::xml_node root, const std::string& document);
NcxDocument parse_ncx(const std::string& content, const std::string& document);

void write_ncx(const NcxDocument& ncx, pugi::xml_document& doc);
std::string ncx_to_string(const NcxDocument& ncx, int indent = 2);

} // namespace epubkit
