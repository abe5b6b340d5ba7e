#pragma once
#include <pugixml.hpp>
#include <optional>
#include <string>
#include <vector>

#include "functions/xml/src/read_error.hpp"

namespace epubkit {

enum class NavigationType {
    Toc,
    PageList,
    Landmarks,
    Custom,
};

// epub:type 토큰 중 처음 알아보는 것. 없으면 Custom
NavigationType navigation_type_of(const std::string& epub_type);
const char* to_string(NavigationType type);

// <a href=".."> 또는 <span>. href 가 없으면 span
struct NavContent {
    std::optional<std::string> href;
    std::string text;
    std::optional<std::string> epub_type;
};

struct NavListItem {
    NavContent content;
    std::vector<NavListItem> children;
};

struct Navigation {
    NavigationType type = NavigationType::Toc;
    std::string epub_type = "toc";
    bool hidden = false;
    std::optional<std::string> heading;
    std::vector<NavListItem> items;   // 최소 하나
};

struct NavigationDocument {
    std::optional<std::string> title;
    std::vector<Navigation> navigations;

    const Navigation* find(NavigationType type) const;
};

// toc nav 가 없으면 ReadError(MissingElement)
NavigationDocument parse_nav_document(const std::string& content, const std::string& document);
std::string nav_document_to_string(const NavigationDocument& nav, int indent = 2);

} // namespace epubkit
