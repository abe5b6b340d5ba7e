#pragma once
#include <pugixml.hpp>
#include <optional>
#include <string>
#include <vector>

#include "functions/xml/src/read_error.hpp"

namespace epubkit {

constexpr const char* kOebpsPackageMediaType = "application/oebps-package+xml";
constexpr const char* kContainerDocument = "container.xml";

struct RootFile {
    std::string full_path;
    std::string media_type;
};

struct ContainerLink {
    std::string href;
    std::optional<std::string> relation;
    std::optional<std::string> media_type;
};

// META-INF/container.xml
struct MetaInfContainer {
    std::string version = "1.0";
    std::vector<RootFile> root_files;
    std::vector<ContainerLink> links;

    // media-type 이 OEBPS 패키지인 첫 rootfile
    const RootFile* package_root_file() const;
};

bool operator==(const RootFile& a, const RootFile& b);
bool operator==(const ContainerLink& a, const ContainerLink& b);

// rootfiles 가 비어 있으면 ReadError(EmptyRootFiles)
MetaInfContainer read_container(pugi::xml_node root);
MetaInfContainer parse_container(const std::string& content);

void write_container(const MetaInfContainer& container, pugi::xml_document& doc);
std::string container_to_string(const MetaInfContainer& container, int indent = 2);

} // namespace epubkit
