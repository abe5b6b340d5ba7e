#pragma once
#include <pugixml.hpp>
#include <memory>
#include <string>
#include <vector>

#include "functions/xml/src/read_error.hpp"
#include "opf_meta.hpp"
#include "package_document.hpp"

namespace epubkit {

struct PackageReadOptions {
    std::shared_ptr<const MetaSchemeRegistry> registry = MetaSchemeRegistry::standard();
};

struct PackageWriteOptions {
    // 3.x 로 쓸 때 OPF2 meta 와 guide 생략
    bool omit_legacy = false;
    int indent = 2;
};

// metadata / manifest / spine 실패는 ReadError, 버전 문제는 VersionError.
// guide / bindings / tours / collection 실패는 warnings 에 쌓고 없는 것으로 본다
PackageDocument read_package_document(pugi::xml_node root, const std::string& document,
                                      const PackageReadOptions& options, std::vector<ReadError>& warnings);
PackageDocument parse_package_document(const std::string& content, const std::string& document,
                                       const PackageReadOptions& options, std::vector<ReadError>& warnings);

void write_package_document(const PackageDocument& package, pugi::xml_document& doc,
                            const PackageWriteOptions& options);
std::string package_document_to_string(const PackageDocument& package, const PackageWriteOptions& options);

} // namespace epubkit
