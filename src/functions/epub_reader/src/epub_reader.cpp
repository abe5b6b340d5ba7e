#include "epub_reader.hpp"
#include "epub_impl.hpp"
#include "functions/archive/src/zip_archive.hpp"
#include "functions/filesystem/src/file_error.hpp"
#include "functions/logging/src/log.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace epubkit {

namespace {

const ZipEntry* find_entry(const std::vector<ZipEntry>& entries, const std::string& name) {
    for (const auto& e : entries)
        if (e.name == name) return &e;
    return nullptr;
}

// ---- 최소한의 구조 확인 ----
void check_entries(const std::vector<ZipEntry>& entries) {
    bool has_meta_inf = std::any_of(entries.begin(), entries.end(), [](const ZipEntry& e) {
        return e.name.compare(0, 9, "META-INF/") == 0 || e.name == "META-INF";
    });
    if (!has_meta_inf) throw ReaderError(ReaderError::Kind::MissingMetaInf);

    const ZipEntry* container = find_entry(entries, "META-INF/container.xml");
    if (!container || container->directory) throw ReaderError(ReaderError::Kind::MissingMetaInfContainer);

    const ZipEntry* mimetype = find_entry(entries, "mimetype");
    if (!mimetype || mimetype->directory) throw ReaderError(ReaderError::Kind::MissingMimeType);

    for (unsigned char c : mimetype->data)
        if (c < 0x20 || c > 0x7e)
            throw ReaderError(ReaderError::Kind::CorruptMimeType, "mimetype is not printable ASCII");
    if (mimetype->data != kEpubMimeType)
        throw ReaderError(ReaderError::Kind::MimeTypeContentMismatch, mimetype->data);
}

const RootFile& find_root_file(const MetaInfContainer& container) {
    std::vector<const RootFile*> candidates;
    for (const auto& r : container.root_files)
        if (r.media_type == kOebpsPackageMediaType) candidates.push_back(&r);
    if (candidates.empty()) throw ReaderError(ReaderError::Kind::MissingOebpsRootFileElement);
    if (candidates.size() > 1)
        log_info(std::to_string(candidates.size()) + " OEBPS rootfiles, using " + candidates.front()->full_path);
    return *candidates.front();
}

} // namespace

Epub load_epub(const std::vector<ZipEntry>& entries, const PackageReadOptions& options) {
    check_entries(entries);

    EpubFileSystem fs = [&] {
        try {
            return EpubFileSystem::from_entries(entries);
        } catch (const FileError& e) {
            throw ReaderError(ReaderError::Kind::FailedToCreateFileSystem, {}, e.what());
        }
    }();

    const std::string container_xml = require_file(fs.get_path("/META-INF/container.xml")).read_bytes();
    MetaInfContainer container = [&] {
        try {
            return parse_container(container_xml);
        } catch (const ReadError& e) {
            throw ReaderError(ReaderError::Kind::MetaInfError, "container.xml", e.what());
        }
    }();

    const RootFile& root_file = find_root_file(container);
    std::optional<VirtualPath> opf_path;
    try {
        opf_path = fs.get_path("/" + root_file.full_path).normalize();
    } catch (const FileError& e) {
        throw ReaderError(ReaderError::Kind::MissingOpfFile, root_file.full_path, e.what());
    }
    if (!std::holds_alternative<File>(classify(*opf_path)))
        throw ReaderError(ReaderError::Kind::MissingOpfFile, root_file.full_path);

    std::vector<ReadError> warnings;
    PackageDocument package;
    try {
        package = parse_package_document(require_file(*opf_path).read_bytes(), opf_path->name(), options, warnings);
    } catch (const ReadError& e) {
        throw ReaderError(ReaderError::Kind::OpfParseError, root_file.full_path, e.what());
    } catch (const VersionError& e) {
        throw ReaderError(ReaderError::Kind::UnsupportedVersion, e.value(), e.what());
    }
    log_debug("loaded " + root_file.full_path + " (EPUB " + package.version().to_string() + ")");

    auto impl = std::make_unique<Epub::Impl>(std::move(fs), std::move(container), std::move(package),
                                             *opf_path, std::move(warnings));
    return Epub(std::move(impl));
}

Epub open_epub(const std::filesystem::path& path, const PackageReadOptions& options) {
    std::vector<ZipEntry> entries;
    try {
        entries = read_zip_file(path);
    } catch (const std::runtime_error& e) {
        throw ReaderError(ReaderError::Kind::FailedToOpenFile, path.string(), e.what());
    }
    return load_epub(entries, options);
}

Epub open_epub_bytes(const std::string& bytes, const PackageReadOptions& options) {
    std::vector<ZipEntry> entries;
    try {
        entries = read_zip_bytes(bytes);
    } catch (const std::runtime_error& e) {
        throw ReaderError(ReaderError::Kind::FailedToOpenFile, "<memory>", e.what());
    }
    return load_epub(entries, options);
}

} // namespace epubkit
