#include "epub_impl.hpp"
#include "functions/archive/src/zip_archive.hpp"
#include "functions/filesystem/src/file_error.hpp"
#include "functions/logging/src/log.hpp"
#include "functions/opf/src/href.hpp"
#include "functions/toc/src/nav_document.hpp"
#include "functions/toc/src/ncx.hpp"
#include <algorithm>

namespace epubkit {

// ---- Impl ----
Epub::Impl::Impl(EpubFileSystem fs_, MetaInfContainer container_, PackageDocument package_,
                 VirtualPath opf_path_, std::vector<ReadError> warnings_)
    : fs(std::move(fs_)), container(std::move(container_)), package(std::move(package_)),
      opf_path(std::move(opf_path_)), warnings(std::move(warnings_)) {
    fs.set_package_document(opf_path);
    register_local_resources();
    fs.set_resource_listener(this);
}

Epub::Impl::~Impl() = default;

VirtualPath Epub::Impl::opf_directory_path() const {
    auto parent = opf_path.parent();
    return parent ? *parent : fs.root();
}

std::optional<std::string> Epub::Impl::key_of(const ManifestItem& item) const {
    try {
        auto path = resolve_href(opf_directory_path(), item.href);
        if (!path) return std::nullopt;
        return path->key();
    } catch (const FileError& e) {
        log_warn("manifest item '" + item.identifier + "' has an unusable href: " + e.what());
        return std::nullopt;
    }
}

void Epub::Impl::register_local_resources() {
    fs.clear_local_resources();
    for (const ManifestItem& item : package.manifest.items) {
        auto key = key_of(item);
        if (!key) continue;
        VirtualPath path = fs.get_path(*key);
        if (!path.exists()) log_warn("manifest item '" + item.identifier + "' points to missing " + *key);
        fs.register_local_resource(path);
    }
}

void Epub::Impl::on_local_resource_removing(const std::string& path) {
    for (const ManifestItem& item : package.manifest.items) {
        auto key = key_of(item);
        if (!key || *key != path) continue;

        const std::string id = item.identifier;
        auto& refs = package.spine.references;
        auto referenced = std::count_if(refs.begin(), refs.end(), [&](const ItemRef& r) { return r.idref == id; });
        if (referenced > 0 && static_cast<std::size_t>(referenced) == refs.size())
            throw FileError(FileError::Kind::NotDeletable, path, {}, "'" + id + "' is the last spine item");

        refs.erase(std::remove_if(refs.begin(), refs.end(), [&](const ItemRef& r) { return r.idref == id; }),
                   refs.end());
        if (package.spine.toc == id) package.spine.toc.reset();
        package.manifest.remove(id);
        log_info("removed manifest item '" + id + "' for deleted " + path);
        return;
    }
}

void Epub::Impl::on_local_resource_moved(const std::string& from, const std::string& to) {
    VirtualPath target = fs.get_path(to);
    for (ManifestItem& item : package.manifest.items) {
        auto key = key_of(item);
        if (!key || *key != from) continue;
        item.href = opf_directory_path().relativize(target).to_string();
        log_info("manifest item '" + item.identifier + "' now points to " + item.href);
    }
}

void Epub::Impl::write_documents(const PackageWriteOptions& options) {
    fs.write_system_file(fs.get_path("/mimetype"), kEpubMimeType);
    fs.write_system_file(fs.get_path("/META-INF/container.xml"), container_to_string(container, options.indent));
    fs.write_system_file(opf_path, package_document_to_string(package, options));
}

// ---- Epub ----
Epub::Epub(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Epub::Epub(Epub&&) noexcept = default;
Epub& Epub::operator=(Epub&&) noexcept = default;
Epub::~Epub() = default;

const EpubVersion& Epub::version() const { return impl_->package.version(); }
Format Epub::format() const { return impl_->package.format(); }
void Epub::set_version(const EpubVersion& version) { impl_->package.set_version(version); }

PackageDocument& Epub::package() { return impl_->package; }
const PackageDocument& Epub::package() const { return impl_->package; }
MetaInfContainer& Epub::container() { return impl_->container; }
const MetaInfContainer& Epub::container() const { return impl_->container; }
EpubFileSystem& Epub::file_system() { return impl_->fs; }
const EpubFileSystem& Epub::file_system() const { return impl_->fs; }

File Epub::opf_file() const { return require_file(impl_->opf_path); }
Directory Epub::opf_directory() const { return require_directory(impl_->opf_directory_path()); }

const std::vector<ReadError>& Epub::warnings() const { return impl_->warnings; }

void Epub::refresh_local_resources() { impl_->register_local_resources(); }

TableOfContents Epub::table_of_contents() const {
    const PackageDocument& package = impl_->package;
    const std::string opf_name = impl_->opf_path.name();
    PageIndex pages(package.manifest, impl_->opf_directory_path());

    auto document_path = [&](const ManifestItem& item, const std::string& locator) {
        auto key = impl_->key_of(item);
        if (!key)
            throw ReadError(ReadError::Kind::UnresolvableReference, opf_name, item.href, locator);
        VirtualPath path = impl_->fs.get_path(*key);
        if (!std::holds_alternative<File>(classify(path)))
            throw ReadError(ReadError::Kind::UnresolvableReference, opf_name, item.href, locator,
                            *key + " is not a file");
        return path;
    };

    if (supports_epub3_features(package.format())) {
        if (const ManifestItem* nav = package.manifest.find_by_property("nav")) {
            VirtualPath path = document_path(*nav, "/package/manifest/item[@id='" + nav->identifier + "']/@href");
            NavigationDocument doc = parse_nav_document(require_file(path).read_bytes(), path.name());
            return table_of_contents_from_nav(doc, path, pages);
        }
    }

    if (package.spine.toc) {
        const ManifestItem* item = package.manifest.find(*package.spine.toc);
        if (!item)
            throw ReadError(ReadError::Kind::UnresolvableReference, opf_name, *package.spine.toc,
                            "/package/spine/@toc", "no manifest item with that id");
        VirtualPath path = document_path(*item, "/package/spine/@toc");
        NcxDocument ncx = parse_ncx(require_file(path).read_bytes(), path.name());
        return table_of_contents_from_ncx(ncx, path, pages);
    }

    throw ReadError(ReadError::Kind::MissingElement, opf_name, "toc", "/package/spine",
                    "no navigation document or NCX");
}

std::string Epub::to_bytes(const PackageWriteOptions& options) {
    impl_->write_documents(options);
    return write_zip_bytes(impl_->fs.to_entries());
}

void Epub::save(const std::filesystem::path& path, const PackageWriteOptions& options) {
    impl_->write_documents(options);
    write_zip_file(path, impl_->fs.to_entries());
    log_info("saved " + path.string());
}

void Epub::close() { impl_->fs.close(); }

} // namespace epubkit
