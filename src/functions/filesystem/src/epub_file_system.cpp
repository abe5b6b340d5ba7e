#include "epub_file_system.hpp"
#include "file_error.hpp"
#include "functions/logging/src/log.hpp"
#include <fstream>
#include <iterator>

namespace epubkit {

using detail::FileSystemState;

EpubFileSystem::EpubFileSystem(std::shared_ptr<FileSystemState> state) : state_(std::move(state)) {}

EpubFileSystem::~EpubFileSystem() {
    if (state_) {
        state_->listener = nullptr;
        state_->closed = true;
    }
}

EpubFileSystem EpubFileSystem::create_empty() {
    return EpubFileSystem(std::make_shared<FileSystemState>());
}

// ---- zip 엔트리 → 트리 ----
static std::string entry_key(const std::string& name) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i <= name.size()) {
        size_t j = name.find_first_of("/\\", i);
        if (j == std::string::npos) j = name.size();
        std::string s = name.substr(i, j - i);
        if (s == "..") {
            if (parts.empty()) throw FileError(FileError::Kind::PathEscapesRoot, name);
            parts.pop_back();
        } else if (!s.empty() && s != ".") {
            parts.push_back(s);
        }
        i = j + 1;
    }
    std::string key;
    for (const auto& p : parts) key += "/" + p;
    return key.empty() ? "/" : key;
}

EpubFileSystem EpubFileSystem::from_entries(const std::vector<ZipEntry>& entries) {
    auto state = std::make_shared<FileSystemState>();
    for (const auto& entry : entries) {
        std::string key = entry_key(entry.name);
        if (key == "/") continue;
        if (entry.directory) {
            state->create_directories(key);
        } else {
            state->create_directories(FileSystemState::parent_key(key));
            if (state->find(key))
                throw FileError(FileError::Kind::ResourceAlreadyExists, key, {}, "duplicate archive entry");
            state->create_file(key, entry.data);
        }
        if (entry.modified != 0) state->require(key).modified = entry.modified;
    }
    log_debug("loaded " + std::to_string(state->nodes.size() - 1) + " archive entries");
    return EpubFileSystem(std::move(state));
}

std::vector<ZipEntry> EpubFileSystem::to_entries() const {
    state_->check_open("/");
    std::vector<ZipEntry> entries;
    auto to_entry = [](const std::string& key, const detail::Node& node) {
        ZipEntry entry;
        entry.name = key.substr(1);
        entry.directory = node.directory;
        if (node.directory) entry.name += "/";
        else entry.data = node.data;
        entry.modified = node.modified;
        return entry;
    };

    if (const detail::Node* mimetype = state_->find("/mimetype"))
        entries.push_back(to_entry("/mimetype", *mimetype));
    for (const auto& kv : state_->nodes) {
        if (kv.first == "/" || kv.first == "/mimetype") continue;
        entries.push_back(to_entry(kv.first, kv.second));
    }
    return entries;
}

// ---- 경로 ----
VirtualPath EpubFileSystem::get_path(const std::string& first, const std::vector<std::string>& more) const {
    state_->check_open(first);
    std::string joined = first;
    for (const auto& s : more) {
        if (s.empty()) continue;
        if (!joined.empty() && joined.back() != '/') joined.push_back('/');
        joined += s;
    }
    return VirtualPath::parse(state_, joined);
}

VirtualPath EpubFileSystem::root() const {
    state_->check_open("/");
    return VirtualPath(state_, {}, true);
}

VirtualPath EpubFileSystem::own(const VirtualPath& path) const {
    if (path.state() != state_) throw ForeignPathError(path.to_string());
    return path;
}

// ---- import ----
File EpubFileSystem::import_stream(std::istream& in, const std::string& name, const Directory& target) const {
    own(target.path());
    target.require(kModifiable);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw FileError(FileError::Kind::Unknown, target.path().to_string(), name, "stream read failed");
    return target.create_file(name, data);
}

File EpubFileSystem::import_file(const std::filesystem::path& host_path, const Directory& target) const {
    std::ifstream in(host_path, std::ios::binary);
    if (!in)
        throw FileError(FileError::Kind::NoSuchResource, host_path.string(), {}, "cannot open host file");
    return import_stream(in, host_path.filename().string(), target);
}

// ---- 수명 ----
void EpubFileSystem::close() {
    if (!state_ || state_->closed) return;
    state_->closed = true;
    state_->listener = nullptr;
    // 트리 내용 해제. 남은 경로들은 closed 플래그로 막힌다
    state_->nodes.clear();
    state_->local_resources.clear();
}

bool EpubFileSystem::is_open() const { return state_ && !state_->closed; }

// ---- 보호 테이블 ----
void EpubFileSystem::set_package_document(const VirtualPath& path) {
    state_->package_document = own(path).key();
}

std::optional<VirtualPath> EpubFileSystem::package_document() const {
    state_->check_open("/");
    if (state_->package_document.empty()) return std::nullopt;
    return VirtualPath::parse(state_, state_->package_document);
}

void EpubFileSystem::register_local_resource(const VirtualPath& path) {
    state_->local_resources.insert(own(path).key());
}

void EpubFileSystem::unregister_local_resource(const VirtualPath& path) {
    state_->local_resources.erase(own(path).key());
}

void EpubFileSystem::clear_local_resources() {
    state_->check_open("/");
    state_->local_resources.clear();
}

bool EpubFileSystem::is_local_resource(const VirtualPath& path) const {
    return state_->is_local_resource(own(path).key());
}

void EpubFileSystem::set_resource_listener(detail::ResourceListener* listener) {
    state_->listener = listener;
}

void EpubFileSystem::write_system_file(const VirtualPath& path, const std::string& data) const {
    std::string key = own(path).key();
    if (state_->find(key)) {
        state_->write(key, data, false);
    } else {
        state_->create_directories(FileSystemState::parent_key(key));
        state_->create_file(key, data);
    }
}

} // namespace epubkit
