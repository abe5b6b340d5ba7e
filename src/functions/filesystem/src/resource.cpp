#include "resource.hpp"
#include "file_error.hpp"
#include "file_system_state.hpp"
#include <algorithm>

namespace epubkit {

using detail::FileSystemState;
using detail::Node;

// ---- 분류 ----
static FileSystemState& state_of(const VirtualPath& path) {
    path.check_open();
    return *path.state();
}

static Capabilities file_capabilities(const FileSystemState& state, const std::string& key) {
    if (state.is_system_file(key)) return kReadOnly;
    if (state.is_local_resource(key)) return kDeletable | kModifiable;
    return kAllCapabilities;
}

static Capabilities directory_capabilities(const FileSystemState& state, const std::string& key) {
    if (key == "/" || state.is_base_directory(key)) return kModifiable;
    return kAllCapabilities;
}

Resource classify(const VirtualPath& path) {
    FileSystemState& state = state_of(path);
    VirtualPath normalized = path.absolute().normalize();
    std::string key = normalized.to_string();
    const Node* node = state.find(key);
    if (!node) return Nil(normalized);
    if (node->directory) return Directory(normalized, directory_capabilities(state, key));
    return File(normalized, file_capabilities(state, key));
}

const VirtualPath& path_of(const Resource& resource) {
    return std::visit([](const auto& r) -> const VirtualPath& { return r.path(); }, resource);
}

const char* kind_name(const Resource& resource) {
    if (std::holds_alternative<File>(resource)) return "file";
    if (std::holds_alternative<Directory>(resource)) return "directory";
    return "nil";
}

File require_file(const VirtualPath& path) {
    Resource r = classify(path);
    if (auto* file = std::get_if<File>(&r)) return *file;
    if (std::holds_alternative<Nil>(r)) throw FileError(FileError::Kind::NoSuchResource, path.to_string());
    throw FileError(FileError::Kind::NotFile, path.to_string());
}

Directory require_directory(const VirtualPath& path) {
    Resource r = classify(path);
    if (auto* dir = std::get_if<Directory>(&r)) return *dir;
    if (std::holds_alternative<Nil>(r)) throw FileError(FileError::Kind::NoSuchResource, path.to_string());
    throw FileError(FileError::Kind::NotDirectory, path.to_string());
}

static void check_capability(Capabilities capabilities, Capability capability, const VirtualPath& path) {
    if (capabilities & capability) return;
    FileError::Kind kind = capability == kDeletable    ? FileError::Kind::NotDeletable
                           : capability == kModifiable ? FileError::Kind::NotModifiable
                                                       : FileError::Kind::NotUnprotected;
    throw FileError(kind, path.to_string());
}

static bool same_resource(const VirtualPath& a, const Resource& other) {
    const VirtualPath& b = path_of(other);
    return a.state() == b.state() && a.key() == b.key();
}

static void check_name(const std::string& name, const VirtualPath& path) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        throw FileError(FileError::Kind::Unknown, path.to_string(), name, "invalid entry name");
}

static Node& file_node(const VirtualPath& path) {
    Node& node = state_of(path).require(path.to_string());
    if (node.directory) throw FileError(FileError::Kind::NotFile, path.to_string());
    return node;
}

static Node& directory_node(const VirtualPath& path) {
    Node& node = state_of(path).require(path.to_string());
    if (!node.directory) throw FileError(FileError::Kind::NotDirectory, path.to_string());
    return node;
}

// ---- 복사/이동 대상 ----
struct Target {
    VirtualPath path;
    // 기존 파일에 내용을 덮어쓰는 경우
    bool replace_file;
};

static Target prepare_target(const VirtualPath& source, bool source_is_directory,
                             const Resource& target, bool overwrite) {
    const VirtualPath& target_path = path_of(target);
    if (target_path.state() != source.state()) throw ForeignPathError(target_path.to_string());
    FileSystemState& state = state_of(source);

    std::string key;
    if (const Nil* nil = std::get_if<Nil>(&target)) {
        key = nil->path().key();
    } else if (const Directory* dir = std::get_if<Directory>(&target)) {
        dir->require(kModifiable);
        key = FileSystemState::join_key(dir->path().key(), source.name());
    } else {
        const File& file = std::get<File>(target);
        if (source_is_directory)
            throw FileError(FileError::Kind::NotDirectory, file.path().to_string(), source.to_string(),
                            "cannot place a directory onto a file");
        key = file.path().key();
    }
    if (key == source.key())
        throw FileError(FileError::Kind::ResourceAlreadyExists, key, source.to_string(),
                        "source and target are the same");

    VirtualPath resolved = source.resolve(key);
    Resource existing = classify(resolved);
    if (std::holds_alternative<Nil>(existing)) {
        if (state.is_system_file(key)) throw FileError(FileError::Kind::NotModifiable, key);
        return Target{resolved, false};
    }
    if (const File* file = std::get_if<File>(&existing)) {
        if (source_is_directory)
            throw FileError(FileError::Kind::NotDirectory, key, source.to_string(),
                            "cannot place a directory onto a file");
        if (!overwrite) throw FileError(FileError::Kind::ResourceAlreadyExists, key, source.to_string());
        file->require(kModifiable);
        return Target{resolved, true};
    }
    const Directory& dir = std::get<Directory>(existing);
    if (!source_is_directory)
        throw FileError(FileError::Kind::NotFile, key, source.to_string(),
                        "cannot place a file onto a directory");
    if (!overwrite) throw FileError(FileError::Kind::ResourceAlreadyExists, key, source.to_string());
    dir.require(kDeletable);
    state.remove(key);
    return Target{resolved, false};
}

// ---- ByteChannel ----
ByteChannel::ByteChannel(VirtualPath path) : path_(std::move(path)) {}

std::string ByteChannel::read(std::size_t count) {
    const Node& node = file_node(path_);
    if (position_ >= node.data.size()) return std::string();
    std::string out = node.data.substr(static_cast<size_t>(position_), count);
    position_ += out.size();
    return out;
}

std::size_t ByteChannel::write(const std::string& bytes) {
    Node& node = file_node(path_);
    size_t pos = static_cast<size_t>(position_);
    if (node.data.size() < pos) node.data.resize(pos, '\0');
    if (node.data.size() < pos + bytes.size()) node.data.resize(pos + bytes.size());
    std::copy(bytes.begin(), bytes.end(), node.data.begin() + static_cast<std::ptrdiff_t>(pos));
    position_ += bytes.size();
    node.modified = std::time(nullptr);
    return bytes.size();
}

std::uint64_t ByteChannel::size() const { return file_node(path_).data.size(); }

void ByteChannel::truncate(std::uint64_t size) {
    Node& node = file_node(path_);
    if (size < node.data.size()) {
        node.data.resize(static_cast<size_t>(size));
        node.modified = std::time(nullptr);
    }
    position_ = std::min(position_, size);
}

// ---- Nil ----
bool Nil::is_same_as(const Resource& other) const { return same_resource(path_, other); }

File Nil::create_file(const std::string& data, bool create_parents) const {
    FileSystemState& state = state_of(path_);
    std::string key = path_.key();
    if (state.is_system_file(key)) throw FileError(FileError::Kind::NotModifiable, key);
    if (create_parents) state.create_directories(FileSystemState::parent_key(key));
    state.create_file(key, data);
    return std::get<File>(classify(path_));
}

Directory Nil::create_directory(bool create_parents) const {
    FileSystemState& state = state_of(path_);
    std::string key = path_.key();
    if (create_parents) state.create_directories(FileSystemState::parent_key(key));
    state.create_directory(key);
    return std::get<Directory>(classify(path_));
}

// ---- File ----
const File& File::require(Capability capability) const {
    check_capability(capabilities_, capability, path_);
    return *this;
}

Directory File::parent() const {
    // 절대 경로이고 파일이므로 부모는 항상 있다
    return require_directory(*path_.parent());
}

bool File::is_empty() const { return file_node(path_).data.empty(); }

std::uint64_t File::file_size() const { return file_node(path_).data.size(); }

std::time_t File::last_modified_time() const { return file_node(path_).modified; }

bool File::is_same_as(const Resource& other) const { return same_resource(path_, other); }

std::string File::read_bytes() const { return file_node(path_).data; }

std::vector<std::string> File::read_lines() const {
    const std::string& data = file_node(path_).data;
    std::vector<std::string> lines;
    size_t i = 0;
    while (i < data.size()) {
        size_t j = data.find('\n', i);
        if (j == std::string::npos) j = data.size();
        std::string line = data.substr(i, j - i);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        i = j + 1;
    }
    return lines;
}

void File::write_bytes(const std::string& bytes) const {
    require(kModifiable);
    state_of(path_).write(path_.to_string(), bytes, false);
}

void File::append_bytes(const std::string& bytes) const {
    require(kModifiable);
    state_of(path_).write(path_.to_string(), bytes, true);
}

void File::write_lines(const std::vector<std::string>& lines) const {
    std::string text;
    for (const auto& line : lines) text += line + "\n";
    write_bytes(text);
}

void File::set_last_modified_time(std::time_t time) const {
    require(kModifiable);
    file_node(path_).modified = time;
}

File File::copy_to(const Resource& target, bool overwrite) const {
    require(kModifiable);
    FileSystemState& state = state_of(path_);
    state.require(path_.to_string());
    Target t = prepare_target(path_, false, target, overwrite);
    if (t.replace_file) state.write(t.path.to_string(), read_bytes(), false);
    else state.copy_file(path_.to_string(), t.path.to_string());
    return std::get<File>(classify(t.path));
}

File File::move_to(const Resource& target, bool overwrite) const {
    require(kModifiable);
    FileSystemState& state = state_of(path_);
    state.require(path_.to_string());
    Target t = prepare_target(path_, false, target, overwrite);
    // 덮어쓸 대상을 먼저 지운다. 리스너가 거부하면 아무것도 바뀌지 않는다
    if (t.replace_file) state.remove(t.path.to_string());
    state.move(path_.to_string(), t.path.to_string());
    return std::get<File>(classify(t.path));
}

File File::rename_to(const std::string& name, bool overwrite) const {
    check_name(name, path_);
    return move_to(classify(path_.resolve_sibling(name)), overwrite);
}

Nil File::remove() const {
    require(kDeletable);
    file_node(path_);
    state_of(path_).remove(path_.to_string());
    return std::get<Nil>(classify(path_));
}

ByteChannel File::open_channel() const {
    require(kUnprotected);
    file_node(path_);
    return ByteChannel(path_);
}

// ---- Directory ----
const Directory& Directory::require(Capability capability) const {
    check_capability(capabilities_, capability, path_);
    return *this;
}

std::optional<Directory> Directory::parent() const {
    auto p = path_.parent();
    if (!p) return std::nullopt;
    return require_directory(*p);
}

bool Directory::is_empty() const {
    directory_node(path_);
    return !state_of(path_).has_children(path_.to_string());
}

std::time_t Directory::last_modified_time() const { return directory_node(path_).modified; }

bool Directory::is_same_as(const Resource& other) const { return same_resource(path_, other); }

std::vector<Resource> Directory::list_entries() const {
    directory_node(path_);
    std::vector<Resource> out;
    for (const auto& key : state_of(path_).children(path_.to_string()))
        out.push_back(classify(path_.resolve(key)));
    return out;
}

Resource Directory::resolve(const std::string& relative) const {
    return classify(path_.resolve(relative));
}

File Directory::create_file(const std::string& name, const std::string& data) const {
    require(kModifiable);
    check_name(name, path_);
    directory_node(path_);
    Resource child = classify(path_.resolve(name));
    if (!std::holds_alternative<Nil>(child))
        throw FileError(FileError::Kind::ResourceAlreadyExists, path_of(child).to_string());
    return std::get<Nil>(child).create_file(data);
}

Directory Directory::create_directory(const std::string& name) const {
    require(kModifiable);
    check_name(name, path_);
    directory_node(path_);
    Resource child = classify(path_.resolve(name));
    if (!std::holds_alternative<Nil>(child))
        throw FileError(FileError::Kind::ResourceAlreadyExists, path_of(child).to_string());
    return std::get<Nil>(child).create_directory();
}

void Directory::set_last_modified_time(std::time_t time) const {
    require(kModifiable);
    directory_node(path_).modified = time;
}

Directory Directory::move_to(const Resource& target, bool overwrite) const {
    require(kModifiable);
    require(kDeletable);
    directory_node(path_);
    Target t = prepare_target(path_, true, target, overwrite);
    state_of(path_).move(path_.to_string(), t.path.to_string());
    return std::get<Directory>(classify(t.path));
}

Directory Directory::rename_to(const std::string& name, bool overwrite) const {
    check_name(name, path_);
    return move_to(classify(path_.resolve_sibling(name)), overwrite);
}

Nil Directory::remove() const {
    require(kDeletable);
    directory_node(path_);
    state_of(path_).remove(path_.to_string());
    return std::get<Nil>(classify(path_));
}

} // namespace epubkit
