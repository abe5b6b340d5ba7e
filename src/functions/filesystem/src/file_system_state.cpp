#include "file_system_state.hpp"
#include "file_error.hpp"
#include <algorithm>
#include <cctype>

namespace epubkit {
namespace detail {

static const char* const kMetaInfControlFiles[] = {
    "container.xml", "encryption.xml", "manifest.xml",
    "metadata.xml",  "rights.xml",     "signatures.xml",
};

static std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool is_under(const std::string& key, const std::string& ancestor) {
    if (ancestor == "/") return key.size() > 1;
    return key.size() > ancestor.size() && key.compare(0, ancestor.size(), ancestor) == 0 &&
           key[ancestor.size()] == '/';
}

FileSystemState::FileSystemState() {
    Node root;
    root.directory = true;
    root.modified = std::time(nullptr);
    nodes.emplace("/", root);
}

void FileSystemState::check_open(const std::string& path) const {
    if (closed) throw FileError(FileError::Kind::FileSystemClosed, path);
}

const Node* FileSystemState::find(const std::string& key) const {
    auto it = nodes.find(key);
    return it == nodes.end() ? nullptr : &it->second;
}

Node* FileSystemState::find(const std::string& key) {
    auto it = nodes.find(key);
    return it == nodes.end() ? nullptr : &it->second;
}

const Node& FileSystemState::require(const std::string& key) const {
    const Node* node = find(key);
    if (!node) throw FileError(FileError::Kind::NoSuchResource, key);
    return *node;
}

Node& FileSystemState::require(const std::string& key) {
    Node* node = find(key);
    if (!node) throw FileError(FileError::Kind::NoSuchResource, key);
    return *node;
}

std::vector<std::string> FileSystemState::children(const std::string& key) const {
    std::vector<std::string> out;
    std::string prefix = key == "/" ? "/" : key + "/";
    for (auto it = nodes.lower_bound(prefix); it != nodes.end(); ++it) {
        const std::string& k = it->first;
        if (k.compare(0, prefix.size(), prefix) != 0) break;
        if (k.size() == prefix.size()) continue;
        if (k.find('/', prefix.size()) != std::string::npos) continue;
        out.push_back(k);
    }
    return out;
}

bool FileSystemState::has_children(const std::string& key) const {
    std::string prefix = key == "/" ? "/" : key + "/";
    auto it = nodes.lower_bound(prefix);
    if (it != nodes.end() && it->first == prefix) ++it;
    return it != nodes.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

static void require_parent_directory(const FileSystemState& state, const std::string& key) {
    std::string parent = FileSystemState::parent_key(key);
    const Node* node = state.find(parent);
    if (!node) throw FileError(FileError::Kind::NoSuchResource, parent);
    if (!node->directory) throw FileError(FileError::Kind::NotDirectory, parent);
}

void FileSystemState::create_file(const std::string& key, std::string data) {
    if (find(key)) throw FileError(FileError::Kind::ResourceAlreadyExists, key);
    require_parent_directory(*this, key);
    Node node;
    node.data = std::move(data);
    node.modified = std::time(nullptr);
    nodes.emplace(key, std::move(node));
}

void FileSystemState::create_directory(const std::string& key) {
    if (find(key)) throw FileError(FileError::Kind::ResourceAlreadyExists, key);
    require_parent_directory(*this, key);
    Node node;
    node.directory = true;
    node.modified = std::time(nullptr);
    nodes.emplace(key, std::move(node));
}

void FileSystemState::create_directories(const std::string& key) {
    if (key == "/") return;
    const Node* node = find(key);
    if (node) {
        if (!node->directory) throw FileError(FileError::Kind::NotDirectory, key);
        return;
    }
    create_directories(parent_key(key));
    create_directory(key);
}

void FileSystemState::write(const std::string& key, const std::string& data, bool append) {
    Node& node = require(key);
    if (node.directory) throw FileError(FileError::Kind::NotFile, key);
    if (append) node.data += data;
    else node.data = data;
    node.modified = std::time(nullptr);
}

void FileSystemState::remove(const std::string& key) {
    if (key == "/") throw FileError(FileError::Kind::NotDeletable, key);
    const Node& node = require(key);
    if (node.directory && has_children(key))
        throw FileError(FileError::Kind::DirectoryNotEmpty, key);
    if (is_local_resource(key)) {
        if (listener) listener->on_local_resource_removing(key);
        local_resources.erase(key);
    }
    nodes.erase(key);
}

void FileSystemState::move(const std::string& from, const std::string& to) {
    if (from == "/") throw FileError(FileError::Kind::NotModifiable, from, to);
    require(from);
    if (find(to)) throw FileError(FileError::Kind::ResourceAlreadyExists, to);
    if (to == from || is_under(to, from))
        throw FileError(FileError::Kind::Unknown, from, to, "cannot move into itself");
    require_parent_directory(*this, to);

    std::vector<std::string> keys;
    keys.push_back(from);
    for (const auto& entry : nodes)
        if (is_under(entry.first, from)) keys.push_back(entry.first);

    for (const auto& key : keys)
        if (is_system_file(key)) throw FileError(FileError::Kind::NotModifiable, key, to);

    std::vector<std::pair<std::string, std::string>> moved_resources;
    for (const auto& key : keys) {
        std::string target = to + key.substr(from.size());
        auto node = nodes.extract(key);
        node.key() = target;
        nodes.insert(std::move(node));
        if (local_resources.erase(key)) {
            local_resources.insert(target);
            moved_resources.emplace_back(key, target);
        }
    }
    nodes.at(to).modified = std::time(nullptr);

    if (listener)
        for (const auto& m : moved_resources) listener->on_local_resource_moved(m.first, m.second);
}

void FileSystemState::copy_file(const std::string& from, const std::string& to) {
    const Node& source = require(from);
    if (source.directory) throw FileError(FileError::Kind::NotFile, from, to);
    std::string data = source.data;
    create_file(to, std::move(data));
}

bool FileSystemState::is_system_file(const std::string& key) const {
    std::string k = lower(key);
    if (k == "/mimetype") return true;
    if (!package_document.empty() && k == lower(package_document)) return true;
    if (lower(parent_key(key)) == "/meta-inf") {
        std::string name = lower(name_of(key));
        for (const char* control : kMetaInfControlFiles)
            if (name == control) return true;
    }
    return false;
}

bool FileSystemState::is_base_directory(const std::string& key) const {
    std::string k = lower(key);
    if (k == "/meta-inf") return true;
    if (!package_document.empty() && k == lower(parent_key(package_document))) return true;
    return false;
}

bool FileSystemState::is_local_resource(const std::string& key) const {
    return local_resources.count(key) != 0;
}

std::string FileSystemState::parent_key(const std::string& key) {
    auto pos = key.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return key.substr(0, pos);
}

std::string FileSystemState::name_of(const std::string& key) {
    auto pos = key.find_last_of('/');
    return pos == std::string::npos ? key : key.substr(pos + 1);
}

std::string FileSystemState::join_key(const std::string& parent, const std::string& name) {
    return parent == "/" ? "/" + name : parent + "/" + name;
}

} // namespace detail
} // namespace epubkit
