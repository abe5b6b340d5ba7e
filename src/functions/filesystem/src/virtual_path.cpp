#include "virtual_path.hpp"
#include "epub_file_system.hpp"
#include "file_error.hpp"
#include "file_system_state.hpp"

namespace epubkit {

VirtualPath::VirtualPath(std::shared_ptr<detail::FileSystemState> state,
                         std::vector<std::string> segments, bool absolute)
    : state_(std::move(state)), segments_(std::move(segments)), absolute_(absolute) {}

VirtualPath VirtualPath::parse(const std::shared_ptr<detail::FileSystemState>& state,
                               const std::string& text) {
    std::vector<std::string> segments;
    size_t i = 0;
    while (i <= text.size()) {
        size_t j = text.find('/', i);
        if (j == std::string::npos) j = text.size();
        if (j > i) segments.push_back(text.substr(i, j - i));
        i = j + 1;
    }
    bool absolute = !text.empty() && text[0] == '/';
    return VirtualPath(state, std::move(segments), absolute);
}

void VirtualPath::check_open() const { state_->check_open(to_string()); }

void VirtualPath::require_same_file_system(const VirtualPath& other) const {
    if (other.state_ != state_) throw ForeignPathError(other.to_string());
}

std::optional<VirtualPath> VirtualPath::parent() const {
    check_open();
    if (segments_.empty()) return std::nullopt;
    if (segments_.size() == 1 && !absolute_) return std::nullopt;
    std::vector<std::string> up(segments_.begin(), segments_.end() - 1);
    return VirtualPath(state_, std::move(up), absolute_);
}

std::string VirtualPath::name() const {
    return segments_.empty() ? std::string() : segments_.back();
}

VirtualPath VirtualPath::segment(std::size_t index) const {
    check_open();
    return VirtualPath(state_, {segments_.at(index)}, false);
}

VirtualPath VirtualPath::resolve(const VirtualPath& other) const {
    check_open();
    require_same_file_system(other);
    if (other.absolute_) return other;
    std::vector<std::string> joined(segments_);
    joined.insert(joined.end(), other.segments_.begin(), other.segments_.end());
    return VirtualPath(state_, std::move(joined), absolute_);
}

VirtualPath VirtualPath::resolve(const std::string& other) const {
    check_open();
    return resolve(parse(state_, other));
}

VirtualPath VirtualPath::resolve_sibling(const std::string& other) const {
    auto p = parent();
    if (!p) return parse(state_, other);
    return p->resolve(other);
}

VirtualPath VirtualPath::relativize(const VirtualPath& other) const {
    check_open();
    require_same_file_system(other);
    if (absolute_ != other.absolute_)
        throw FileError(FileError::Kind::Unknown, to_string(), other.to_string(),
                        "cannot relativize absolute and relative paths");
    VirtualPath a = normalize();
    VirtualPath b = other.normalize();
    size_t common = 0;
    while (common < a.segments_.size() && common < b.segments_.size() &&
           a.segments_[common] == b.segments_[common])
        ++common;

    std::vector<std::string> out;
    for (size_t i = common; i < a.segments_.size(); ++i) out.push_back("..");
    for (size_t i = common; i < b.segments_.size(); ++i) out.push_back(b.segments_[i]);
    return VirtualPath(state_, std::move(out), false);
}

bool VirtualPath::starts_with(const VirtualPath& other) const {
    require_same_file_system(other);
    if (absolute_ != other.absolute_ || other.segments_.size() > segments_.size()) return false;
    for (size_t i = 0; i < other.segments_.size(); ++i)
        if (segments_[i] != other.segments_[i]) return false;
    return true;
}

bool VirtualPath::ends_with(const VirtualPath& other) const {
    require_same_file_system(other);
    if (other.absolute_) return *this == other;
    if (other.segments_.size() > segments_.size()) return false;
    size_t offset = segments_.size() - other.segments_.size();
    for (size_t i = 0; i < other.segments_.size(); ++i)
        if (segments_[offset + i] != other.segments_[i]) return false;
    return true;
}

VirtualPath VirtualPath::absolute() const {
    check_open();
    if (absolute_) return *this;
    // 작업 디렉토리는 항상 루트
    return VirtualPath(state_, segments_, true);
}

VirtualPath VirtualPath::normalize() const {
    check_open();
    std::vector<std::string> out;
    for (const auto& s : segments_) {
        if (s == ".") continue;
        if (s == "..") {
            if (!out.empty() && out.back() != "..") {
                out.pop_back();
            } else if (absolute_) {
                throw FileError(FileError::Kind::PathEscapesRoot, to_string());
            } else {
                out.push_back(s);
            }
        } else {
            out.push_back(s);
        }
    }
    return VirtualPath(state_, std::move(out), absolute_);
}

std::string VirtualPath::to_string() const {
    std::string s = absolute_ ? "/" : "";
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i) s.push_back('/');
        s += segments_[i];
    }
    return s;
}

std::string VirtualPath::key() const { return absolute().normalize().to_string(); }

bool VirtualPath::exists() const {
    return state_->find(key()) != nullptr;
}

bool VirtualPath::belongs_to(const EpubFileSystem& fs) const { return fs.state() == state_; }

bool operator==(const VirtualPath& a, const VirtualPath& b) {
    return a.state_ == b.state_ && a.absolute_ == b.absolute_ && a.segments_ == b.segments_;
}

bool operator<(const VirtualPath& a, const VirtualPath& b) {
    if (a.state_ != b.state_) return a.state_.get() < b.state_.get();
    return a.to_string() < b.to_string();
}

} // namespace epubkit
