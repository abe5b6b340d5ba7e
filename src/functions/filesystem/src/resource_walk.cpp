#include "resource_walk.hpp"
#include "file_system_state.hpp"

namespace epubkit {

std::optional<FileError> ResourceVisitor::pre_visit_directory(const Directory&) { return std::nullopt; }

std::optional<FileError> ResourceVisitor::visit_file(const File&) { return std::nullopt; }

std::optional<FileError> ResourceVisitor::visit_file_failed(const File&, const FileError& error) {
    return error;
}

std::optional<FileError> ResourceVisitor::post_visit_directory(const Directory&,
                                                               const std::optional<FileError>& error) {
    return error;
}

std::optional<FileError> ResourceVisitor::visit_nil(const Nil&, Stage stage,
                                                    const std::optional<FileError>& error) {
    if (stage == Stage::VisitFileFailed || stage == Stage::PostVisitDirectory) return error;
    return std::nullopt;
}

// ---- 순회 ----
static std::optional<FileError> walk_directory(const Directory& directory, ResourceVisitor& visitor,
                                               std::size_t depth, std::size_t max_depth) {
    if (auto error = visitor.pre_visit_directory(directory)) return error;

    if (depth < max_depth) {
        // 방문 중에 지워지는 항목이 있으므로 목록은 미리 떠 둔다
        std::vector<std::string> keys =
            directory.path().state()->children(directory.path().to_string());
        for (const auto& key : keys) {
            Resource entry = classify(directory.path().resolve(key));
            std::optional<FileError> error;
            if (const Nil* nil = std::get_if<Nil>(&entry)) {
                error = visitor.visit_nil(*nil, ResourceVisitor::Stage::VisitFile, std::nullopt);
            } else if (const File* file = std::get_if<File>(&entry)) {
                std::optional<FileError> failure;
                try {
                    file->file_size();
                } catch (const FileError& e) {
                    failure = e;
                }
                error = failure ? visitor.visit_file_failed(*file, *failure) : visitor.visit_file(*file);
            } else {
                error = walk_directory(std::get<Directory>(entry), visitor, depth + 1, max_depth);
            }
            if (error) return error;
        }
    }

    Resource self = classify(directory.path());
    if (const Nil* nil = std::get_if<Nil>(&self))
        return visitor.visit_nil(*nil, ResourceVisitor::Stage::PostVisitDirectory, std::nullopt);
    return visitor.post_visit_directory(std::get<Directory>(self), std::nullopt);
}

std::optional<FileError> walk_file_tree(const Directory& start, ResourceVisitor& visitor,
                                        std::size_t max_depth) {
    try {
        Resource self = classify(start.path());
        if (const Nil* nil = std::get_if<Nil>(&self))
            return visitor.visit_nil(*nil, ResourceVisitor::Stage::PreVisitDirectory, std::nullopt);
        if (std::holds_alternative<File>(self))
            return FileError(FileError::Kind::NotDirectory, start.path().to_string());
        return walk_directory(std::get<Directory>(self), visitor, 0, max_depth);
    } catch (const FileError& e) {
        // 목록 조회나 분류 중 실패 (닫힌 파일시스템 등)
        return e;
    }
}

// ---- 순회 기반 디렉토리 작업 ----
namespace {

class SizeCalculator : public ResourceVisitor {
public:
    std::optional<FileError> visit_file(const File& file) override {
        try {
            total += file.file_size();
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }

    BigUnsigned total;
};

class EntryCopier : public ResourceVisitor {
public:
    EntryCopier(const Directory& source, const Directory& target, bool overwrite, bool move)
        : source_(source), target_(target), overwrite_(overwrite), move_(move) {}

    std::optional<FileError> pre_visit_directory(const Directory& directory) override {
        try {
            Resource dest = destination_of(directory);
            if (std::holds_alternative<Directory>(dest)) return std::nullopt;
            if (const File* file = std::get_if<File>(&dest))
                return FileError(FileError::Kind::NotDirectory, file->path().to_string(),
                                 directory.path().to_string(), "a file exists where a directory is expected");
            std::get<Nil>(dest).create_directory();
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }

    std::optional<FileError> visit_file(const File& file) override {
        try {
            Resource dest = destination_of(file);
            if (const Directory* dir = std::get_if<Directory>(&dest))
                return FileError(FileError::Kind::NotFile, dir->path().to_string(),
                                 file.path().to_string(), "a directory exists where a file is expected");
            if (move_) file.move_to(dest, overwrite_);
            else file.copy_to(dest, overwrite_);
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }

    std::optional<FileError> post_visit_directory(const Directory& directory,
                                                  const std::optional<FileError>& error) override {
        if (error) return error;
        if (!move_) return std::nullopt;
        try {
            // 옮기고 난 빈 원본 디렉토리 정리
            if (directory.is_empty()) directory.remove();
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }

private:
    Resource destination_of(const Resource& resource) const {
        VirtualPath relative = source_.path().relativize(path_of(resource));
        return classify(target_.path().resolve(relative));
    }

    Directory source_;
    Directory target_;
    bool overwrite_;
    bool move_;
};

class RecursiveDeleter : public ResourceVisitor {
public:
    std::optional<FileError> visit_file(const File& file) override {
        try {
            file.remove();
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }

    std::optional<FileError> post_visit_directory(const Directory& directory,
                                                  const std::optional<FileError>& error) override {
        if (error) return error;
        try {
            directory.remove();
        } catch (const FileError& e) {
            return e;
        }
        return std::nullopt;
    }
};

} // namespace

std::uint64_t Directory::calculate_directory_size() const {
    BigUnsigned total = calculate_large_directory_size();
    if (!total.fits_u64())
        throw FileError(FileError::Kind::Unknown, path_.to_string(), {},
                        "directory size exceeds 64 bits: " + total.to_string());
    return total.to_u64();
}

BigUnsigned Directory::calculate_large_directory_size() const {
    SizeCalculator calculator;
    if (auto error = walk_file_tree(*this, calculator)) throw *error;
    return calculator.total;
}

Directory Directory::copy_entries_to(const Directory& target, bool overwrite) const {
    target.require(kModifiable);
    if (target.path().state() != path_.state()) throw ForeignPathError(target.path().to_string());
    if (target.path().starts_with(path_) && target.path() != path_)
        throw FileError(FileError::Kind::Unknown, path_.to_string(), target.path().to_string(),
                        "cannot copy a directory into itself");
    EntryCopier copier(*this, target, overwrite, false);
    if (auto error = walk_file_tree(*this, copier)) throw *error;
    return require_directory(target.path());
}

Directory Directory::move_recursively_to(const Directory& target, bool overwrite) const {
    require(kModifiable);
    require(kDeletable);
    target.require(kModifiable);
    if (target.path().state() != path_.state()) throw ForeignPathError(target.path().to_string());
    if (target.path().starts_with(path_))
        throw FileError(FileError::Kind::Unknown, path_.to_string(), target.path().to_string(),
                        "cannot move a directory into itself");
    EntryCopier mover(*this, target, overwrite, true);
    if (auto error = walk_file_tree(*this, mover)) throw *error;
    return require_directory(target.path());
}

Nil Directory::delete_recursively() const {
    require(kDeletable);
    RecursiveDeleter deleter;
    if (auto error = walk_file_tree(*this, deleter)) throw *error;
    return std::get<Nil>(classify(path_));
}

} // namespace epubkit
