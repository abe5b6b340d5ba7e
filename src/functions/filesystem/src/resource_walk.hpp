#pragma once
#include <cstddef>
#include <limits>
#include <optional>

#include "file_error.hpp"
#include "resource.hpp"

namespace epubkit {

// 콜백이 FileError 를 돌려주면 순회는 그 자리에서 멈추고 그 에러가 walk 결과가 된다.
// nullopt 는 계속 진행. 콜백 안에서 예외를 던지지 말 것
class ResourceVisitor {
public:
    // visit_nil 이 어느 단계에서 불렸는지
    enum class Stage {
        PreVisitDirectory,
        VisitFile,
        VisitFileFailed,
        PostVisitDirectory,
    };

    virtual ~ResourceVisitor() = default;

    virtual std::optional<FileError> pre_visit_directory(const Directory& directory);
    virtual std::optional<FileError> visit_file(const File& file);
    virtual std::optional<FileError> visit_file_failed(const File& file, const FileError& error);
    virtual std::optional<FileError> post_visit_directory(const Directory& directory,
                                                          const std::optional<FileError>& error);
    // 앞 단계에서 지워져서 더 이상 없는 항목
    virtual std::optional<FileError> visit_nil(const Nil& nil, Stage stage,
                                               const std::optional<FileError>& error);
};

std::optional<FileError> walk_file_tree(
    const Directory& start, ResourceVisitor& visitor,
    std::size_t max_depth = std::numeric_limits<std::size_t>::max());

} // namespace epubkit
