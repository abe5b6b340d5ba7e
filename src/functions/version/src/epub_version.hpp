#pragma once
#include <stdexcept>
#include <string>

namespace epubkit {

// package/@version 값. patch 가 없으면 0
struct EpubVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    std::string to_string() const;
};

bool operator==(const EpubVersion& a, const EpubVersion& b);
bool operator!=(const EpubVersion& a, const EpubVersion& b);
bool operator<(const EpubVersion& a, const EpubVersion& b);
bool operator<=(const EpubVersion& a, const EpubVersion& b);
bool operator>(const EpubVersion& a, const EpubVersion& b);
bool operator>=(const EpubVersion& a, const EpubVersion& b);

enum class Format {
    Unknown,      // [0, 2.0)
    Epub2_0,      // [2.0, 3.0)
    Epub3_0,      // [3.0, 3.1)
    Epub3_1,      // [3.1, 3.2), 거부
    Epub3_2,      // [3.2, 4.0)
    NotSupported, // >= 4.0
};

const char* to_string(Format format);

class VersionError : public std::runtime_error {
public:
    enum class Kind {
        Blank,
        Malformed,
        Withdrawn,     // 3.1
        NotSupported,  // >= 4.0
    };

    VersionError(Kind kind, std::string value, const std::string& message);

    Kind kind() const noexcept { return kind_; }
    const std::string& value() const noexcept { return value_; }

private:
    Kind kind_;
    std::string value_;
};

// "major.minor" 또는 "major.minor.patch", 숫자만
EpubVersion parse_version(const std::string& text);

// 구간 매핑. 예외 없음
Format format_of(const EpubVersion& version);

// Epub3_1 이면 VersionError(Withdrawn). NotSupported 는 그대로 돌려준다
Format resolve(const EpubVersion& version);
Format resolve(const std::string& text);

// 문서 읽기/버전 변경에 쓸 수 있는 포맷인지 확인. 아니면 VersionError
Format require_supported(const EpubVersion& version);

bool is_epub2(Format format);
bool is_epub3(Format format);
bool supports_epub3_features(Format format);

} // namespace epubkit
