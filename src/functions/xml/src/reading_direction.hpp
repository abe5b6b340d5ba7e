#pragma once
#include <optional>
#include <string>

namespace epubkit {

enum class ReadingDirection {
    LeftToRight,
    RightToLeft,
    Default,
};

// "ltr" / "rtl" / "default". 그 외는 nullopt
std::optional<ReadingDirection> parse_reading_direction(const std::string& value);
const char* to_string(ReadingDirection direction);

} // namespace epubkit
