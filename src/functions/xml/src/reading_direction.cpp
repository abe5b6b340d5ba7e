#include "reading_direction.hpp"

namespace epubkit {

std::optional<ReadingDirection> parse_reading_direction(const std::string& value) {
    if (value == "ltr") return ReadingDirection::LeftToRight;
    if (value == "rtl") return ReadingDirection::RightToLeft;
    if (value == "default") return ReadingDirection::Default;
    return std::nullopt;
}

const char* to_string(ReadingDirection direction) {
    switch (direction) {
        case ReadingDirection::LeftToRight: return "ltr";
        case ReadingDirection::RightToLeft: return "rtl";
        case ReadingDirection::Default:     return "default";
    }
    return "default";
}

} // namespace epubkit
