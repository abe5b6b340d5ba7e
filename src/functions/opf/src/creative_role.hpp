#pragma once
#include <optional>
#include <string>
#include <vector>

namespace epubkit {

// 저자/기여자 역할. 모르는 코드는 "oth." 가 붙은 사용자 정의 역할이 된다
class CreativeRole {
public:
    static CreativeRole create(const std::string& code, std::optional<std::string> name = std::nullopt);
    static std::vector<CreativeRole> defaults();

    const std::string& code() const { return code_; }
    const std::optional<std::string>& name() const { return name_; }
    bool is_custom() const;

private:
    CreativeRole(std::string code, std::optional<std::string> name)
        : code_(std::move(code)), name_(std::move(name)) {}

    std::string code_;
    std::optional<std::string> name_;
};

bool operator==(const CreativeRole& a, const CreativeRole& b);
bool operator!=(const CreativeRole& a, const CreativeRole& b);

} // namespace epubkit
