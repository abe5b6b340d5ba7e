#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace epubkit {

// 64비트를 넘는 디렉토리 크기 합산용. 덧셈과 10진 출력만 지원
class BigUnsigned {
public:
    BigUnsigned() = default;
    explicit BigUnsigned(std::uint64_t value);

    BigUnsigned& operator+=(std::uint64_t value);
    BigUnsigned& operator+=(const BigUnsigned& other);

    bool fits_u64() const;
    // fits_u64() 가 false 면 std::overflow_error
    std::uint64_t to_u64() const;
    std::string to_string() const;

    friend bool operator==(const BigUnsigned& a, const BigUnsigned& b) { return a.limbs_ == b.limbs_; }
    friend bool operator!=(const BigUnsigned& a, const BigUnsigned& b) { return !(a == b); }

private:
    void trim();

    // little endian, 32비트 단위
    std::vector<std::uint32_t> limbs_;
};

} // namespace epubkit
