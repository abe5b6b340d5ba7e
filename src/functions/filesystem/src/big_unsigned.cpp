#include "big_unsigned.hpp"
#include <algorithm>
#include <stdexcept>

namespace epubkit {

BigUnsigned::BigUnsigned(std::uint64_t value) { *this += value; }

BigUnsigned& BigUnsigned::operator+=(std::uint64_t value) {
    BigUnsigned other;
    other.limbs_ = {static_cast<std::uint32_t>(value), static_cast<std::uint32_t>(value >> 32)};
    other.trim();
    return *this += other;
}

BigUnsigned& BigUnsigned::operator+=(const BigUnsigned& other) {
    if (limbs_.size() < other.limbs_.size()) limbs_.resize(other.limbs_.size(), 0);
    std::uint64_t carry = 0;
    for (size_t i = 0; i < limbs_.size(); ++i) {
        std::uint64_t sum = carry + limbs_[i] + (i < other.limbs_.size() ? other.limbs_[i] : 0);
        limbs_[i] = static_cast<std::uint32_t>(sum);
        carry = sum >> 32;
    }
    if (carry) limbs_.push_back(static_cast<std::uint32_t>(carry));
    return *this;
}

void BigUnsigned::trim() {
    while (!limbs_.empty() && limbs_.back() == 0) limbs_.pop_back();
}

bool BigUnsigned::fits_u64() const { return limbs_.size() <= 2; }

std::uint64_t BigUnsigned::to_u64() const {
    if (!fits_u64()) throw std::overflow_error("value exceeds 64 bits: " + to_string());
    std::uint64_t v = 0;
    if (limbs_.size() > 1) v = static_cast<std::uint64_t>(limbs_[1]) << 32;
    if (!limbs_.empty()) v |= limbs_[0];
    return v;
}

std::string BigUnsigned::to_string() const {
    if (limbs_.empty()) return "0";
    std::vector<std::uint32_t> n(limbs_);
    std::string out;
    // 10^9 로 나누면서 아래 자리부터
    while (!n.empty()) {
        std::uint64_t rem = 0;
        for (size_t i = n.size(); i-- > 0;) {
            std::uint64_t cur = (rem << 32) | n[i];
            n[i] = static_cast<std::uint32_t>(cur / 1000000000u);
            rem = cur % 1000000000u;
        }
        while (!n.empty() && n.back() == 0) n.pop_back();
        std::string chunk = std::to_string(rem);
        if (!n.empty()) chunk.insert(0, 9 - chunk.size(), '0');
        out.insert(0, chunk);
    }
    return out;
}

} // namespace epubkit
