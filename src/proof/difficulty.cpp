/**
 * @file difficulty.cpp
 * @brief Реализация оценки сложности
 */

#include "difficulty.hpp"

#include <algorithm>
#include <bit>

namespace segproof::proof {

uint32_t difficulty(const Digest& digest) noexcept {
    uint32_t count = 0;
    for (uint8_t byte : digest) {
        if (byte == 0) {
            count += 8;
            continue;
        }
        count += static_cast<uint32_t>(std::countl_zero(byte));
        break;
    }
    return count;
}

bool meets_difficulty(const Digest& digest, uint32_t min_difficulty) noexcept {
    return difficulty(digest) >= min_difficulty;
}

bool is_better_digest(const Digest& a, const Digest& b) noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

} // namespace segproof::proof
