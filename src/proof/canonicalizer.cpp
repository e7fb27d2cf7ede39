/**
 * @file canonicalizer.cpp
 * @brief Реализация канонизации решений
 */

#include "canonicalizer.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <string>

namespace segproof::proof {

static_assert((constants::PUZZLE_INDEX_COUNT & (constants::PUZZLE_INDEX_COUNT - 1)) == 0,
              "Количество индексов должно быть степенью двойки");

namespace {

using Iterator = puzzle::RawSolution::iterator;
using ConstIterator = puzzle::RawSolution::const_iterator;

/**
 * @brief Правый блок строго меньше левого?
 */
bool right_is_smaller(ConstIterator left, ConstIterator right, std::size_t width) noexcept {
    return std::lexicographical_compare(right, right + width, left, left + width);
}

} // anonymous namespace

SolutionBytes CanonicalSolution::to_bytes() const noexcept {
    return encode_solution(indices_);
}

CanonicalSolution canonicalize(const puzzle::RawSolution& raw) noexcept {
    puzzle::RawSolution sorted = raw;

    for (std::size_t width = 1; width < sorted.size(); width *= 2) {
        for (std::size_t block = 0; block < sorted.size(); block += 2 * width) {
            Iterator left = sorted.begin() + static_cast<std::ptrdiff_t>(block);
            Iterator right = left + static_cast<std::ptrdiff_t>(width);
            if (right_is_smaller(left, right, width)) {
                std::swap_ranges(left, right, right);
            }
        }
    }

    return CanonicalSolution{sorted};
}

bool is_canonical(const puzzle::RawSolution& raw) noexcept {
    return canonicalize(raw).indices() == raw;
}

SolutionBytes encode_solution(const puzzle::RawSolution& raw) noexcept {
    SolutionBytes bytes{};
    for (std::size_t i = 0; i < raw.size(); ++i) {
        write_le16(bytes.data() + i * sizeof(uint16_t), raw[i]);
    }
    return bytes;
}

Result<puzzle::RawSolution> decode_solution(ByteSpan bytes) {
    if (bytes.size() != constants::SOLUTION_SIZE) {
        return Err<puzzle::RawSolution>(
            ErrorCode::InvalidSolution,
            "Длина решения " + std::to_string(bytes.size()) +
            " (ожидается " + std::to_string(constants::SOLUTION_SIZE) + ")"
        );
    }

    puzzle::RawSolution raw{};
    for (std::size_t i = 0; i < raw.size(); ++i) {
        raw[i] = read_le16(bytes.data() + i * sizeof(uint16_t));
    }
    return raw;
}

} // namespace segproof::proof
