/**
 * @file solution.cpp
 * @brief Реализация сериализации решения
 */

#include "solution.hpp"
#include "difficulty.hpp"

#include <algorithm>
#include <string>

namespace segproof::proof {

namespace {

constexpr std::size_t DIGEST_OFFSET = 0;
constexpr std::size_t NONCE_OFFSET = DIGEST_OFFSET + constants::DIGEST_SIZE;
constexpr std::size_t SOLUTION_OFFSET = NONCE_OFFSET + constants::NONCE_SIZE;

} // anonymous namespace

uint32_t Solution::difficulty() const noexcept {
    return proof::difficulty(digest);
}

SolutionRecord Solution::to_bytes() const noexcept {
    SolutionRecord record{};
    const SolutionBytes solution_bytes = solution.to_bytes();

    std::copy(digest.begin(), digest.end(), record.begin() + DIGEST_OFFSET);
    std::copy(nonce.begin(), nonce.end(), record.begin() + NONCE_OFFSET);
    std::copy(solution_bytes.begin(), solution_bytes.end(), record.begin() + SOLUTION_OFFSET);

    return record;
}

Result<Solution> Solution::from_bytes(ByteSpan bytes) {
    if (bytes.size() != constants::SOLUTION_RECORD_SIZE) {
        return Err<Solution>(
            ErrorCode::InvalidRecordLength,
            "Длина записи " + std::to_string(bytes.size()) +
            " (ожидается " + std::to_string(constants::SOLUTION_RECORD_SIZE) + ")"
        );
    }

    auto raw = decode_solution(bytes.subspan(SOLUTION_OFFSET, constants::SOLUTION_SIZE));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!is_canonical(*raw)) {
        return Err<Solution>(
            ErrorCode::InvalidSolution,
            "Решение в записи не в канонической форме"
        );
    }

    Solution result;
    std::copy_n(bytes.begin() + DIGEST_OFFSET, constants::DIGEST_SIZE, result.digest.begin());
    std::copy_n(bytes.begin() + NONCE_OFFSET, constants::NONCE_SIZE, result.nonce.begin());
    result.solution = canonicalize(*raw);

    return result;
}

} // namespace segproof::proof
