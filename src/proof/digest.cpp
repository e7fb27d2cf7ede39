/**
 * @file digest.cpp
 * @brief Реализация вычисления digest
 */

#include "digest.hpp"
#include "../crypto/keccak.hpp"

#include <algorithm>

namespace segproof::proof {

Digest compute_digest(
    ByteSpan seed,
    const CanonicalSolution& solution,
    ByteSpan data
) noexcept {
    const SolutionBytes solution_bytes = solution.to_bytes();

    crypto::Keccak256 hasher;
    hasher.update(seed);
    hasher.update(ByteSpan{solution_bytes.data(), solution_bytes.size()});
    hasher.update(data);
    const Hash256 full = hasher.finalize();

    Digest digest{};
    std::copy_n(full.begin(), digest.size(), digest.begin());
    return digest;
}

bool digests_equal(const Digest& a, const Digest& b) noexcept {
    uint8_t diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace segproof::proof
