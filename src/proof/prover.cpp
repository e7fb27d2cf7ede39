/**
 * @file prover.cpp
 * @brief Реализация solve/verify
 */

#include "prover.hpp"
#include "difficulty.hpp"
#include "digest.hpp"

#include <algorithm>
#include <string>

namespace segproof::proof {

std::optional<SelectionPolicy> selection_from_string(std::string_view str) noexcept {
    if (str == "lowest_digest" || str == "lowest" || str == "best") {
        return SelectionPolicy::LowestDigest;
    }
    if (str == "first_found" || str == "first") {
        return SelectionPolicy::FirstFound;
    }
    return std::nullopt;
}

Prover::Prover(
    const puzzle::PuzzleSolver& solver,
    const ProofParams& params,
    SelectionPolicy policy
)
    : solver_(solver)
    , binder_(params)
    , policy_(policy) {}

Result<Solution> Prover::solve(
    ByteSpan challenge,
    ByteSpan data,
    ByteSpan nonce,
    puzzle::SolverArena& arena
) const {
    auto seed = binder_.bind(challenge, data, nonce);
    if (!seed) {
        return std::unexpected(seed.error());
    }

    puzzle::ArenaLease lease(arena);
    if (!lease) {
        return Err<Solution>(ErrorCode::ArenaBusy);
    }
    arena.reset();

    auto candidates = solver_.generate(ByteSpan{seed->data(), seed->size()}, arena);
    if (!candidates) {
        return std::unexpected(candidates.error());
    }
    if (candidates->empty()) {
        return Err<Solution>(ErrorCode::NoSolutionFound);
    }

    Solution best;
    std::copy_n(nonce.begin(), best.nonce.size(), best.nonce.begin());
    bool selected = false;

    for (const auto& raw : *candidates) {
        CanonicalSolution canonical = canonicalize(raw);
        Digest digest = compute_digest(ByteSpan{seed->data(), seed->size()}, canonical, data);

        if (!selected || is_better_digest(digest, best.digest)) {
            best.digest = digest;
            best.solution = canonical;
            selected = true;
        }

        if (policy_ == SelectionPolicy::FirstFound) {
            break;
        }
    }

    return best;
}

Result<Solution> Prover::solve(
    ByteSpan challenge,
    ByteSpan data,
    ByteSpan nonce
) const {
    auto arena = solver_.make_arena();
    if (!arena) {
        return Err<Solution>(ErrorCode::SystemOutOfMemory);
    }
    return solve(challenge, data, nonce, *arena);
}

Result<void> Prover::verify(
    ByteSpan challenge,
    ByteSpan data,
    ByteSpan nonce,
    ByteSpan digest,
    const puzzle::RawSolution& raw_solution
) const {
    auto seed = binder_.bind(challenge, data, nonce);
    if (!seed) {
        return std::unexpected(seed.error());
    }
    if (digest.size() != constants::DIGEST_SIZE) {
        return Err<void>(
            ErrorCode::InvalidDigestLength,
            "Длина digest " + std::to_string(digest.size()) +
            " (ожидается " + std::to_string(constants::DIGEST_SIZE) + ")"
        );
    }

    const ByteSpan seed_span{seed->data(), seed->size()};
    const CanonicalSolution canonical = canonicalize(raw_solution);

    if (!solver_.validate(seed_span, canonical.indices())) {
        return Err<void>(ErrorCode::InvalidSolution);
    }

    Digest claimed{};
    std::copy_n(digest.begin(), claimed.size(), claimed.begin());

    if (!digests_equal(compute_digest(seed_span, canonical, data), claimed)) {
        return Err<void>(ErrorCode::DigestMismatch);
    }

    return {};
}

Result<void> Prover::verify(
    ByteSpan challenge,
    ByteSpan data,
    const Solution& solution
) const {
    return verify(
        challenge,
        data,
        ByteSpan{solution.nonce.data(), solution.nonce.size()},
        ByteSpan{solution.digest.data(), solution.digest.size()},
        solution.solution.indices()
    );
}

} // namespace segproof::proof
