/**
 * @file challenge_binder.cpp
 * @brief Реализация построения seed
 */

#include "challenge_binder.hpp"

#include <string>

namespace segproof::proof {

ChallengeBinder::ChallengeBinder(const ProofParams& params)
    : params_(params) {}

Result<void> ChallengeBinder::check_inputs(
    ByteSpan challenge,
    ByteSpan data,
    ByteSpan nonce
) const {
    if (challenge.size() != constants::CHALLENGE_SIZE) {
        return Err<void>(
            ErrorCode::InvalidChallengeLength,
            "Длина challenge " + std::to_string(challenge.size()) +
            " (ожидается " + std::to_string(constants::CHALLENGE_SIZE) + ")"
        );
    }
    if (data.size() != params_.segment_size) {
        return Err<void>(
            ErrorCode::InvalidDataLength,
            "Длина сегмента " + std::to_string(data.size()) +
            " (ожидается " + std::to_string(params_.segment_size) + ")"
        );
    }
    if (nonce.size() != constants::NONCE_SIZE) {
        return Err<void>(
            ErrorCode::InvalidNonceLength,
            "Длина nonce " + std::to_string(nonce.size()) +
            " (ожидается " + std::to_string(constants::NONCE_SIZE) + ")"
        );
    }
    return {};
}

Result<Seed> ChallengeBinder::bind(
    ByteSpan challenge,
    ByteSpan data,
    ByteSpan nonce
) const {
    if (auto checked = check_inputs(challenge, data, nonce); !checked) {
        return std::unexpected(checked.error());
    }

    Seed seed;
    seed.reserve(params_.seed_size());
    seed.insert(seed.end(), challenge.begin(), challenge.end());
    seed.insert(seed.end(), data.begin(), data.end());
    seed.insert(seed.end(), nonce.begin(), nonce.end());

    return seed;
}

} // namespace segproof::proof
