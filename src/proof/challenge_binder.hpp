/**
 * @file challenge_binder.hpp
 * @brief Привязка challenge, данных и nonce к seed головоломки
 *
 * seed = challenge || data || nonce
 *
 * В seed входят сырые байты сегмента, а не их хеш: экземпляр головоломки
 * действительно меняется вместе с данными, и подделка по части данных
 * не сводится к коллизии на этом уровне.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <cstddef>

namespace segproof::proof {

/**
 * @brief Параметры протокола доказательства
 */
struct ProofParams {
    /// @brief Фиксированная длина сегмента данных в байтах
    std::size_t segment_size = constants::DEFAULT_SEGMENT_SIZE;

    /**
     * @brief Длина seed для этих параметров
     */
    [[nodiscard]] constexpr std::size_t seed_size() const noexcept {
        return constants::CHALLENGE_SIZE + segment_size + constants::NONCE_SIZE;
    }
};

/**
 * @brief Построитель seed
 *
 * Чистая детерминированная функция без состояния, кроме параметров.
 */
class ChallengeBinder {
public:
    explicit ChallengeBinder(const ProofParams& params);

    /**
     * @brief Проверить длины входных данных
     *
     * @return Result<void> Успех или Invalid*Length
     */
    [[nodiscard]] Result<void> check_inputs(
        ByteSpan challenge,
        ByteSpan data,
        ByteSpan nonce
    ) const;

    /**
     * @brief Построить seed
     *
     * @param challenge Challenge (32 байта)
     * @param data Сегмент данных (segment_size байт)
     * @param nonce Nonce (8 байт)
     * @return Result<Seed> Seed или ошибка длины
     */
    [[nodiscard]] Result<Seed> bind(
        ByteSpan challenge,
        ByteSpan data,
        ByteSpan nonce
    ) const;

    [[nodiscard]] const ProofParams& params() const noexcept { return params_; }

private:
    ProofParams params_;
};

} // namespace segproof::proof
