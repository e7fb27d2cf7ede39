/**
 * @file keccak.cpp
 * @brief Программная реализация Keccak-256
 *
 * Перестановка Keccak-f[1600] по спецификации Keccak reference 3.0,
 * sponge с rate 136 байт и padding 0x01 ... 0x80.
 */

#include "keccak.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace segproof::crypto {

// =============================================================================
// Константы Keccak-f[1600]
// =============================================================================

namespace {

/// @brief Константы раундов (шаг iota)
constexpr std::array<uint64_t, 24> ROUND_CONSTANTS = {{
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
}};

/// @brief Смещения вращения (шаг rho) в порядке обхода pi
constexpr std::array<int, 24> ROTATIONS = {{
    1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
    27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44
}};

/// @brief Перестановка позиций (шаг pi)
constexpr std::array<int, 24> PI_LANES = {{
    10, 7,  11, 17, 18, 3,  5,  16, 8,  21, 24, 4,
    15, 23, 19, 13, 12, 2,  20, 14, 22, 9,  6,  1
}};

/// @brief Количество 64-битных слов в rate
constexpr std::size_t RATE_WORDS = constants::KECCAK256_RATE / 8;

/// @brief Domain separator оригинального Keccak
constexpr uint8_t KECCAK_PADDING = 0x01;

} // anonymous namespace

// =============================================================================
// Перестановка
// =============================================================================

void keccak_f1600(KeccakState& state) noexcept {
    uint64_t bc[5];

    for (std::size_t round = 0; round < 24; ++round) {
        // theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                state[j + i] ^= t;
            }
        }

        // rho + pi
        uint64_t t = state[1];
        for (std::size_t i = 0; i < 24; ++i) {
            int j = PI_LANES[i];
            uint64_t tmp = state[j];
            state[j] = std::rotl(t, ROTATIONS[i]);
            t = tmp;
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = state[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // iota
        state[0] ^= ROUND_CONSTANTS[round];
    }
}

// =============================================================================
// Keccak256
// =============================================================================

Keccak256::Keccak256() noexcept {
    reset();
}

void Keccak256::reset() noexcept {
    state_.fill(0);
    buffer_.fill(0);
    buffer_len_ = 0;
}

void Keccak256::absorb_block(const uint8_t* block) noexcept {
    for (std::size_t i = 0; i < RATE_WORDS; ++i) {
        state_[i] ^= read_le64(block + i * 8);
    }
    keccak_f1600(state_);
}

Keccak256& Keccak256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    if (len == 0) {
        return *this;
    }

    // Дополняем частично заполненный буфер
    if (buffer_len_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffer_len_);
        std::memcpy(buffer_.data() + buffer_len_, ptr, take);
        buffer_len_ += take;
        ptr += take;
        len -= take;

        if (buffer_len_ < buffer_.size()) {
            return *this;
        }
        absorb_block(buffer_.data());
        buffer_len_ = 0;
    }

    // Полные блоки напрямую из входа
    while (len >= buffer_.size()) {
        absorb_block(ptr);
        ptr += buffer_.size();
        len -= buffer_.size();
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffer_len_ = len;
    }

    return *this;
}

Hash256 Keccak256::finalize() noexcept {
    // Padding: 0x01 ... 0x80 (pad10*1 с domain separator Keccak)
    std::memset(buffer_.data() + buffer_len_, 0, buffer_.size() - buffer_len_);
    buffer_[buffer_len_] = KECCAK_PADDING;
    buffer_[buffer_.size() - 1] |= 0x80;
    absorb_block(buffer_.data());

    Hash256 out{};
    for (std::size_t i = 0; i < out.size() / 8; ++i) {
        write_le64(out.data() + i * 8, state_[i]);
    }

    reset();
    return out;
}

// =============================================================================
// Функции-обёртки
// =============================================================================

Hash256 keccak256(ByteSpan data) noexcept {
    Keccak256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 keccak256(std::initializer_list<ByteSpan> parts) noexcept {
    Keccak256 hasher;
    for (const auto& part : parts) {
        hasher.update(part);
    }
    return hasher.finalize();
}

} // namespace segproof::crypto
