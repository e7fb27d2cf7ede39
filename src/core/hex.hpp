/**
 * @file hex.hpp
 * @brief Преобразование байт в hex и обратно
 *
 * Используется CLI и конфигурацией для challenge и записей решений.
 */

#pragma once

#include "types.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace segproof {

/**
 * @brief Преобразовать байты в hex строку (нижний регистр, без префикса)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Разобрать hex строку в байты
 *
 * Принимает верхний и нижний регистр. Допускается префикс "0x".
 *
 * @param hex Hex строка чётной длины
 * @return Result<Bytes> Байты или ConfigParseError
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Разобрать hex строку в массив фиксированной длины
 *
 * @return Result<std::array<uint8_t, N>> Массив или ошибка длины
 */
template<std::size_t N>
[[nodiscard]] Result<std::array<uint8_t, N>> from_hex_fixed(std::string_view hex) {
    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (bytes->size() != N) {
        return Err<std::array<uint8_t, N>>(
            ErrorCode::ConfigParseError,
            "Неверная длина hex строки: " + std::to_string(bytes->size()) +
            " байт (ожидается " + std::to_string(N) + ")"
        );
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
}

} // namespace segproof
