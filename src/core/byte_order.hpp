/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Все многобайтовые поля доказательства (индексы решения, nonce из счётчика,
 * слова состояния Keccak) кодируются в little-endian независимо от хоста,
 * чтобы digest воспроизводился на любой машине.
 *
 * @note Все функции помечены noexcept так как не выбрасывают исключений.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

namespace segproof {

// =============================================================================
// Concepts для числовых типов
// =============================================================================

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

// =============================================================================
// Детекция порядка байт системы
// =============================================================================

/**
 * @brief Проверка: система little-endian?
 */
[[nodiscard]] consteval bool is_little_endian() noexcept {
    return std::endian::native == std::endian::little;
}

// =============================================================================
// Преобразование порядка байт
// =============================================================================

/**
 * @brief Поменять порядок байт (byte swap)
 *
 * @tparam T Тип целого числа (uint16_t, uint32_t, uint64_t)
 * @param value Значение для преобразования
 * @return Значение с обратным порядком байт
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(((value & 0x00FF) << 8) |
                              ((value & 0xFF00) >> 8));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(((value & 0x000000FF) << 24) |
                              ((value & 0x0000FF00) << 8)  |
                              ((value & 0x00FF0000) >> 8)  |
                              ((value & 0xFF000000) >> 24));
    } else { // sizeof(T) == 8
        return static_cast<T>(((value & 0x00000000000000FFULL) << 56) |
                              ((value & 0x000000000000FF00ULL) << 40) |
                              ((value & 0x0000000000FF0000ULL) << 24) |
                              ((value & 0x00000000FF000000ULL) << 8)  |
                              ((value & 0x000000FF00000000ULL) >> 8)  |
                              ((value & 0x0000FF0000000000ULL) >> 24) |
                              ((value & 0x00FF000000000000ULL) >> 40) |
                              ((value & 0xFF00000000000000ULL) >> 56));
    }
}

/**
 * @brief Преобразовать число из формата хоста в little-endian
 *
 * На little-endian системах (x86) - ничего не делает.
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (is_little_endian()) {
        return value;
    } else {
        return byte_swap(value);
    }
}

/**
 * @brief Преобразовать число из little-endian в формат хоста
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T from_little_endian(T value) noexcept {
    return to_little_endian(value); // Симметричная операция
}

// =============================================================================
// Чтение/запись из/в байтовый массив
// =============================================================================

/**
 * @brief Записать uint16_t в little-endian формате
 *
 * @param dest Указатель на буфер (минимум 2 байта)
 * @param value Значение для записи
 */
inline void write_le16(uint8_t* dest, uint16_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Записать uint64_t в little-endian формате
 *
 * @param dest Указатель на буфер (минимум 8 байт)
 * @param value Значение для записи
 */
inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать uint16_t из little-endian буфера
 *
 * @param src Указатель на буфер (минимум 2 байта)
 * @return Значение в формате хоста
 */
[[nodiscard]] inline uint16_t read_le16(const uint8_t* src) noexcept {
    uint16_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_little_endian(value);
}

/**
 * @brief Прочитать uint64_t из little-endian буфера
 *
 * @param src Указатель на буфер (минимум 8 байт)
 * @return Значение в формате хоста
 */
[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_little_endian(value);
}

} // namespace segproof
