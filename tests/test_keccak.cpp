/**
 * @file test_keccak.cpp
 * @brief Тесты Keccak-256 реализации
 * 
 * Проверяет исходный Keccak (padding 0x01), а не SHA3-256 (padding 0x06).
 */

#include <gtest/gtest.h>
#include <string>
#include <string_view>

#include "crypto/keccak.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace segproof::tests {

namespace {

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // anonymous namespace

class Keccak256Test : public ::testing::Test {};

/**
 * @brief Тест: пустое сообщение
 */
TEST_F(Keccak256Test, EmptyMessage) {
    auto hash = crypto::keccak256(ByteSpan{});
    
    EXPECT_EQ(to_hex(hash),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

/**
 * @brief Тест: "abc"
 */
TEST_F(Keccak256Test, Abc) {
    auto hash = crypto::keccak256(as_bytes("abc"));
    
    EXPECT_EQ(to_hex(hash),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

/**
 * @brief Тест: ровно один блок rate (136 байт)
 * 
 * Padding занимает целый дополнительный блок.
 */
TEST_F(Keccak256Test, ExactlyOneRateBlock) {
    std::string input(136, 'a');
    auto hash = crypto::keccak256(as_bytes(input));
    
    EXPECT_EQ(to_hex(hash),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
}

/**
 * @brief Тест: сообщение длиннее одного блока
 */
TEST_F(Keccak256Test, MultiBlock) {
    std::string input(200, 'a');
    auto hash = crypto::keccak256(as_bytes(input));
    
    EXPECT_EQ(to_hex(hash),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

/**
 * @brief Тест: потоковое хеширование кусками совпадает с однократным
 */
TEST_F(Keccak256Test, StreamingMatchesOneShot) {
    std::string input(200, 'a');
    auto expected = crypto::keccak256(as_bytes(input));
    
    crypto::Keccak256 hasher;
    hasher.update(as_bytes(std::string_view(input).substr(0, 1)));
    hasher.update(as_bytes(std::string_view(input).substr(1, 134)));
    hasher.update(ByteSpan{});
    hasher.update(as_bytes(std::string_view(input).substr(135)));
    
    EXPECT_EQ(hasher.finalize(), expected);
}

/**
 * @brief Тест: finalize сбрасывает хешер
 */
TEST_F(Keccak256Test, FinalizeResets) {
    crypto::Keccak256 hasher;
    hasher.update(as_bytes("abc"));
    (void)hasher.finalize();
    
    hasher.update(as_bytes("abc"));
    EXPECT_EQ(hasher.finalize(), crypto::keccak256(as_bytes("abc")));
}

/**
 * @brief Тест: хеш списка буферов равен хешу конкатенации
 */
TEST_F(Keccak256Test, PartsEqualConcatenation) {
    EXPECT_EQ(crypto::keccak256({as_bytes("a"), as_bytes("b"), as_bytes("c")}),
              crypto::keccak256(as_bytes("abc")));
}

} // namespace segproof::tests
