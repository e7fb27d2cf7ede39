/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

namespace segproof {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // anonymous namespace

std::string to_hex(ByteSpan data) {
    std::string hex;
    hex.reserve(data.size() * 2);

    for (uint8_t byte : data) {
        hex += HEX_DIGITS[byte >> 4];
        hex += HEX_DIGITS[byte & 0x0F];
    }

    return hex;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    if (hex.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::ConfigParseError,
            "Нечётная длина hex строки: " + std::to_string(hex.size())
        );
    }

    Bytes out;
    out.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(
                ErrorCode::ConfigParseError,
                "Неверный символ в hex строке на позиции " + std::to_string(hi < 0 ? i : i + 1)
            );
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return out;
}

} // namespace segproof
