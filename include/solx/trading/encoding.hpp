// SolX Trading SDK - Text Encodings
// base58 (keys, signatures), base64 (RPC payloads), hex

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace solx::trading {

inline constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string base58_encode(const uint8_t* data, std::size_t size);
std::string base58_encode(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> base58_decode(std::string_view text);

std::string base64_encode(const uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

std::string hex_encode(const uint8_t* data, std::size_t size);
std::optional<std::vector<uint8_t>> hex_decode(std::string_view text);

namespace detail {

constexpr int base58_digit(char c) noexcept {
    for (std::size_t i = 0; i < BASE58_ALPHABET.size(); ++i) {
        if (BASE58_ALPHABET[i] == c) return static_cast<int>(i);
    }
    return -1;
}

// Fixed-width base58 decode usable in constant expressions
template <std::size_t N>
constexpr std::array<uint8_t, N> base58_literal(const char* text) {
    std::array<uint8_t, N> out{};
    for (; *text != '\0'; ++text) {
        int carry = base58_digit(*text);
        if (carry < 0) throw std::invalid_argument("invalid base58 character");
        for (std::size_t i = N; i-- > 0;) {
            carry += 58 * out[i];
            out[i] = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        if (carry != 0) throw std::invalid_argument("base58 literal overflows key size");
    }
    return out;
}

}  // namespace detail

}  // namespace solx::trading
