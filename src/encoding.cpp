// SolX Trading SDK - Text Encodings Implementation

#include <solx/trading/encoding.hpp>
#include <openssl/evp.h>

namespace solx::trading {

// =============================================================================
// base58
// =============================================================================

std::string base58_encode(const uint8_t* data, std::size_t size) {
    std::size_t zeros = 0;
    while (zeros < size && data[zeros] == 0) ++zeros;

    // log(256) / log(58) ~= 1.366
    std::vector<uint8_t> digits((size - zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = zeros; i < size; ++i) {
        int carry = data[i];
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) out.push_back(BASE58_ALPHABET[*it]);
    return out;
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    return base58_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base58_decode(std::string_view text) {
    std::size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') ++ones;

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = ones; i < text.size(); ++i) {
        int carry = detail::base58_digit(text[i]);
        if (carry < 0) return std::nullopt;
        std::size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) ++it;

    std::vector<uint8_t> out(ones, 0);
    out.insert(out.end(), it, bytes.end());
    return out;
}

// =============================================================================
// base64
// =============================================================================

std::string base64_encode(const uint8_t* data, std::size_t size) {
    if (size == 0) return {};
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    std::string padded(text);
    while (!padded.empty() && (padded.back() == '\n' || padded.back() == '\r' || padded.back() == ' ')) {
        padded.pop_back();
    }
    if (padded.empty()) return std::vector<uint8_t>{};
    if (padded.size() % 4 == 1) return std::nullopt;
    while (padded.size() % 4 != 0) padded.push_back('=');

    std::size_t padding = 0;
    if (padded[padded.size() - 1] == '=') ++padding;
    if (padded[padded.size() - 2] == '=') ++padding;

    std::vector<uint8_t> out(padded.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) return std::nullopt;
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

// =============================================================================
// hex
// =============================================================================

std::string hex_encode(const uint8_t* data, std::size_t size) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0f]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> hex_decode(std::string_view text) {
    if (text.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace solx::trading
