// SolX Trading SDK - Borsh Serialization
// Little-endian reader/writer for on-chain account, event and instruction layouts

#pragma once

#include <solx/trading/types.hpp>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>

namespace solx::trading {

// Sequential reader. A short read sets a sticky failure flag and yields zero values,
// so decoders read every field and check ok() once at the end.
class BorshReader {
public:
    BorshReader(const uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}
    explicit BorshReader(const Bytes& data) noexcept : BorshReader(data.data(), data.size()) {}

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return ok_ ? size_ - offset_ : 0; }
    [[nodiscard]] const uint8_t* cursor() const noexcept { return data_ + offset_; }

    uint8_t u8() { return read_le<uint8_t>(); }
    uint16_t u16() { return read_le<uint16_t>(); }
    uint32_t u32() { return read_le<uint32_t>(); }
    uint64_t u64() { return read_le<uint64_t>(); }
    int64_t i64() { return static_cast<int64_t>(read_le<uint64_t>()); }
    bool boolean() { return u8() != 0; }

    Pubkey pubkey() {
        if (!take(32)) return Pubkey{};
        return Pubkey::from_bytes(data_ + offset_ - 32);
    }

    std::array<uint8_t, 8> discriminator() {
        std::array<uint8_t, 8> out{};
        if (take(8)) std::memcpy(out.data(), data_ + offset_ - 8, 8);
        return out;
    }

    // u32 length-prefixed UTF-8
    std::string string(std::size_t max_len = 1024) {
        uint32_t len = u32();
        if (!ok_ || len > max_len || !take(len)) {
            ok_ = false;
            return {};
        }
        return std::string(reinterpret_cast<const char*>(data_ + offset_ - len), len);
    }

    Bytes bytes(std::size_t n) {
        if (!take(n)) return {};
        return Bytes(data_ + offset_ - n, data_ + offset_);
    }

    void skip(std::size_t n) { take(n); }

    // Solana short_vec (compact-u16) length
    uint16_t compact_u16() {
        uint32_t value = 0;
        for (int i = 0; i < 3; ++i) {
            uint8_t byte = u8();
            if (!ok_) return 0;
            value |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
            if ((byte & 0x80) == 0) {
                if (value > 0xffff) ok_ = false;
                return static_cast<uint16_t>(value);
            }
        }
        ok_ = false;
        return 0;
    }

private:
    bool take(std::size_t n) noexcept {
        if (!ok_ || size_ - offset_ < n) {
            ok_ = false;
            return false;
        }
        offset_ += n;
        return true;
    }

    template <typename T>
    T read_le() {
        if (!take(sizeof(T))) return T{};
        T value{};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(static_cast<T>(data_[offset_ - sizeof(T) + i]) << (8 * i));
        }
        return value;
    }

    const uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
    bool ok_ = true;
};

class BorshWriter {
public:
    BorshWriter() = default;

    BorshWriter& u8(uint8_t v) { buf_.push_back(v); return *this; }
    BorshWriter& u16(uint16_t v) { return write_le(v); }
    BorshWriter& u32(uint32_t v) { return write_le(v); }
    BorshWriter& u64(uint64_t v) { return write_le(v); }
    BorshWriter& i64(int64_t v) { return write_le(static_cast<uint64_t>(v)); }
    BorshWriter& boolean(bool v) { return u8(v ? 1 : 0); }

    BorshWriter& pubkey(const Pubkey& key) {
        buf_.insert(buf_.end(), key.bytes().begin(), key.bytes().end());
        return *this;
    }

    BorshWriter& raw(const uint8_t* data, std::size_t size) {
        buf_.insert(buf_.end(), data, data + size);
        return *this;
    }

    template <std::size_t N>
    BorshWriter& raw(const std::array<uint8_t, N>& bytes) {
        return raw(bytes.data(), N);
    }

    BorshWriter& string(std::string_view s) {
        u32(static_cast<uint32_t>(s.size()));
        return raw(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    BorshWriter& compact_u16(uint16_t v) {
        uint32_t rem = v;
        while (true) {
            uint8_t byte = rem & 0x7f;
            rem >>= 7;
            if (rem == 0) {
                buf_.push_back(byte);
                return *this;
            }
            buf_.push_back(byte | 0x80);
        }
    }

    [[nodiscard]] const Bytes& data() const noexcept { return buf_; }
    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
    Bytes take() { return std::move(buf_); }

private:
    template <typename T>
    BorshWriter& write_le(T v) {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
        }
        return *this;
    }

    Bytes buf_;
};

}  // namespace solx::trading
