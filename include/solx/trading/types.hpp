// SolX Trading SDK - Core Types
// Fixed-size keys, protocol tags and instruction structures

#pragma once

#include <solx/trading/encoding.hpp>
#include <solx/trading/errors.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solx::trading {

using Bytes = std::vector<uint8_t>;

// Fixed-size byte string rendered as base58 (keys, hashes, signatures)
template <std::size_t N, typename Tag>
class FixedBytes {
public:
    static constexpr std::size_t SIZE = N;

    constexpr FixedBytes() noexcept : bytes_{} {}
    constexpr explicit FixedBytes(const std::array<uint8_t, N>& bytes) noexcept : bytes_(bytes) {}

    static FixedBytes from_bytes(const uint8_t* data) noexcept {
        FixedBytes out;
        std::memcpy(out.bytes_.data(), data, N);
        return out;
    }

    // Throws ValidationError on bad input
    static FixedBytes from_base58(std::string_view text);

    static std::optional<FixedBytes> parse(std::string_view text) {
        auto raw = base58_decode(text);
        if (!raw || raw->size() != N) return std::nullopt;
        return from_bytes(raw->data());
    }

    [[nodiscard]] std::string to_base58() const { return base58_encode(bytes_.data(), N); }
    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept { return bytes_; }
    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_default() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    bool operator==(const FixedBytes& rhs) const noexcept { return bytes_ == rhs.bytes_; }
    bool operator!=(const FixedBytes& rhs) const noexcept { return bytes_ != rhs.bytes_; }
    bool operator<(const FixedBytes& rhs) const noexcept { return bytes_ < rhs.bytes_; }

private:
    std::array<uint8_t, N> bytes_;
};

struct PubkeyTag {};
struct HashTag {};
struct SignatureTag {};

using Pubkey = FixedBytes<32, PubkeyTag>;
using Hash = FixedBytes<32, HashTag>;
using Signature = FixedBytes<64, SignatureTag>;

template <std::size_t N, typename Tag>
FixedBytes<N, Tag> FixedBytes<N, Tag>::from_base58(std::string_view text) {
    auto parsed = parse(text);
    if (!parsed) {
        throw ValidationError("invalid base58 value: '" + std::string(text) + "'");
    }
    return *parsed;
}

// Compile-time pubkey from a base58 literal
constexpr Pubkey pubkey_literal(const char* base58) {
    return Pubkey(detail::base58_literal<32>(base58));
}

struct PubkeyHasher {
    std::size_t operator()(const Pubkey& key) const noexcept {
        std::size_t h;
        std::memcpy(&h, key.data(), sizeof(h));
        return h;
    }
};

// Supported on-chain programs
enum class ProtocolTag : uint8_t {
    PumpFun = 0,
    PumpSwap = 1,
    Bonk = 2
};

inline constexpr std::array<ProtocolTag, 3> ALL_PROTOCOLS = {
    ProtocolTag::PumpFun, ProtocolTag::PumpSwap, ProtocolTag::Bonk};

inline constexpr const char* to_string(ProtocolTag p) noexcept {
    switch (p) {
        case ProtocolTag::PumpFun: return "pumpfun";
        case ProtocolTag::PumpSwap: return "pumpswap";
        case ProtocolTag::Bonk: return "bonk";
    }
    return "unknown";
}

std::optional<ProtocolTag> protocol_from_string(std::string_view name);

// Trading side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

inline constexpr const char* to_string(Side s) noexcept {
    return s == Side::Buy ? "buy" : "sell";
}

// RPC / stream commitment level
enum class Commitment : uint8_t {
    Processed = 0,
    Confirmed = 1,
    Finalized = 2
};

inline constexpr const char* to_string(Commitment c) noexcept {
    switch (c) {
        case Commitment::Processed: return "processed";
        case Commitment::Confirmed: return "confirmed";
        case Commitment::Finalized: return "finalized";
    }
    return "confirmed";
}

std::optional<Commitment> commitment_from_string(std::string_view name);

// Account reference inside an instruction
struct AccountMeta {
    Pubkey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const Pubkey& key, bool signer = false) {
        return AccountMeta{key, signer, true};
    }

    static AccountMeta readonly(const Pubkey& key, bool signer = false) {
        return AccountMeta{key, signer, false};
    }
};

struct Instruction {
    Pubkey program_id;
    std::vector<AccountMeta> accounts;
    Bytes data;
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t now_us() noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

inline int64_t now_ns() noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

}  // namespace solx::trading
