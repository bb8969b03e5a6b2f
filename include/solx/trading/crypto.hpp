// SolX Trading SDK - Cryptography
// ed25519 keypairs, SHA-256, program-derived and associated token addresses

#pragma once

#include <solx/trading/types.hpp>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace solx::trading {

Hash sha256(const uint8_t* data, std::size_t size);
Hash sha256(std::string_view text);

// Anchor 8-byte discriminator: sha256(name)[0..8]
std::array<uint8_t, 8> anchor_discriminator(std::string_view name);

// True when the 32 bytes decode to a point on the ed25519 curve
bool is_on_curve(const Pubkey& key);

// Borrowed byte string used as a PDA seed
struct Seed {
    const uint8_t* data;
    std::size_t size;

    Seed(const char* literal) noexcept  // NOLINT(google-explicit-constructor)
        : data(reinterpret_cast<const uint8_t*>(literal)), size(std::char_traits<char>::length(literal)) {}
    Seed(const Pubkey& key) noexcept  // NOLINT(google-explicit-constructor)
        : data(key.data()), size(key.size()) {}
    Seed(const Bytes& bytes) noexcept  // NOLINT(google-explicit-constructor)
        : data(bytes.data()), size(bytes.size()) {}
    Seed(const uint8_t* ptr, std::size_t len) noexcept : data(ptr), size(len) {}
};

inline constexpr std::size_t MAX_SEEDS = 16;
inline constexpr std::size_t MAX_SEED_LEN = 32;

// Off-curve address for the exact seeds, nullopt if the hash lands on the curve
std::optional<Pubkey> create_program_address(const std::vector<Seed>& seeds,
                                             const Pubkey& program_id);

// Canonical PDA and bump, searching bumps 255..0
std::pair<Pubkey, uint8_t> find_program_address(const std::vector<Seed>& seeds,
                                                const Pubkey& program_id);

Pubkey associated_token_address(const Pubkey& wallet,
                                const Pubkey& mint,
                                const Pubkey& token_program);

Pubkey associated_token_address(const Pubkey& wallet, const Pubkey& mint);

// ed25519 signing key
class Keypair {
public:
    static Keypair generate();
    static Keypair from_seed(const std::array<uint8_t, 32>& seed);
    // 64-byte secret||public layout used by Solana CLI key files
    static Keypair from_secret_bytes(const Bytes& bytes);
    static Keypair from_base58(std::string_view secret);
    // JSON array of 64 numbers, as written by solana-keygen
    static Keypair from_json_file(std::string_view path);

    Keypair(Keypair&&) noexcept;
    Keypair& operator=(Keypair&&) noexcept;
    ~Keypair();

    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

    [[nodiscard]] const Pubkey& pubkey() const noexcept { return pubkey_; }
    [[nodiscard]] Signature sign(const uint8_t* message, std::size_t size) const;
    [[nodiscard]] Signature sign(const Bytes& message) const { return sign(message.data(), message.size()); }
    [[nodiscard]] std::array<uint8_t, 32> seed() const;

    static bool verify(const Pubkey& key, const uint8_t* message, std::size_t size,
                       const Signature& signature);

private:
    struct Impl;
    explicit Keypair(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
    Pubkey pubkey_;
};

}  // namespace solx::trading
