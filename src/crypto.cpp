// SolX Trading SDK - Cryptography Implementation

#include <solx/trading/crypto.hpp>
#include <solx/trading/constants.hpp>
#include <nlohmann/json.hpp>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>

namespace solx::trading {

// =============================================================================
// Hashing
// =============================================================================

Hash sha256(const uint8_t* data, std::size_t size) {
    std::array<uint8_t, 32> out{};
    unsigned int len = 0;
    if (EVP_Digest(data, size, out.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw CryptoError("sha256 digest failed");
    }
    return Hash(out);
}

Hash sha256(std::string_view text) {
    return sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::array<uint8_t, 8> anchor_discriminator(std::string_view name) {
    auto digest = sha256(name);
    std::array<uint8_t, 8> out{};
    std::memcpy(out.data(), digest.data(), out.size());
    return out;
}

// =============================================================================
// Curve membership
// =============================================================================

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

BnPtr bn_new() {
    BnPtr bn(BN_new());
    if (!bn) throw CryptoError("BN_new failed");
    return bn;
}

// Field constants for edwards25519: p = 2^255 - 19, d = -121665 / 121666
struct CurveParams {
    BnPtr p = bn_new();
    BnPtr d = bn_new();
    BnPtr legendre_exp = bn_new();  // (p - 1) / 2

    CurveParams() {
        BnCtxPtr ctx(BN_CTX_new());
        if (!ctx) throw CryptoError("BN_CTX_new failed");

        BN_one(p.get());
        BN_lshift(p.get(), p.get(), 255);
        BN_sub_word(p.get(), 19);

        BnPtr num = bn_new();
        BnPtr den = bn_new();
        BN_set_word(num.get(), 121665);
        BN_sub(num.get(), p.get(), num.get());
        BN_set_word(den.get(), 121666);
        if (!BN_mod_inverse(den.get(), den.get(), p.get(), ctx.get())) {
            throw CryptoError("curve constant inversion failed");
        }
        BN_mod_mul(d.get(), num.get(), den.get(), p.get(), ctx.get());

        BN_copy(legendre_exp.get(), p.get());
        BN_sub_word(legendre_exp.get(), 1);
        BN_rshift1(legendre_exp.get(), legendre_exp.get());
    }
};

const CurveParams& curve() {
    static const CurveParams params;
    return params;
}

}  // namespace

bool is_on_curve(const Pubkey& key) {
    const auto& c = curve();
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) throw CryptoError("BN_CTX_new failed");

    auto bytes = key.bytes();
    bytes[31] &= 0x7f;

    // x^2 = (y^2 - 1) / (d*y^2 + 1) must have a root mod p
    BnPtr y(BN_lebin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
    if (!y) throw CryptoError("BN_lebin2bn failed");
    BN_nnmod(y.get(), y.get(), c.p.get(), ctx.get());

    BnPtr y2 = bn_new();
    BnPtr u = bn_new();
    BnPtr v = bn_new();
    BnPtr one = bn_new();
    BN_one(one.get());

    BN_mod_sqr(y2.get(), y.get(), c.p.get(), ctx.get());
    BN_mod_sub(u.get(), y2.get(), one.get(), c.p.get(), ctx.get());
    BN_mod_mul(v.get(), c.d.get(), y2.get(), c.p.get(), ctx.get());
    BN_mod_add(v.get(), v.get(), one.get(), c.p.get(), ctx.get());

    if (BN_is_zero(v.get())) return false;
    if (!BN_mod_inverse(v.get(), v.get(), c.p.get(), ctx.get())) return false;

    BnPtr x2 = bn_new();
    BN_mod_mul(x2.get(), u.get(), v.get(), c.p.get(), ctx.get());
    if (BN_is_zero(x2.get())) return true;

    BnPtr symbol = bn_new();
    BN_mod_exp(symbol.get(), x2.get(), c.legendre_exp.get(), c.p.get(), ctx.get());
    return BN_is_one(symbol.get());
}

// =============================================================================
// Program-derived addresses
// =============================================================================

namespace {

constexpr std::string_view PDA_MARKER = "ProgramDerivedAddress";

Pubkey derive_address(const std::vector<Seed>& seeds, const uint8_t* bump, const Pubkey& program_id) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw CryptoError("sha256 init failed");
    }
    for (const auto& seed : seeds) EVP_DigestUpdate(ctx.get(), seed.data, seed.size);
    if (bump) EVP_DigestUpdate(ctx.get(), bump, 1);
    EVP_DigestUpdate(ctx.get(), program_id.data(), program_id.size());
    EVP_DigestUpdate(ctx.get(), PDA_MARKER.data(), PDA_MARKER.size());
    std::array<uint8_t, 32> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
        throw CryptoError("sha256 final failed");
    }
    return Pubkey(out);
}

void check_seeds(const std::vector<Seed>& seeds, std::size_t reserved) {
    if (seeds.size() + reserved > MAX_SEEDS) {
        throw ValidationError("too many PDA seeds: " + std::to_string(seeds.size()));
    }
    for (const auto& seed : seeds) {
        if (seed.size > MAX_SEED_LEN) {
            throw ValidationError("PDA seed exceeds 32 bytes: " + std::to_string(seed.size));
        }
    }
}

}  // namespace

std::optional<Pubkey> create_program_address(const std::vector<Seed>& seeds,
                                             const Pubkey& program_id) {
    check_seeds(seeds, 0);
    auto address = derive_address(seeds, nullptr, program_id);
    if (is_on_curve(address)) return std::nullopt;
    return address;
}

std::pair<Pubkey, uint8_t> find_program_address(const std::vector<Seed>& seeds,
                                                const Pubkey& program_id) {
    check_seeds(seeds, 1);
    for (int bump = 255; bump >= 0; --bump) {
        auto b = static_cast<uint8_t>(bump);
        auto address = derive_address(seeds, &b, program_id);
        if (!is_on_curve(address)) return {address, b};
    }
    throw CryptoError("no viable bump for program address");
}

Pubkey associated_token_address(const Pubkey& wallet,
                                const Pubkey& mint,
                                const Pubkey& token_program) {
    return find_program_address({wallet, token_program, mint},
                                constants::ASSOCIATED_TOKEN_PROGRAM).first;
}

Pubkey associated_token_address(const Pubkey& wallet, const Pubkey& mint) {
    return associated_token_address(wallet, mint, constants::TOKEN_PROGRAM);
}

// =============================================================================
// Keypair
// =============================================================================

struct Keypair::Impl {
    EVP_PKEY* key = nullptr;
    std::array<uint8_t, 32> seed{};

    ~Impl() {
        if (key) EVP_PKEY_free(key);
        OPENSSL_cleanse(seed.data(), seed.size());
    }
};

Keypair::Keypair(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {
    std::array<uint8_t, 32> raw{};
    std::size_t len = raw.size();
    if (EVP_PKEY_get_raw_public_key(impl_->key, raw.data(), &len) != 1 || len != raw.size()) {
        throw CryptoError("failed to derive ed25519 public key");
    }
    pubkey_ = Pubkey(raw);
}

Keypair::Keypair(Keypair&&) noexcept = default;
Keypair& Keypair::operator=(Keypair&&) noexcept = default;
Keypair::~Keypair() = default;

Keypair Keypair::from_seed(const std::array<uint8_t, 32>& seed) {
    auto impl = std::make_unique<Impl>();
    impl->key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
    if (!impl->key) throw CryptoError("invalid ed25519 seed");
    impl->seed = seed;
    return Keypair(std::move(impl));
}

Keypair Keypair::generate() {
    std::array<uint8_t, 32> seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw CryptoError("RAND_bytes failed");
    }
    auto kp = from_seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return kp;
}

Keypair Keypair::from_secret_bytes(const Bytes& bytes) {
    if (bytes.size() != 64 && bytes.size() != 32) {
        throw CryptoError("secret key must be 32 or 64 bytes, got " + std::to_string(bytes.size()));
    }
    std::array<uint8_t, 32> seed{};
    std::memcpy(seed.data(), bytes.data(), seed.size());
    auto kp = from_seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());

    if (bytes.size() == 64 && std::memcmp(bytes.data() + 32, kp.pubkey().data(), 32) != 0) {
        throw CryptoError("secret key public half does not match its seed");
    }
    return kp;
}

Keypair Keypair::from_base58(std::string_view secret) {
    auto bytes = base58_decode(secret);
    if (!bytes) throw CryptoError("secret key is not valid base58");
    return from_secret_bytes(*bytes);
}

Keypair Keypair::from_json_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw CryptoError("Cannot open key file: " + path_str);
    }
    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw CryptoError("key file " + path_str + " is not valid JSON: " + e.what());
    }
    if (!doc.is_array()) throw CryptoError("key file " + path_str + " must hold a byte array");
    Bytes bytes;
    bytes.reserve(doc.size());
    for (const auto& v : doc) bytes.push_back(v.get<uint8_t>());
    return from_secret_bytes(bytes);
}

Signature Keypair::sign(const uint8_t* message, std::size_t size) const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw CryptoError("EVP_MD_CTX_new failed");
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, impl_->key) != 1) {
        throw CryptoError("EVP_DigestSignInit failed");
    }
    std::array<uint8_t, 64> sig{};
    std::size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message, size) != 1 || sig_len != sig.size()) {
        throw CryptoError("ed25519 signing failed");
    }
    return Signature(sig);
}

std::array<uint8_t, 32> Keypair::seed() const {
    return impl_->seed;
}

bool Keypair::verify(const Pubkey& key, const uint8_t* message, std::size_t size,
                     const Signature& signature) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()),
        &EVP_PKEY_free);
    if (!pkey) return false;
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) return false;
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return false;
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message, size) == 1;
}

}  // namespace solx::trading
