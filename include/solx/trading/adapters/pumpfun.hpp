// SolX Trading SDK - pump.fun Adapter
// Bonding-curve buys, sells and token creation

#pragma once

#include <solx/trading/adapter.hpp>
#include <string>

namespace solx::trading {

struct TokenMetadata {
    std::string name;
    std::string symbol;
    std::string uri;
};

class PumpFunAdapter : public ProtocolAdapter {
public:
    [[nodiscard]] ProtocolTag protocol() const override { return ProtocolTag::PumpFun; }
    [[nodiscard]] std::string_view name() const override { return "pumpfun"; }
    [[nodiscard]] const Pubkey& program_id() const override;
    [[nodiscard]] std::vector<Requirement> requirements() const override {
        return {Requirement::MarketSnapshot, Requirement::Creator};
    }

    [[nodiscard]] Quote quote(Side side,
                              uint64_t amount,
                              uint16_t slippage_bps,
                              const MarketSnapshot& snapshot) const override;

    [[nodiscard]] std::vector<Instruction> build(const BuildRequest& request) const override;

    // `create` for a new mint; the mint keypair must co-sign
    [[nodiscard]] Instruction build_create(const Pubkey& payer,
                                           const Pubkey& mint,
                                           const TokenMetadata& metadata,
                                           const Pubkey& creator) const;

    static Pubkey bonding_curve_address(const Pubkey& mint);
    static Pubkey creator_vault_address(const Pubkey& creator);
    static Pubkey metadata_address(const Pubkey& mint);
};

// Bonding curve and global fee settings
class PumpFunLoader : public SnapshotLoader {
public:
    MarketSnapshot load(ChainReader& chain,
                        const Pubkey& mint,
                        const ProtocolParams& params) const override;
};

}  // namespace solx::trading
