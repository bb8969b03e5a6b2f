// SolX Trading SDK - PumpSwap Adapter
// Constant-product pool swaps for tokens migrated off the bonding curve

#pragma once

#include <solx/trading/adapter.hpp>

namespace solx::trading {

class PumpSwapAdapter : public ProtocolAdapter {
public:
    [[nodiscard]] ProtocolTag protocol() const override { return ProtocolTag::PumpSwap; }
    [[nodiscard]] std::string_view name() const override { return "pumpswap"; }
    [[nodiscard]] const Pubkey& program_id() const override;
    [[nodiscard]] std::vector<Requirement> requirements() const override {
        return {Requirement::MarketSnapshot};
    }

    [[nodiscard]] Quote quote(Side side,
                              uint64_t amount,
                              uint16_t slippage_bps,
                              const MarketSnapshot& snapshot) const override;

    [[nodiscard]] std::vector<Instruction> build(const BuildRequest& request) const override;

    // Pool created by the bonding-curve migration of `base_mint`
    static Pubkey canonical_pool(const Pubkey& base_mint, const Pubkey& quote_mint);
    static Pubkey coin_creator_vault_authority(const Pubkey& coin_creator);
};

// Pool account, its token balances and the global fee config
class PumpSwapLoader : public SnapshotLoader {
public:
    MarketSnapshot load(ChainReader& chain,
                        const Pubkey& mint,
                        const ProtocolParams& params) const override;
};

}  // namespace solx::trading
