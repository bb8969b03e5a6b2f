// SolX Trading SDK - Bonk Adapter
// Raydium Launchpad exact-input buys and sells

#pragma once

#include <solx/trading/adapter.hpp>

namespace solx::trading {

class BonkAdapter : public ProtocolAdapter {
public:
    [[nodiscard]] ProtocolTag protocol() const override { return ProtocolTag::Bonk; }
    [[nodiscard]] std::string_view name() const override { return "bonk"; }
    [[nodiscard]] const Pubkey& program_id() const override;
    [[nodiscard]] std::vector<Requirement> requirements() const override {
        return {Requirement::MarketSnapshot};
    }

    [[nodiscard]] Quote quote(Side side,
                              uint64_t amount,
                              uint16_t slippage_bps,
                              const MarketSnapshot& snapshot) const override;

    [[nodiscard]] std::vector<Instruction> build(const BuildRequest& request) const override;

    static Pubkey pool_address(const Pubkey& base_mint, const Pubkey& quote_mint);
    static Pubkey vault_address(const Pubkey& pool, const Pubkey& mint);
};

// Pool state plus the global config's trade fee rate
class BonkLoader : public SnapshotLoader {
public:
    MarketSnapshot load(ChainReader& chain,
                        const Pubkey& mint,
                        const ProtocolParams& params) const override;
};

}  // namespace solx::trading
