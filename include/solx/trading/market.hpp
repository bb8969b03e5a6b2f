// SolX Trading SDK - Market Snapshots
// Immutable per-call reserve and fee state for each protocol

#pragma once

#include <solx/trading/events.hpp>
#include <solx/trading/types.hpp>
#include <optional>
#include <variant>

namespace solx::trading {

// pump.fun bonding curve
struct BondingCurveState {
    static constexpr ProtocolTag PROTOCOL = ProtocolTag::PumpFun;

    Pubkey bonding_curve;
    uint64_t virtual_token_reserves = 0;
    uint64_t virtual_sol_reserves = 0;
    uint64_t real_token_reserves = 0;
    uint64_t real_sol_reserves = 0;
    uint64_t token_total_supply = 0;
    bool complete = false;
    Pubkey creator;
    uint64_t fee_basis_points = 0;
    uint64_t creator_fee_basis_points = 0;

    // Curve of a new token right after its creator bought `tokens` for `sol`
    static BondingCurveState after_initial_buy(const Pubkey& mint,
                                               const Pubkey& creator,
                                               uint64_t tokens,
                                               uint64_t sol);
};

// PumpSwap constant-product pool
struct AmmPoolState {
    static constexpr ProtocolTag PROTOCOL = ProtocolTag::PumpSwap;

    Pubkey pool;
    Pubkey base_mint;
    Pubkey quote_mint;
    Pubkey pool_base_token_account;
    Pubkey pool_quote_token_account;
    Pubkey coin_creator;
    uint64_t base_reserve = 0;
    uint64_t quote_reserve = 0;
    uint64_t lp_fee_basis_points = 0;
    uint64_t protocol_fee_basis_points = 0;
    uint64_t coin_creator_fee_basis_points = 0;

    [[nodiscard]] uint64_t total_fee_basis_points() const noexcept {
        return lp_fee_basis_points + protocol_fee_basis_points +
               (coin_creator.is_default() ? 0 : coin_creator_fee_basis_points);
    }
};

// Raydium Launchpad pool (fee rates in parts per million)
struct LaunchpadState {
    static constexpr ProtocolTag PROTOCOL = ProtocolTag::Bonk;

    Pubkey pool_state;
    Pubkey base_mint;
    Pubkey quote_mint;
    Pubkey base_vault;
    Pubkey quote_vault;
    Pubkey global_config;
    Pubkey platform_config;
    Pubkey creator;
    uint64_t virtual_base = 0;
    uint64_t virtual_quote = 0;
    uint64_t real_base = 0;
    uint64_t real_quote = 0;
    uint8_t status = 0;
    uint64_t protocol_fee_rate = 0;
    uint64_t platform_fee_rate = 0;
    uint64_t share_fee_rate = 0;

    [[nodiscard]] uint64_t total_fee_rate() const noexcept {
        return protocol_fee_rate + platform_fee_rate + share_fee_rate;
    }
};

using MarketState = std::variant<BondingCurveState, AmmPoolState, LaunchpadState>;

class MarketSnapshot {
public:
    MarketSnapshot(MarketState state) : state_(std::move(state)) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] ProtocolTag protocol() const noexcept;
    [[nodiscard]] const MarketState& state() const noexcept { return state_; }

    template <typename T>
    [[nodiscard]] const T* get() const noexcept { return std::get_if<T>(&state_); }

    // Post-trade state carried by an observed event, without a network read.
    // Launchpad fee rates are not part of its events and default to the program's.
    static std::optional<MarketSnapshot> from_event(const TradeEvent& event);

private:
    MarketState state_;
};

}  // namespace solx::trading
