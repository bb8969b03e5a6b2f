// SolX Trading SDK - Pricing Math
// Integer constant-product pricing for bonding curves, AMM pools and launchpads

#pragma once

#include <solx/trading/market.hpp>
#include <cstdint>

namespace solx::trading::math {

using u128 = unsigned __int128;

inline constexpr uint64_t BPS_DENOMINATOR = 10'000;

// value * (10000 - bps) / 10000, rounded down
constexpr uint64_t apply_slippage_floor(uint64_t value, uint64_t bps) noexcept {
    if (bps >= BPS_DENOMINATOR) return 0;
    return static_cast<uint64_t>(static_cast<u128>(value) * (BPS_DENOMINATOR - bps) / BPS_DENOMINATOR);
}

constexpr uint64_t ceil_div(u128 num, u128 den) noexcept {
    return static_cast<uint64_t>((num + den - 1) / den);
}

// fee taken from `amount` at `rate / denominator`, rounded up
constexpr uint64_t fee_amount(uint64_t amount, uint64_t rate, uint64_t denominator) noexcept {
    return ceil_div(static_cast<u128>(amount) * rate, denominator);
}

// Output of x*y=k for `amount_in`; 0 when either reserve is empty
uint64_t constant_product_out(uint64_t amount_in, u128 reserve_in, u128 reserve_out) noexcept;

// pump.fun bonding curve
uint64_t bonding_curve_fee_bps(const BondingCurveState& curve) noexcept;
uint64_t bonding_curve_buy_tokens(const BondingCurveState& curve, uint64_t sol_in) noexcept;
uint64_t bonding_curve_sell_sol(const BondingCurveState& curve, uint64_t tokens_in) noexcept;
// Lamports per whole token (6 decimals)
double bonding_curve_price(const BondingCurveState& curve) noexcept;

// PumpSwap pool, quote in / quote out
uint64_t amm_buy_base_out(const AmmPoolState& pool, uint64_t quote_in) noexcept;
uint64_t amm_sell_quote_out(const AmmPoolState& pool, uint64_t base_in) noexcept;

// Raydium Launchpad, quote in / quote out
uint64_t launchpad_buy_base_out(const LaunchpadState& pool, uint64_t quote_in) noexcept;
uint64_t launchpad_sell_quote_out(const LaunchpadState& pool, uint64_t base_in) noexcept;

}  // namespace solx::trading::math
