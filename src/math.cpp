// SolX Trading SDK - Pricing Math Implementation

#include <solx/trading/math.hpp>
#include <solx/trading/constants.hpp>
#include <algorithm>

namespace solx::trading::math {

uint64_t constant_product_out(uint64_t amount_in, u128 reserve_in, u128 reserve_out) noexcept {
    if (amount_in == 0 || reserve_in == 0 || reserve_out == 0) return 0;
    u128 out = static_cast<u128>(amount_in) * reserve_out / (reserve_in + amount_in);
    return out > UINT64_MAX ? UINT64_MAX : static_cast<uint64_t>(out);
}

// =============================================================================
// Bonding curve
// =============================================================================

uint64_t bonding_curve_fee_bps(const BondingCurveState& curve) noexcept {
    return curve.fee_basis_points + (curve.creator.is_default() ? 0 : curve.creator_fee_basis_points);
}

uint64_t bonding_curve_buy_tokens(const BondingCurveState& curve, uint64_t sol_in) noexcept {
    // sol_in covers the trade plus fees charged on top
    u128 net = static_cast<u128>(sol_in) * BPS_DENOMINATOR /
               (BPS_DENOMINATOR + bonding_curve_fee_bps(curve));
    uint64_t tokens = constant_product_out(static_cast<uint64_t>(net),
                                           curve.virtual_sol_reserves,
                                           curve.virtual_token_reserves);
    return std::min(tokens, curve.real_token_reserves);
}

uint64_t bonding_curve_sell_sol(const BondingCurveState& curve, uint64_t tokens_in) noexcept {
    uint64_t gross = constant_product_out(tokens_in,
                                          curve.virtual_token_reserves,
                                          curve.virtual_sol_reserves);
    uint64_t fee = fee_amount(gross, bonding_curve_fee_bps(curve), BPS_DENOMINATOR);
    return gross > fee ? gross - fee : 0;
}

double bonding_curve_price(const BondingCurveState& curve) noexcept {
    if (curve.virtual_token_reserves == 0) return 0.0;
    return static_cast<double>(curve.virtual_sol_reserves) /
           static_cast<double>(curve.virtual_token_reserves) * 1e6;
}

// =============================================================================
// AMM pool
// =============================================================================

uint64_t amm_buy_base_out(const AmmPoolState& pool, uint64_t quote_in) noexcept {
    u128 net = static_cast<u128>(quote_in) * BPS_DENOMINATOR /
               (BPS_DENOMINATOR + pool.total_fee_basis_points());
    return constant_product_out(static_cast<uint64_t>(net), pool.quote_reserve, pool.base_reserve);
}

uint64_t amm_sell_quote_out(const AmmPoolState& pool, uint64_t base_in) noexcept {
    uint64_t gross = constant_product_out(base_in, pool.base_reserve, pool.quote_reserve);
    uint64_t fee = fee_amount(gross, pool.total_fee_basis_points(), BPS_DENOMINATOR);
    return gross > fee ? gross - fee : 0;
}

// =============================================================================
// Launchpad
// =============================================================================

namespace {

constexpr uint64_t RATE_DENOMINATOR = constants::bonk::FEE_RATE_DENOMINATOR;

u128 launchpad_quote_reserve(const LaunchpadState& pool) noexcept {
    return static_cast<u128>(pool.virtual_quote) + pool.real_quote;
}

u128 launchpad_base_reserve(const LaunchpadState& pool) noexcept {
    return pool.virtual_base > pool.real_base ? pool.virtual_base - pool.real_base : 0;
}

}  // namespace

uint64_t launchpad_buy_base_out(const LaunchpadState& pool, uint64_t quote_in) noexcept {
    uint64_t fee = fee_amount(quote_in, pool.total_fee_rate(), RATE_DENOMINATOR);
    if (fee >= quote_in) return 0;
    return constant_product_out(quote_in - fee,
                                launchpad_quote_reserve(pool),
                                launchpad_base_reserve(pool));
}

uint64_t launchpad_sell_quote_out(const LaunchpadState& pool, uint64_t base_in) noexcept {
    uint64_t gross = constant_product_out(base_in,
                                          launchpad_base_reserve(pool),
                                          launchpad_quote_reserve(pool));
    uint64_t fee = fee_amount(gross, pool.total_fee_rate(), RATE_DENOMINATOR);
    return gross > fee ? gross - fee : 0;
}

}  // namespace solx::trading::math
