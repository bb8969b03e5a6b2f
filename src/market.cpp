// SolX Trading SDK - Market Snapshots Implementation

#include <solx/trading/market.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>

namespace solx::trading {

namespace pf = constants::pumpfun;

BondingCurveState BondingCurveState::after_initial_buy(const Pubkey& mint,
                                                       const Pubkey& creator,
                                                       uint64_t tokens,
                                                       uint64_t sol) {
    BondingCurveState state;
    state.bonding_curve = find_program_address({pf::SEED_BONDING_CURVE, mint}, pf::PROGRAM).first;
    state.virtual_token_reserves = pf::INITIAL_VIRTUAL_TOKEN_RESERVES - tokens;
    state.virtual_sol_reserves = pf::INITIAL_VIRTUAL_SOL_RESERVES + sol;
    state.real_token_reserves = pf::INITIAL_REAL_TOKEN_RESERVES - tokens;
    state.real_sol_reserves = sol;
    state.token_total_supply = pf::TOKEN_TOTAL_SUPPLY;
    state.creator = creator;
    state.fee_basis_points = pf::FEE_BASIS_POINTS;
    state.creator_fee_basis_points = pf::CREATOR_FEE_BASIS_POINTS;
    return state;
}

ProtocolTag MarketSnapshot::protocol() const noexcept {
    return std::visit([](const auto& s) { return std::decay_t<decltype(s)>::PROTOCOL; }, state_);
}

namespace {

std::optional<MarketSnapshot> from_pumpfun_trade(const PumpFunTradeEvent& e) {
    // Instruction-derived trades carry limits, not reserves
    if (e.virtual_token_reserves == 0 || e.virtual_sol_reserves == 0) return std::nullopt;

    BondingCurveState state;
    state.bonding_curve = e.bonding_curve.is_default()
        ? find_program_address({pf::SEED_BONDING_CURVE, e.mint}, pf::PROGRAM).first
        : e.bonding_curve;
    state.virtual_token_reserves = e.virtual_token_reserves;
    state.virtual_sol_reserves = e.virtual_sol_reserves;
    state.real_token_reserves = e.real_token_reserves;
    state.real_sol_reserves = e.real_sol_reserves;
    state.token_total_supply = pf::TOKEN_TOTAL_SUPPLY;
    state.creator = e.creator;
    state.fee_basis_points = e.fee_basis_points != 0 ? e.fee_basis_points : pf::FEE_BASIS_POINTS;
    state.creator_fee_basis_points = e.creator_fee_basis_points;
    return MarketSnapshot(state);
}

std::optional<MarketSnapshot> from_pumpfun_create(const PumpFunCreateEvent& e) {
    auto creator = e.creator.is_default() ? e.user : e.creator;
    auto state = BondingCurveState::after_initial_buy(e.mint, creator, 0, 0);
    if (!e.bonding_curve.is_default()) state.bonding_curve = e.bonding_curve;
    if (e.virtual_token_reserves != 0 && e.virtual_sol_reserves != 0) {
        state.virtual_token_reserves = e.virtual_token_reserves;
        state.virtual_sol_reserves = e.virtual_sol_reserves;
        state.real_token_reserves = e.real_token_reserves;
        state.token_total_supply = e.token_total_supply;
    }
    return MarketSnapshot(state);
}

AmmPoolState amm_base(const Pubkey& pool, const Pubkey& coin_creator,
                      uint64_t lp_fee_bps, uint64_t protocol_fee_bps, uint64_t creator_fee_bps) {
    AmmPoolState state;
    state.pool = pool;
    state.coin_creator = coin_creator;
    state.lp_fee_basis_points = lp_fee_bps;
    state.protocol_fee_basis_points = protocol_fee_bps;
    state.coin_creator_fee_basis_points = creator_fee_bps;
    return state;
}

std::optional<MarketSnapshot> from_pumpswap_buy(const PumpSwapBuyEvent& e) {
    if (e.pool_base_token_reserves == 0 || e.pool_quote_token_reserves == 0) return std::nullopt;
    auto state = amm_base(e.pool, e.coin_creator, e.lp_fee_basis_points,
                          e.protocol_fee_basis_points, e.coin_creator_fee_basis_points);
    state.base_mint = e.base_mint;
    state.quote_mint = e.quote_mint;
    state.base_reserve = e.pool_base_token_reserves - e.base_amount_out;
    state.quote_reserve = e.pool_quote_token_reserves + e.quote_amount_in_with_lp_fee;
    return MarketSnapshot(state);
}

std::optional<MarketSnapshot> from_pumpswap_sell(const PumpSwapSellEvent& e) {
    if (e.pool_base_token_reserves == 0 || e.pool_quote_token_reserves == 0) return std::nullopt;
    auto state = amm_base(e.pool, e.coin_creator, e.lp_fee_basis_points,
                          e.protocol_fee_basis_points, e.coin_creator_fee_basis_points);
    state.base_mint = e.base_mint;
    state.quote_mint = e.quote_mint;
    state.base_reserve = e.pool_base_token_reserves + e.base_amount_in;
    state.quote_reserve = e.pool_quote_token_reserves - e.quote_amount_out_without_lp_fee;
    return MarketSnapshot(state);
}

std::optional<MarketSnapshot> from_pumpswap_create(const PumpSwapCreatePoolEvent& e) {
    if (e.pool_base_amount == 0 || e.pool_quote_amount == 0) return std::nullopt;
    auto state = amm_base(e.pool, e.coin_creator,
                          constants::pumpswap::LP_FEE_BASIS_POINTS,
                          constants::pumpswap::PROTOCOL_FEE_BASIS_POINTS,
                          constants::pumpswap::COIN_CREATOR_FEE_BASIS_POINTS);
    state.base_mint = e.base_mint;
    state.quote_mint = e.quote_mint;
    state.base_reserve = e.pool_base_amount;
    state.quote_reserve = e.pool_quote_amount;
    return MarketSnapshot(state);
}

std::optional<MarketSnapshot> from_bonk_trade(const BonkTradeEvent& e) {
    if (e.virtual_base == 0 || e.virtual_quote == 0) return std::nullopt;
    LaunchpadState state;
    state.pool_state = e.pool_state;
    state.base_mint = e.base_mint;
    state.quote_mint = e.quote_mint;
    state.virtual_base = e.virtual_base;
    state.virtual_quote = e.virtual_quote;
    state.real_base = e.real_base_after;
    state.real_quote = e.real_quote_after;
    state.status = e.pool_status;
    state.global_config = constants::bonk::GLOBAL_CONFIG;
    state.platform_config = constants::bonk::PLATFORM_CONFIG;
    state.protocol_fee_rate = constants::bonk::PROTOCOL_FEE_RATE;
    state.platform_fee_rate = constants::bonk::PLATFORM_FEE_RATE;
    state.share_fee_rate = constants::bonk::SHARE_FEE_RATE;
    return MarketSnapshot(state);
}

}  // namespace

std::optional<MarketSnapshot> MarketSnapshot::from_event(const TradeEvent& event) {
    if (auto* e = event.get<PumpFunTradeEvent>()) return from_pumpfun_trade(*e);
    if (auto* e = event.get<PumpFunCreateEvent>()) return from_pumpfun_create(*e);
    if (auto* e = event.get<PumpSwapBuyEvent>()) return from_pumpswap_buy(*e);
    if (auto* e = event.get<PumpSwapSellEvent>()) return from_pumpswap_sell(*e);
    if (auto* e = event.get<PumpSwapCreatePoolEvent>()) return from_pumpswap_create(*e);
    if (auto* e = event.get<BonkTradeEvent>()) return from_bonk_trade(*e);
    return std::nullopt;
}

}  // namespace solx::trading
