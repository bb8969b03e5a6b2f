// SolX Trading SDK - pump.fun Adapter Implementation

#include <solx/trading/adapters/pumpfun.hpp>
#include <solx/trading/accounts.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/math.hpp>
#include <solx/trading/programs.hpp>
#include <solx/trading/rpc.hpp>

namespace solx::trading {

namespace pf = constants::pumpfun;

const Pubkey& PumpFunAdapter::program_id() const {
    return pf::PROGRAM;
}

Pubkey PumpFunAdapter::bonding_curve_address(const Pubkey& mint) {
    return find_program_address({pf::SEED_BONDING_CURVE, mint}, pf::PROGRAM).first;
}

Pubkey PumpFunAdapter::creator_vault_address(const Pubkey& creator) {
    return find_program_address({pf::SEED_CREATOR_VAULT, creator}, pf::PROGRAM).first;
}

Pubkey PumpFunAdapter::metadata_address(const Pubkey& mint) {
    return find_program_address({pf::SEED_METADATA, constants::METADATA_PROGRAM, mint},
                                constants::METADATA_PROGRAM).first;
}

// =============================================================================
// Quote
// =============================================================================

Quote PumpFunAdapter::quote(Side side, uint64_t amount, uint16_t slippage_bps,
                            const MarketSnapshot& snapshot) const {
    check_quote_input(amount, slippage_bps);
    const auto& curve = require_state<BondingCurveState>(snapshot);
    if (curve.complete) {
        throw ValidationError("bonding curve " + curve.bonding_curve.to_base58() +
                              " is complete; the token trades on PumpSwap");
    }

    uint64_t expected = side == Side::Buy
        ? math::bonding_curve_buy_tokens(curve, amount)
        : math::bonding_curve_sell_sol(curve, amount);
    return make_quote(side, amount, expected, slippage_bps);
}

// =============================================================================
// Build
// =============================================================================

std::vector<Instruction> PumpFunAdapter::build(const BuildRequest& request) const {
    const auto& curve = require_state<BondingCurveState>(require_snapshot(request));
    auto q = bounded_quote(request);

    Pubkey creator = request.creator.value_or(curve.creator);
    if (creator.is_default()) {
        throw ValidationError("pumpfun adapter requires " + std::string(to_string(Requirement::Creator)));
    }

    Pubkey bonding_curve = curve.bonding_curve.is_default()
        ? bonding_curve_address(request.mint)
        : curve.bonding_curve;
    Pubkey associated_bonding_curve = associated_token_address(bonding_curve, request.mint);
    Pubkey user_token_account = associated_token_address(request.payer, request.mint);
    Pubkey creator_vault = creator_vault_address(creator);

    std::vector<Instruction> out;

    if (request.side == Side::Buy) {
        out.push_back(programs::ata::create_idempotent(request.payer, request.payer,
                                                       request.mint, constants::TOKEN_PROGRAM));

        BorshWriter data;
        data.raw(pf::BUY_IX).u64(q.min_out).u64(q.amount_in);
        out.push_back(Instruction{
            pf::PROGRAM,
            {AccountMeta::readonly(pf::GLOBAL),
             AccountMeta::writable(pf::FEE_RECIPIENT),
             AccountMeta::readonly(request.mint),
             AccountMeta::writable(bonding_curve),
             AccountMeta::writable(associated_bonding_curve),
             AccountMeta::writable(user_token_account),
             AccountMeta::writable(request.payer, true),
             AccountMeta::readonly(constants::SYSTEM_PROGRAM),
             AccountMeta::readonly(constants::TOKEN_PROGRAM),
             AccountMeta::writable(creator_vault),
             AccountMeta::readonly(pf::EVENT_AUTHORITY),
             AccountMeta::readonly(pf::PROGRAM)},
            data.take()});
        return out;
    }

    BorshWriter data;
    data.raw(pf::SELL_IX).u64(q.amount_in).u64(q.min_out);
    out.push_back(Instruction{
        pf::PROGRAM,
        {AccountMeta::readonly(pf::GLOBAL),
         AccountMeta::writable(pf::FEE_RECIPIENT),
         AccountMeta::readonly(request.mint),
         AccountMeta::writable(bonding_curve),
         AccountMeta::writable(associated_bonding_curve),
         AccountMeta::writable(user_token_account),
         AccountMeta::writable(request.payer, true),
         AccountMeta::readonly(constants::SYSTEM_PROGRAM),
         AccountMeta::writable(creator_vault),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(pf::EVENT_AUTHORITY),
         AccountMeta::readonly(pf::PROGRAM)},
        data.take()});

    if (request.params.close_token_account) {
        out.push_back(programs::token::close_account(user_token_account, request.payer, request.payer));
    }
    return out;
}

Instruction PumpFunAdapter::build_create(const Pubkey& payer,
                                         const Pubkey& mint,
                                         const TokenMetadata& metadata,
                                         const Pubkey& creator) const {
    if (metadata.name.empty() || metadata.symbol.empty()) {
        throw ValidationError("token name and symbol are required");
    }

    Pubkey bonding_curve = bonding_curve_address(mint);

    BorshWriter data;
    data.raw(pf::CREATE_IX)
        .string(metadata.name)
        .string(metadata.symbol)
        .string(metadata.uri)
        .pubkey(creator);

    return Instruction{
        pf::PROGRAM,
        {AccountMeta::writable(mint, true),
         AccountMeta::readonly(pf::MINT_AUTHORITY),
         AccountMeta::writable(bonding_curve),
         AccountMeta::writable(associated_token_address(bonding_curve, mint)),
         AccountMeta::readonly(pf::GLOBAL),
         AccountMeta::readonly(constants::METADATA_PROGRAM),
         AccountMeta::writable(metadata_address(mint)),
         AccountMeta::writable(payer, true),
         AccountMeta::readonly(constants::SYSTEM_PROGRAM),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(constants::ASSOCIATED_TOKEN_PROGRAM),
         AccountMeta::readonly(constants::RENT_SYSVAR),
         AccountMeta::readonly(pf::EVENT_AUTHORITY),
         AccountMeta::readonly(pf::PROGRAM)},
        data.take()};
}

// =============================================================================
// Loader
// =============================================================================

MarketSnapshot PumpFunLoader::load(ChainReader& chain,
                                   const Pubkey& mint,
                                   const ProtocolParams&) const {
    Pubkey address = PumpFunAdapter::bonding_curve_address(mint);
    auto infos = chain.accounts({address, pf::GLOBAL});

    if (!infos[0]) {
        throw ValidationError("bonding curve " + address.to_base58() + " for mint " +
                              mint.to_base58() + " not found");
    }
    auto curve = accounts::BondingCurve::decode(infos[0]->data);
    if (!curve) {
        throw ValidationError("account " + address.to_base58() + " is not a bonding curve");
    }

    BondingCurveState state;
    state.bonding_curve = address;
    state.virtual_token_reserves = curve->virtual_token_reserves;
    state.virtual_sol_reserves = curve->virtual_sol_reserves;
    state.real_token_reserves = curve->real_token_reserves;
    state.real_sol_reserves = curve->real_sol_reserves;
    state.token_total_supply = curve->token_total_supply;
    state.complete = curve->complete;
    state.creator = curve->creator;
    state.fee_basis_points = pf::FEE_BASIS_POINTS;
    state.creator_fee_basis_points = pf::CREATOR_FEE_BASIS_POINTS;

    if (infos[1]) {
        if (auto global = accounts::PumpFunGlobal::decode(infos[1]->data)) {
            state.fee_basis_points = global->fee_basis_points;
            state.creator_fee_basis_points =
                global->creator_fee_basis_points.value_or(pf::CREATOR_FEE_BASIS_POINTS);
        }
    }
    return MarketSnapshot(state);
}

}  // namespace solx::trading
