// SolX Trading SDK - PumpSwap Adapter Implementation

#include <solx/trading/adapters/pumpswap.hpp>
#include <solx/trading/accounts.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/math.hpp>
#include <solx/trading/programs.hpp>
#include <solx/trading/rpc.hpp>

namespace solx::trading {

namespace ps = constants::pumpswap;

const Pubkey& PumpSwapAdapter::program_id() const {
    return ps::PROGRAM;
}

Pubkey PumpSwapAdapter::canonical_pool(const Pubkey& base_mint, const Pubkey& quote_mint) {
    // Migration creates pool index 0 owned by the mint's pump.fun pool authority
    auto authority = find_program_address({ps::SEED_POOL_AUTHORITY, base_mint},
                                          constants::pumpfun::PROGRAM).first;
    const uint8_t index[2] = {0, 0};
    return find_program_address({ps::SEED_POOL, Seed(index, sizeof(index)), authority,
                                 base_mint, quote_mint},
                                ps::PROGRAM).first;
}

Pubkey PumpSwapAdapter::coin_creator_vault_authority(const Pubkey& coin_creator) {
    return find_program_address({ps::SEED_CREATOR_VAULT, coin_creator}, ps::PROGRAM).first;
}

// =============================================================================
// Quote
// =============================================================================

Quote PumpSwapAdapter::quote(Side side, uint64_t amount, uint16_t slippage_bps,
                             const MarketSnapshot& snapshot) const {
    check_quote_input(amount, slippage_bps);
    const auto& pool = require_state<AmmPoolState>(snapshot);
    if (pool.base_reserve == 0 || pool.quote_reserve == 0) {
        throw ValidationError("pool " + pool.pool.to_base58() + " has no liquidity");
    }

    uint64_t expected = side == Side::Buy
        ? math::amm_buy_base_out(pool, amount)
        : math::amm_sell_quote_out(pool, amount);
    return make_quote(side, amount, expected, slippage_bps);
}

// =============================================================================
// Build
// =============================================================================

std::vector<Instruction> PumpSwapAdapter::build(const BuildRequest& request) const {
    const auto& state = require_state<AmmPoolState>(require_snapshot(request));
    auto q = bounded_quote(request);

    Pubkey base_mint = state.base_mint.is_default() ? request.mint : state.base_mint;
    Pubkey quote_mint = state.quote_mint.is_default()
        ? request.params.quote_mint.value_or(constants::WSOL_MINT)
        : state.quote_mint;
    Pubkey pool = state.pool;
    if (pool.is_default()) {
        pool = request.params.pool.value_or(canonical_pool(base_mint, quote_mint));
    }
    Pubkey pool_base = state.pool_base_token_account.is_default()
        ? associated_token_address(pool, base_mint)
        : state.pool_base_token_account;
    Pubkey pool_quote = state.pool_quote_token_account.is_default()
        ? associated_token_address(pool, quote_mint)
        : state.pool_quote_token_account;

    Pubkey user_base = associated_token_address(request.payer, base_mint);
    Pubkey user_quote = associated_token_address(request.payer, quote_mint);
    Pubkey fee_recipient_account = quote_mint == constants::WSOL_MINT
        ? ps::PROTOCOL_FEE_RECIPIENT_TOKEN_ACCOUNT
        : associated_token_address(ps::PROTOCOL_FEE_RECIPIENT, quote_mint);

    Pubkey coin_creator = state.coin_creator.is_default()
        ? request.creator.value_or(Pubkey{})
        : state.coin_creator;
    Pubkey vault_authority = coin_creator_vault_authority(coin_creator);
    Pubkey vault_account = associated_token_address(vault_authority, quote_mint);

    bool wrap = request.params.wrap_sol && quote_mint == constants::WSOL_MINT;
    std::vector<Instruction> out;

    if (request.side == Side::Buy) {
        if (wrap) {
            auto wrap_ixs = programs::wrap_sol(request.payer, q.amount_in);
            out.insert(out.end(), wrap_ixs.begin(), wrap_ixs.end());
        }
        out.push_back(programs::ata::create_idempotent(request.payer, request.payer,
                                                       base_mint, constants::TOKEN_PROGRAM));
    } else if (wrap) {
        out.push_back(programs::ata::create_idempotent(request.payer, request.payer,
                                                       constants::WSOL_MINT, constants::TOKEN_PROGRAM));
    }

    BorshWriter data;
    if (request.side == Side::Buy) {
        data.raw(ps::BUY_IX).u64(q.min_out).u64(q.amount_in);
    } else {
        data.raw(ps::SELL_IX).u64(q.amount_in).u64(q.min_out);
    }

    out.push_back(Instruction{
        ps::PROGRAM,
        {AccountMeta::writable(pool),
         AccountMeta::writable(request.payer, true),
         AccountMeta::readonly(ps::GLOBAL_CONFIG),
         AccountMeta::readonly(base_mint),
         AccountMeta::readonly(quote_mint),
         AccountMeta::writable(user_base),
         AccountMeta::writable(user_quote),
         AccountMeta::writable(pool_base),
         AccountMeta::writable(pool_quote),
         AccountMeta::readonly(ps::PROTOCOL_FEE_RECIPIENT),
         AccountMeta::writable(fee_recipient_account),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(constants::SYSTEM_PROGRAM),
         AccountMeta::readonly(constants::ASSOCIATED_TOKEN_PROGRAM),
         AccountMeta::readonly(ps::EVENT_AUTHORITY),
         AccountMeta::readonly(ps::PROGRAM),
         AccountMeta::writable(vault_account),
         AccountMeta::readonly(vault_authority)},
        data.take()});

    if (wrap) {
        out.push_back(programs::unwrap_sol(request.payer));
    }
    if (request.side == Side::Sell && request.params.close_token_account) {
        out.push_back(programs::token::close_account(user_base, request.payer, request.payer));
    }
    return out;
}

// =============================================================================
// Loader
// =============================================================================

MarketSnapshot PumpSwapLoader::load(ChainReader& chain,
                                    const Pubkey& mint,
                                    const ProtocolParams& params) const {
    Pubkey quote_mint = params.quote_mint.value_or(constants::WSOL_MINT);
    Pubkey address = params.pool.value_or(PumpSwapAdapter::canonical_pool(mint, quote_mint));
    auto infos = chain.accounts({address, ps::GLOBAL_CONFIG});

    if (!infos[0]) {
        throw ValidationError("PumpSwap pool " + address.to_base58() + " for mint " +
                              mint.to_base58() + " not found");
    }
    auto pool = accounts::PumpSwapPool::decode(infos[0]->data);
    if (!pool) {
        throw ValidationError("account " + address.to_base58() + " is not a PumpSwap pool");
    }

    AmmPoolState state;
    state.pool = address;
    state.base_mint = pool->base_mint;
    state.quote_mint = pool->quote_mint;
    state.pool_base_token_account = pool->pool_base_token_account;
    state.pool_quote_token_account = pool->pool_quote_token_account;
    state.coin_creator = pool->coin_creator;
    state.lp_fee_basis_points = ps::LP_FEE_BASIS_POINTS;
    state.protocol_fee_basis_points = ps::PROTOCOL_FEE_BASIS_POINTS;
    state.coin_creator_fee_basis_points = ps::COIN_CREATOR_FEE_BASIS_POINTS;

    if (infos[1]) {
        if (auto config = accounts::PumpSwapGlobalConfig::decode(infos[1]->data)) {
            state.lp_fee_basis_points = config->lp_fee_basis_points;
            state.protocol_fee_basis_points = config->protocol_fee_basis_points;
            state.coin_creator_fee_basis_points =
                config->coin_creator_fee_basis_points.value_or(ps::COIN_CREATOR_FEE_BASIS_POINTS);
        }
    }

    state.base_reserve = chain.token_balance(pool->pool_base_token_account);
    state.quote_reserve = chain.token_balance(pool->pool_quote_token_account);
    return MarketSnapshot(state);
}

}  // namespace solx::trading
