// SolX Trading SDK - Bonk Adapter Implementation

#include <solx/trading/adapters/bonk.hpp>
#include <solx/trading/accounts.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/math.hpp>
#include <solx/trading/programs.hpp>
#include <solx/trading/rpc.hpp>

namespace solx::trading {

namespace bk = constants::bonk;

const Pubkey& BonkAdapter::program_id() const {
    return bk::PROGRAM;
}

Pubkey BonkAdapter::pool_address(const Pubkey& base_mint, const Pubkey& quote_mint) {
    return find_program_address({bk::SEED_POOL, base_mint, quote_mint}, bk::PROGRAM).first;
}

Pubkey BonkAdapter::vault_address(const Pubkey& pool, const Pubkey& mint) {
    return find_program_address({bk::SEED_POOL_VAULT, pool, mint}, bk::PROGRAM).first;
}

Quote BonkAdapter::quote(Side side, uint64_t amount, uint16_t slippage_bps,
                         const MarketSnapshot& snapshot) const {
    check_quote_input(amount, slippage_bps);
    const auto& pool = require_state<LaunchpadState>(snapshot);
    if (pool.status != bk::POOL_STATUS_TRADING) {
        throw ValidationError("launchpad pool " + pool.pool_state.to_base58() +
                              " is not trading (status " + std::to_string(pool.status) + ")");
    }

    uint64_t expected = side == Side::Buy
        ? math::launchpad_buy_base_out(pool, amount)
        : math::launchpad_sell_quote_out(pool, amount);
    return make_quote(side, amount, expected, slippage_bps);
}

std::vector<Instruction> BonkAdapter::build(const BuildRequest& request) const {
    const auto& state = require_state<LaunchpadState>(require_snapshot(request));
    auto q = bounded_quote(request);

    Pubkey base_mint = state.base_mint.is_default() ? request.mint : state.base_mint;
    Pubkey quote_mint = state.quote_mint.is_default()
        ? request.params.quote_mint.value_or(constants::WSOL_MINT)
        : state.quote_mint;
    Pubkey pool = state.pool_state.is_default() ? pool_address(base_mint, quote_mint) : state.pool_state;
    Pubkey base_vault = state.base_vault.is_default() ? vault_address(pool, base_mint) : state.base_vault;
    Pubkey quote_vault = state.quote_vault.is_default() ? vault_address(pool, quote_mint) : state.quote_vault;
    Pubkey global_config = state.global_config.is_default() ? bk::GLOBAL_CONFIG : state.global_config;
    Pubkey platform_config = state.platform_config.is_default() ? bk::PLATFORM_CONFIG : state.platform_config;

    Pubkey user_base = associated_token_address(request.payer, base_mint);
    Pubkey user_quote = associated_token_address(request.payer, quote_mint);
    uint64_t share_fee_rate = request.params.share_fee_rate.value_or(bk::SHARE_FEE_RATE);

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
    data.raw(request.side == Side::Buy ? bk::BUY_EXACT_IN_IX : bk::SELL_EXACT_IN_IX)
        .u64(q.amount_in)
        .u64(q.min_out)
        .u64(share_fee_rate);

    out.push_back(Instruction{
        bk::PROGRAM,
        {AccountMeta::writable(request.payer, true),
         AccountMeta::readonly(bk::AUTHORITY),
         AccountMeta::readonly(global_config),
         AccountMeta::readonly(platform_config),
         AccountMeta::writable(pool),
         AccountMeta::writable(user_base),
         AccountMeta::writable(user_quote),
         AccountMeta::writable(base_vault),
         AccountMeta::writable(quote_vault),
         AccountMeta::readonly(base_mint),
         AccountMeta::readonly(quote_mint),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(constants::TOKEN_PROGRAM),
         AccountMeta::readonly(bk::EVENT_AUTHORITY),
         AccountMeta::readonly(bk::PROGRAM)},
        data.take()});

    if (wrap) {
        out.push_back(programs::unwrap_sol(request.payer));
    }
    if (request.side == Side::Sell && request.params.close_token_account) {
        out.push_back(programs::token::close_account(user_base, request.payer, request.payer));
    }
    return out;
}

MarketSnapshot BonkLoader::load(ChainReader& chain,
                                const Pubkey& mint,
                                const ProtocolParams& params) const {
    Pubkey quote_mint = params.quote_mint.value_or(constants::WSOL_MINT);
    Pubkey address = params.pool.value_or(BonkAdapter::pool_address(mint, quote_mint));

    auto info = chain.account(address);
    if (!info) {
        throw ValidationError("launchpad pool " + address.to_base58() + " for mint " +
                              mint.to_base58() + " not found");
    }
    auto pool = accounts::LaunchpadPool::decode(info->data);
    if (!pool) {
        throw ValidationError("account " + address.to_base58() + " is not a launchpad pool");
    }

    LaunchpadState state;
    state.pool_state = address;
    state.base_mint = pool->base_mint;
    state.quote_mint = pool->quote_mint;
    state.base_vault = pool->base_vault;
    state.quote_vault = pool->quote_vault;
    state.global_config = pool->global_config;
    state.platform_config = pool->platform_config;
    state.creator = pool->creator;
    state.virtual_base = pool->virtual_base;
    state.virtual_quote = pool->virtual_quote;
    state.real_base = pool->real_base;
    state.real_quote = pool->real_quote;
    state.status = pool->status;
    state.protocol_fee_rate = bk::PROTOCOL_FEE_RATE;
    state.platform_fee_rate = bk::PLATFORM_FEE_RATE;
    state.share_fee_rate = params.share_fee_rate.value_or(bk::SHARE_FEE_RATE);

    if (auto config_info = chain.account(pool->global_config)) {
        if (auto config = accounts::LaunchpadGlobalConfig::decode(config_info->data)) {
            state.protocol_fee_rate = config->trade_fee_rate;
        }
    }
    return MarketSnapshot(state);
}

}  // namespace solx::trading
