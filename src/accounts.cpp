// SolX Trading SDK - On-chain Account Layouts Implementation

#include <solx/trading/accounts.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>

namespace solx::trading::accounts {

namespace {

bool has_discriminator(BorshReader& r, const constants::Discriminator& expected) {
    return r.discriminator() == expected && r.ok();
}

}  // namespace

std::optional<BondingCurve> BondingCurve::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::pumpfun::BONDING_CURVE_ACCOUNT)) return std::nullopt;

    BondingCurve curve;
    curve.virtual_token_reserves = r.u64();
    curve.virtual_sol_reserves = r.u64();
    curve.real_token_reserves = r.u64();
    curve.real_sol_reserves = r.u64();
    curve.token_total_supply = r.u64();
    curve.complete = r.boolean();
    if (!r.ok()) return std::nullopt;
    // Curves created before creator fees carry no creator field
    if (r.remaining() >= 32) curve.creator = r.pubkey();
    return curve;
}

std::optional<PumpFunGlobal> PumpFunGlobal::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::pumpfun::GLOBAL_ACCOUNT)) return std::nullopt;

    PumpFunGlobal global;
    global.initialized = r.boolean();
    global.authority = r.pubkey();
    global.fee_recipient = r.pubkey();
    global.initial_virtual_token_reserves = r.u64();
    global.initial_virtual_sol_reserves = r.u64();
    global.initial_real_token_reserves = r.u64();
    global.token_total_supply = r.u64();
    global.fee_basis_points = r.u64();
    if (!r.ok()) return std::nullopt;

    // withdraw_authority, enable_migrate, pool_migration_fee, then creator_fee_basis_points
    r.skip(32 + 1 + 8);
    uint64_t creator_fee = r.u64();
    if (r.ok()) global.creator_fee_basis_points = creator_fee;
    return global;
}

std::optional<PumpSwapPool> PumpSwapPool::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::pumpswap::POOL_ACCOUNT)) return std::nullopt;

    PumpSwapPool pool;
    pool.pool_bump = r.u8();
    pool.index = r.u16();
    pool.creator = r.pubkey();
    pool.base_mint = r.pubkey();
    pool.quote_mint = r.pubkey();
    pool.lp_mint = r.pubkey();
    pool.pool_base_token_account = r.pubkey();
    pool.pool_quote_token_account = r.pubkey();
    pool.lp_supply = r.u64();
    if (!r.ok()) return std::nullopt;
    if (r.remaining() >= 32) pool.coin_creator = r.pubkey();
    return pool;
}

std::optional<PumpSwapGlobalConfig> PumpSwapGlobalConfig::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::pumpswap::GLOBAL_CONFIG_ACCOUNT)) return std::nullopt;

    PumpSwapGlobalConfig config;
    config.admin = r.pubkey();
    config.lp_fee_basis_points = r.u64();
    config.protocol_fee_basis_points = r.u64();
    config.disable_flags = r.u8();
    if (!r.ok()) return std::nullopt;

    // protocol_fee_recipients: [Pubkey; 8]
    r.skip(8 * 32);
    uint64_t creator_fee = r.u64();
    if (r.ok()) config.coin_creator_fee_basis_points = creator_fee;
    return config;
}

std::optional<LaunchpadPool> LaunchpadPool::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::bonk::POOL_STATE_ACCOUNT)) return std::nullopt;

    LaunchpadPool pool;
    pool.epoch = r.u64();
    pool.auth_bump = r.u8();
    pool.status = r.u8();
    pool.base_decimals = r.u8();
    pool.quote_decimals = r.u8();
    pool.migrate_type = r.u8();
    pool.supply = r.u64();
    pool.total_base_sell = r.u64();
    pool.virtual_base = r.u64();
    pool.virtual_quote = r.u64();
    pool.real_base = r.u64();
    pool.real_quote = r.u64();
    pool.total_quote_fund_raising = r.u64();
    pool.quote_protocol_fee = r.u64();
    pool.platform_fee = r.u64();
    pool.migrate_fee = r.u64();
    // vesting schedule: five u64 fields
    r.skip(5 * 8);
    pool.global_config = r.pubkey();
    pool.platform_config = r.pubkey();
    pool.base_mint = r.pubkey();
    pool.quote_mint = r.pubkey();
    pool.base_vault = r.pubkey();
    pool.quote_vault = r.pubkey();
    pool.creator = r.pubkey();
    if (!r.ok()) return std::nullopt;
    return pool;
}

std::optional<LaunchpadGlobalConfig> LaunchpadGlobalConfig::decode(const Bytes& data) {
    BorshReader r(data);
    if (!has_discriminator(r, constants::bonk::GLOBAL_CONFIG_ACCOUNT)) return std::nullopt;

    LaunchpadGlobalConfig config;
    config.epoch = r.u64();
    config.curve_type = r.u8();
    config.index = r.u16();
    config.migrate_fee = r.u64();
    config.trade_fee_rate = r.u64();
    if (!r.ok()) return std::nullopt;
    return config;
}

std::optional<TokenAccount> TokenAccount::decode(const Bytes& data) {
    // Token-2022 accounts extend the same 165-byte base layout
    if (data.size() < 165) return std::nullopt;
    BorshReader r(data);
    TokenAccount account;
    account.mint = r.pubkey();
    account.owner = r.pubkey();
    account.amount = r.u64();
    if (!r.ok()) return std::nullopt;
    return account;
}

std::optional<AddressLookupTable> decode_lookup_table(const Pubkey& key, const Bytes& data) {
    constexpr std::size_t META_SIZE = 56;
    if (data.size() < META_SIZE || (data.size() - META_SIZE) % 32 != 0) return std::nullopt;

    AddressLookupTable table;
    table.key = key;
    for (std::size_t offset = META_SIZE; offset < data.size(); offset += 32) {
        table.addresses.push_back(Pubkey::from_bytes(data.data() + offset));
    }
    return table;
}

}  // namespace solx::trading::accounts
