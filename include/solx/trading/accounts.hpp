// SolX Trading SDK - On-chain Account Layouts
// Decoders for the account state the snapshot loaders read

#pragma once

#include <solx/trading/transaction.hpp>
#include <solx/trading/types.hpp>
#include <optional>

namespace solx::trading::accounts {

// pump.fun BondingCurve
struct BondingCurve {
    uint64_t virtual_token_reserves = 0;
    uint64_t virtual_sol_reserves = 0;
    uint64_t real_token_reserves = 0;
    uint64_t real_sol_reserves = 0;
    uint64_t token_total_supply = 0;
    bool complete = false;
    Pubkey creator;

    static std::optional<BondingCurve> decode(const Bytes& data);
};

// pump.fun Global
struct PumpFunGlobal {
    bool initialized = false;
    Pubkey authority;
    Pubkey fee_recipient;
    uint64_t initial_virtual_token_reserves = 0;
    uint64_t initial_virtual_sol_reserves = 0;
    uint64_t initial_real_token_reserves = 0;
    uint64_t token_total_supply = 0;
    uint64_t fee_basis_points = 0;
    std::optional<uint64_t> creator_fee_basis_points;

    static std::optional<PumpFunGlobal> decode(const Bytes& data);
};

// PumpSwap Pool
struct PumpSwapPool {
    uint8_t pool_bump = 0;
    uint16_t index = 0;
    Pubkey creator;
    Pubkey base_mint;
    Pubkey quote_mint;
    Pubkey lp_mint;
    Pubkey pool_base_token_account;
    Pubkey pool_quote_token_account;
    uint64_t lp_supply = 0;
    Pubkey coin_creator;

    static std::optional<PumpSwapPool> decode(const Bytes& data);
};

// PumpSwap GlobalConfig
struct PumpSwapGlobalConfig {
    Pubkey admin;
    uint64_t lp_fee_basis_points = 0;
    uint64_t protocol_fee_basis_points = 0;
    uint8_t disable_flags = 0;
    std::optional<uint64_t> coin_creator_fee_basis_points;

    static std::optional<PumpSwapGlobalConfig> decode(const Bytes& data);
};

// Raydium Launchpad PoolState
struct LaunchpadPool {
    uint64_t epoch = 0;
    uint8_t auth_bump = 0;
    uint8_t status = 0;
    uint8_t base_decimals = 0;
    uint8_t quote_decimals = 0;
    uint8_t migrate_type = 0;
    uint64_t supply = 0;
    uint64_t total_base_sell = 0;
    uint64_t virtual_base = 0;
    uint64_t virtual_quote = 0;
    uint64_t real_base = 0;
    uint64_t real_quote = 0;
    uint64_t total_quote_fund_raising = 0;
    uint64_t quote_protocol_fee = 0;
    uint64_t platform_fee = 0;
    uint64_t migrate_fee = 0;
    Pubkey global_config;
    Pubkey platform_config;
    Pubkey base_mint;
    Pubkey quote_mint;
    Pubkey base_vault;
    Pubkey quote_vault;
    Pubkey creator;

    static std::optional<LaunchpadPool> decode(const Bytes& data);
};

// Raydium Launchpad GlobalConfig (fee rate in parts per million)
struct LaunchpadGlobalConfig {
    uint64_t epoch = 0;
    uint8_t curve_type = 0;
    uint16_t index = 0;
    uint64_t migrate_fee = 0;
    uint64_t trade_fee_rate = 0;

    static std::optional<LaunchpadGlobalConfig> decode(const Bytes& data);
};

// SPL token account
struct TokenAccount {
    Pubkey mint;
    Pubkey owner;
    uint64_t amount = 0;

    static std::optional<TokenAccount> decode(const Bytes& data);
};

// Address lookup table account (56-byte header, then 32-byte addresses)
std::optional<AddressLookupTable> decode_lookup_table(const Pubkey& key, const Bytes& data);

}  // namespace solx::trading::accounts
