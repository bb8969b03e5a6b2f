// SolX Trading SDK - Program Constants
// Program ids, fixed accounts, PDA seeds and Anchor discriminators

#pragma once

#include <solx/trading/types.hpp>
#include <array>
#include <cstdint>

namespace solx::trading::constants {

using Discriminator = std::array<uint8_t, 8>;

// Native and SPL programs
inline constexpr Pubkey SYSTEM_PROGRAM = pubkey_literal("11111111111111111111111111111111");
inline constexpr Pubkey TOKEN_PROGRAM = pubkey_literal("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
inline constexpr Pubkey ASSOCIATED_TOKEN_PROGRAM = pubkey_literal("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
inline constexpr Pubkey COMPUTE_BUDGET_PROGRAM = pubkey_literal("ComputeBudget111111111111111111111111111111");
inline constexpr Pubkey RENT_SYSVAR = pubkey_literal("SysvarRent111111111111111111111111111111111");
inline constexpr Pubkey METADATA_PROGRAM = pubkey_literal("metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s");
inline constexpr Pubkey WSOL_MINT = pubkey_literal("So11111111111111111111111111111111111111112");

// Rent-exempt minimum for a 165-byte token account
inline constexpr uint64_t TOKEN_ACCOUNT_RENT = 2'039'280;

// Emitted by Anchor's emit_cpi! in front of the event discriminator
inline constexpr Discriminator EVENT_IX_TAG = {0xe4, 0x45, 0xa5, 0x2e, 0x51, 0xcb, 0x9a, 0x1d};

// Solana transaction limits
inline constexpr std::size_t PACKET_DATA_SIZE = 1232;

namespace pumpfun {

inline constexpr Pubkey PROGRAM = pubkey_literal("6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P");
inline constexpr Pubkey GLOBAL = pubkey_literal("4wTV1YmiEkRvAtNtsSGPtUrqRYQMe5SKy2uB4Jjaxnjf");
inline constexpr Pubkey EVENT_AUTHORITY = pubkey_literal("Ce6TQqeHC9p8KetsN6JsjHK7UTZk7nasjjnr7XxXp9F1");
inline constexpr Pubkey MINT_AUTHORITY = pubkey_literal("TSLvdd1pWpHVjahSpsvCXUbgwsL3JAcvokwaKt1eokM");
inline constexpr Pubkey FEE_RECIPIENT = pubkey_literal("CebN5WGQ4jvEPvsVU4EoHEpgzq1VV7AbicfhtW4xC9iM");

inline constexpr const char* SEED_BONDING_CURVE = "bonding-curve";
inline constexpr const char* SEED_CREATOR_VAULT = "creator-vault";
inline constexpr const char* SEED_METADATA = "metadata";

// Curve parameters for a freshly created token
inline constexpr uint64_t INITIAL_VIRTUAL_TOKEN_RESERVES = 1'073'000'000'000'000;
inline constexpr uint64_t INITIAL_VIRTUAL_SOL_RESERVES = 30'000'000'000;
inline constexpr uint64_t INITIAL_REAL_TOKEN_RESERVES = 793'100'000'000'000;
inline constexpr uint64_t TOKEN_TOTAL_SUPPLY = 1'000'000'000'000'000;
inline constexpr uint64_t FEE_BASIS_POINTS = 95;
inline constexpr uint64_t CREATOR_FEE_BASIS_POINTS = 5;

// Accounts
inline constexpr Discriminator BONDING_CURVE_ACCOUNT = {23, 183, 248, 55, 96, 216, 172, 96};
inline constexpr Discriminator GLOBAL_ACCOUNT = {167, 232, 232, 177, 200, 108, 114, 127};

// Events
inline constexpr Discriminator CREATE_EVENT = {27, 114, 169, 77, 222, 235, 99, 118};
inline constexpr Discriminator TRADE_EVENT = {189, 219, 127, 211, 78, 230, 97, 238};
inline constexpr Discriminator COMPLETE_EVENT = {95, 114, 97, 156, 212, 46, 152, 8};

// Instructions
inline constexpr Discriminator CREATE_IX = {24, 30, 200, 40, 5, 28, 7, 119};
inline constexpr Discriminator BUY_IX = {102, 6, 61, 18, 1, 218, 235, 234};
inline constexpr Discriminator SELL_IX = {51, 230, 133, 164, 1, 127, 131, 173};

}  // namespace pumpfun

namespace pumpswap {

inline constexpr Pubkey PROGRAM = pubkey_literal("pAMMBay6oceH9fJKBRHGP5D4bD4sWpmSwMn52FMfXEA");
inline constexpr Pubkey GLOBAL_CONFIG = pubkey_literal("ADyA8hdefvWN2dbGGWFotbzWxrAvLW83WG6QCVXvJKqw");
inline constexpr Pubkey EVENT_AUTHORITY = pubkey_literal("GS4CU59F31iL7aR2Q8zVS8DRrcRnXX1yjQ66TqNVQnaR");
inline constexpr Pubkey PROTOCOL_FEE_RECIPIENT = pubkey_literal("62qc2CNXwrYqQScmEdiZFFAnJR262PxWEuNQtxfafNgV");
inline constexpr Pubkey PROTOCOL_FEE_RECIPIENT_TOKEN_ACCOUNT =
    pubkey_literal("94qWNrtmfn42h3ZjUZwWvK1MEo9uVmmrBPd2hpNjYDjb");

inline constexpr const char* SEED_POOL = "pool";
inline constexpr const char* SEED_POOL_AUTHORITY = "pool-authority";
inline constexpr const char* SEED_CREATOR_VAULT = "creator_vault";

inline constexpr uint64_t LP_FEE_BASIS_POINTS = 20;
inline constexpr uint64_t PROTOCOL_FEE_BASIS_POINTS = 5;
inline constexpr uint64_t COIN_CREATOR_FEE_BASIS_POINTS = 5;

// Accounts
inline constexpr Discriminator POOL_ACCOUNT = {241, 154, 109, 4, 17, 177, 109, 188};
inline constexpr Discriminator GLOBAL_CONFIG_ACCOUNT = {149, 8, 156, 202, 160, 252, 176, 217};

// Events
inline constexpr Discriminator BUY_EVENT = {103, 244, 82, 31, 44, 245, 119, 119};
inline constexpr Discriminator SELL_EVENT = {62, 47, 55, 10, 165, 3, 220, 42};
inline constexpr Discriminator CREATE_POOL_EVENT = {177, 49, 12, 210, 160, 118, 167, 116};
inline constexpr Discriminator DEPOSIT_EVENT = {120, 248, 61, 83, 31, 142, 107, 144};
inline constexpr Discriminator WITHDRAW_EVENT = {22, 9, 133, 26, 160, 44, 71, 192};

// Instructions
inline constexpr Discriminator BUY_IX = {102, 6, 61, 18, 1, 218, 235, 234};
inline constexpr Discriminator SELL_IX = {51, 230, 133, 164, 1, 127, 131, 173};
inline constexpr Discriminator CREATE_POOL_IX = {233, 146, 209, 142, 207, 104, 64, 188};
inline constexpr Discriminator DEPOSIT_IX = {242, 35, 198, 137, 82, 225, 242, 182};
inline constexpr Discriminator WITHDRAW_IX = {183, 18, 70, 156, 148, 109, 161, 34};

}  // namespace pumpswap

namespace bonk {

inline constexpr Pubkey PROGRAM = pubkey_literal("LanMV9sAd7wArD4vJFi2qDdfnVhFxYSUg6eADduJ3uj");
inline constexpr Pubkey AUTHORITY = pubkey_literal("WLHv2UAZm6z4KyaaELi5pjdbJh6RESMva1Rnn8pJVVh");
inline constexpr Pubkey EVENT_AUTHORITY = pubkey_literal("2DPAtwB8L12vrMRExbLuyGnC7n2J5LNoZQSejeQGpwkr");
inline constexpr Pubkey GLOBAL_CONFIG = pubkey_literal("6s1xP3hpbAfFoNtUNF8mfHsjr2Bd97JxFJRWLbL6aHuX");
inline constexpr Pubkey PLATFORM_CONFIG = pubkey_literal("FfYek5vEz23cMkWsdJwG2oa6EphsvXSHrGpdALN4g6W1");

inline constexpr const char* SEED_POOL = "pool";
inline constexpr const char* SEED_POOL_VAULT = "pool_vault";

// Fee rates are parts per million
inline constexpr uint64_t FEE_RATE_DENOMINATOR = 1'000'000;
inline constexpr uint64_t PROTOCOL_FEE_RATE = 2'500;
inline constexpr uint64_t PLATFORM_FEE_RATE = 10'000;
inline constexpr uint64_t SHARE_FEE_RATE = 0;

// PoolState.status while the curve is tradable
inline constexpr uint8_t POOL_STATUS_TRADING = 0;

// Accounts
inline constexpr Discriminator POOL_STATE_ACCOUNT = {247, 237, 227, 245, 215, 195, 222, 70};
inline constexpr Discriminator GLOBAL_CONFIG_ACCOUNT = {149, 8, 156, 202, 160, 252, 176, 217};

// Events
inline constexpr Discriminator TRADE_EVENT = {189, 219, 127, 211, 78, 230, 97, 238};
inline constexpr Discriminator POOL_CREATE_EVENT = {151, 215, 226, 9, 118, 161, 115, 174};

// Instructions
inline constexpr Discriminator BUY_EXACT_IN_IX = {250, 234, 13, 123, 213, 156, 19, 236};
inline constexpr Discriminator SELL_EXACT_IN_IX = {149, 39, 222, 155, 211, 124, 152, 26};
inline constexpr Discriminator INITIALIZE_IX = {175, 175, 109, 31, 13, 152, 155, 237};

}  // namespace bonk

namespace tips {

inline constexpr std::array<Pubkey, 8> JITO = {
    pubkey_literal("96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU5"),
    pubkey_literal("HFqU5x63VTqvQss8hp11i4wVV8bD44PvwucfZ2bU7gRe"),
    pubkey_literal("Cw8CFyM9FkoMi7K7Crf6HNQqf4uEMzpKw6QNghXLvLkY"),
    pubkey_literal("ADaUMid9yfUytqMBgopwjb2DTLSokTSzL1zt6iGPaS49"),
    pubkey_literal("DfXygSm4jCyNCybVYYK6DwvWqjKee8pbDmJGcLWNDXjh"),
    pubkey_literal("ADuUkR4vqLUMWXxW9gh6D6L8pMSawimctcNZ5pGwDcEt"),
    pubkey_literal("DttWaMuVvTiduZRnguLF7jNxTgiMBZ1hyAumKUiL2KRL"),
    pubkey_literal("3AVi9Tg9Uo68tJfuvoKvqKNWKkC5wPdSSdeBnizKZ6jT"),
};

inline constexpr std::array<Pubkey, 3> NOZOMI = {
    pubkey_literal("TEMPaMeCRFAS9EKF53Jd6KpHxgL47uWLcpFArU1Fanq"),
    pubkey_literal("noz3jAjPiHuBPqiSPkkugaJDkJscPuRhYnSpbi8UvC4"),
    pubkey_literal("noz3str9KXfpKknefHji8L1mPgimezaiUyCHYMDv1GE"),
};

inline constexpr std::array<Pubkey, 5> ZERO_SLOT = {
    pubkey_literal("Eb2KpSC8uMt9GmzyAEm5Eb1AAAgTjRaXWFjKyFXHZxF3"),
    pubkey_literal("FCjUJZ1qozm1e8romw216qyfQMaaWKxWsuySnumVCCNe"),
    pubkey_literal("ENxTEjSQ1YabmUpXAdCgevnHQ9MHdLv8tzFiuiYJqa13"),
    pubkey_literal("6rYLG55Q9RpsPGvqdPNJs4z5WTxJVatMB8zV3WJhs5EK"),
    pubkey_literal("Cix2bHfqPcKcM233mzxbLk14kSggUUiz2A87fJtGivXr"),
};

inline constexpr std::array<Pubkey, 2> NEXT_BLOCK = {
    pubkey_literal("NextbLoCkVtMGcV47JzewQdvBpLqT9TxQFozQkN98pE"),
    pubkey_literal("NexTbLoCkWykbLuB1NkjXgFWkX9oAtcoagQegygXXA2"),
};

inline constexpr std::array<Pubkey, 1> NODE1 = {
    pubkey_literal("node1PqAa3BWWzUnTHVbw8NJHC874zn9ngAkXjgWEej"),
};

}  // namespace tips

}  // namespace solx::trading::constants
