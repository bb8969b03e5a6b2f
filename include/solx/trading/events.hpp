// SolX Trading SDK - Trade Events
// Tagged union of decoded program events across protocols and event kinds

#pragma once

#include <solx/trading/types.hpp>
#include <optional>
#include <string>
#include <variant>

namespace solx::trading {

enum class EventKind : uint8_t {
    Create = 0,
    Buy = 1,
    Sell = 2,
    Deposit = 3,
    Withdraw = 4,
    Complete = 5
};

inline constexpr const char* to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::Create: return "create";
        case EventKind::Buy: return "buy";
        case EventKind::Sell: return "sell";
        case EventKind::Deposit: return "deposit";
        case EventKind::Withdraw: return "withdraw";
        case EventKind::Complete: return "complete";
    }
    return "unknown";
}

// Where in a transaction the payload was found
enum class EventSource : uint8_t {
    ProgramLog = 0,        // "Program data: <base64>" log line
    InnerInstruction = 1,  // self-CPI event instruction
    Instruction = 2        // top-level instruction (fragment streams)
};

// ---------------------------------------------------------------------------
// pump.fun
// ---------------------------------------------------------------------------

struct PumpFunCreateEvent {
    std::string name;
    std::string symbol;
    std::string uri;
    Pubkey mint;
    Pubkey bonding_curve;
    Pubkey user;
    Pubkey creator;
    int64_t timestamp = 0;
    uint64_t virtual_token_reserves = 0;
    uint64_t virtual_sol_reserves = 0;
    uint64_t real_token_reserves = 0;
    uint64_t token_total_supply = 0;
};

struct PumpFunTradeEvent {
    Pubkey mint;
    uint64_t sol_amount = 0;
    uint64_t token_amount = 0;
    bool is_buy = false;
    Pubkey user;
    int64_t timestamp = 0;
    uint64_t virtual_sol_reserves = 0;
    uint64_t virtual_token_reserves = 0;
    uint64_t real_sol_reserves = 0;
    uint64_t real_token_reserves = 0;
    Pubkey fee_recipient;
    uint64_t fee_basis_points = 0;
    uint64_t fee = 0;
    Pubkey creator;
    uint64_t creator_fee_basis_points = 0;
    uint64_t creator_fee = 0;
    // Set for instruction-derived trades, where amounts are the requested limits
    Pubkey bonding_curve;
};

struct PumpFunCompleteEvent {
    Pubkey user;
    Pubkey mint;
    Pubkey bonding_curve;
    int64_t timestamp = 0;
};

// ---------------------------------------------------------------------------
// PumpSwap
// ---------------------------------------------------------------------------

struct PumpSwapBuyEvent {
    int64_t timestamp = 0;
    uint64_t base_amount_out = 0;
    uint64_t max_quote_amount_in = 0;
    uint64_t user_base_token_reserves = 0;
    uint64_t user_quote_token_reserves = 0;
    uint64_t pool_base_token_reserves = 0;
    uint64_t pool_quote_token_reserves = 0;
    uint64_t quote_amount_in = 0;
    uint64_t lp_fee_basis_points = 0;
    uint64_t lp_fee = 0;
    uint64_t protocol_fee_basis_points = 0;
    uint64_t protocol_fee = 0;
    uint64_t quote_amount_in_with_lp_fee = 0;
    uint64_t user_quote_amount_in = 0;
    Pubkey pool;
    Pubkey user;
    Pubkey user_base_token_account;
    Pubkey user_quote_token_account;
    Pubkey protocol_fee_recipient;
    Pubkey protocol_fee_recipient_token_account;
    Pubkey coin_creator;
    uint64_t coin_creator_fee_basis_points = 0;
    uint64_t coin_creator_fee = 0;
    // Known only for instruction-derived events
    Pubkey base_mint;
    Pubkey quote_mint;
};

struct PumpSwapSellEvent {
    int64_t timestamp = 0;
    uint64_t base_amount_in = 0;
    uint64_t min_quote_amount_out = 0;
    uint64_t user_base_token_reserves = 0;
    uint64_t user_quote_token_reserves = 0;
    uint64_t pool_base_token_reserves = 0;
    uint64_t pool_quote_token_reserves = 0;
    uint64_t quote_amount_out = 0;
    uint64_t lp_fee_basis_points = 0;
    uint64_t lp_fee = 0;
    uint64_t protocol_fee_basis_points = 0;
    uint64_t protocol_fee = 0;
    uint64_t quote_amount_out_without_lp_fee = 0;
    uint64_t user_quote_amount_out = 0;
    Pubkey pool;
    Pubkey user;
    Pubkey user_base_token_account;
    Pubkey user_quote_token_account;
    Pubkey protocol_fee_recipient;
    Pubkey protocol_fee_recipient_token_account;
    Pubkey coin_creator;
    uint64_t coin_creator_fee_basis_points = 0;
    uint64_t coin_creator_fee = 0;
    Pubkey base_mint;
    Pubkey quote_mint;
};

struct PumpSwapCreatePoolEvent {
    int64_t timestamp = 0;
    uint16_t index = 0;
    Pubkey creator;
    Pubkey base_mint;
    Pubkey quote_mint;
    uint8_t base_mint_decimals = 0;
    uint8_t quote_mint_decimals = 0;
    uint64_t base_amount_in = 0;
    uint64_t quote_amount_in = 0;
    uint64_t pool_base_amount = 0;
    uint64_t pool_quote_amount = 0;
    uint64_t minimum_liquidity = 0;
    uint64_t initial_liquidity = 0;
    uint64_t lp_token_amount_out = 0;
    uint8_t pool_bump = 0;
    Pubkey pool;
    Pubkey lp_mint;
    Pubkey user_base_token_account;
    Pubkey user_quote_token_account;
    Pubkey coin_creator;
};

struct PumpSwapDepositEvent {
    int64_t timestamp = 0;
    uint64_t lp_token_amount_out = 0;
    uint64_t max_base_amount_in = 0;
    uint64_t max_quote_amount_in = 0;
    uint64_t user_base_token_reserves = 0;
    uint64_t user_quote_token_reserves = 0;
    uint64_t pool_base_token_reserves = 0;
    uint64_t pool_quote_token_reserves = 0;
    uint64_t base_amount_in = 0;
    uint64_t quote_amount_in = 0;
    uint64_t lp_mint_supply = 0;
    Pubkey pool;
    Pubkey user;
    Pubkey user_base_token_account;
    Pubkey user_quote_token_account;
    Pubkey user_pool_token_account;
};

struct PumpSwapWithdrawEvent {
    int64_t timestamp = 0;
    uint64_t lp_token_amount_in = 0;
    uint64_t min_base_amount_out = 0;
    uint64_t min_quote_amount_out = 0;
    uint64_t user_base_token_reserves = 0;
    uint64_t user_quote_token_reserves = 0;
    uint64_t pool_base_token_reserves = 0;
    uint64_t pool_quote_token_reserves = 0;
    uint64_t base_amount_out = 0;
    uint64_t quote_amount_out = 0;
    uint64_t lp_mint_supply = 0;
    Pubkey pool;
    Pubkey user;
    Pubkey user_base_token_account;
    Pubkey user_quote_token_account;
    Pubkey user_pool_token_account;
};

// ---------------------------------------------------------------------------
// Raydium Launchpad (bonk)
// ---------------------------------------------------------------------------

struct BonkTradeEvent {
    Pubkey pool_state;
    uint64_t total_base_sell = 0;
    uint64_t virtual_base = 0;
    uint64_t virtual_quote = 0;
    uint64_t real_base_before = 0;
    uint64_t real_quote_before = 0;
    uint64_t real_base_after = 0;
    uint64_t real_quote_after = 0;
    uint64_t amount_in = 0;
    uint64_t amount_out = 0;
    uint64_t protocol_fee = 0;
    uint64_t platform_fee = 0;
    uint64_t share_fee = 0;
    Side side = Side::Buy;
    uint8_t pool_status = 0;
    // Known only for instruction-derived events
    Pubkey payer;
    Pubkey base_mint;
    Pubkey quote_mint;
};

struct BonkPoolCreateEvent {
    Pubkey pool_state;
    Pubkey creator;
    Pubkey config;
    uint8_t base_decimals = 0;
    std::string name;
    std::string symbol;
    std::string uri;
    // Known only for instruction-derived events
    Pubkey base_mint;
    Pubkey quote_mint;
};

using EventBody = std::variant<
    PumpFunCreateEvent,
    PumpFunTradeEvent,
    PumpFunCompleteEvent,
    PumpSwapBuyEvent,
    PumpSwapSellEvent,
    PumpSwapCreatePoolEvent,
    PumpSwapDepositEvent,
    PumpSwapWithdrawEvent,
    BonkTradeEvent,
    BonkPoolCreateEvent>;

ProtocolTag protocol_of(const EventBody& body) noexcept;
EventKind kind_of(const EventBody& body) noexcept;

struct EventMetadata {
    ProtocolTag protocol = ProtocolTag::PumpFun;
    EventKind kind = EventKind::Create;
    EventSource source = EventSource::ProgramLog;
    Signature signature;
    uint64_t slot = 0;
    Pubkey program_id;
    uint32_t instruction_index = 0;
    // The token or pool creator trading in its own creation transaction
    bool is_creator_trade = false;
};

struct TradeEvent {
    EventMetadata meta;
    EventBody body;

    template <typename T>
    [[nodiscard]] const T* get() const noexcept { return std::get_if<T>(&body); }

    // Token mint, when the event carries one
    [[nodiscard]] std::optional<Pubkey> mint() const;
    // Trader or creator wallet
    [[nodiscard]] std::optional<Pubkey> user() const;
    // Pool or bonding curve the event refers to
    [[nodiscard]] std::optional<Pubkey> market() const;
};

}  // namespace solx::trading
