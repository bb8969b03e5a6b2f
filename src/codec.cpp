// SolX Trading SDK - Event Codec Implementation

#include <solx/trading/codec.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <map>

namespace solx::trading {

namespace pf = constants::pumpfun;
namespace ps = constants::pumpswap;
namespace bk = constants::bonk;

using constants::Discriminator;

const char* to_string(DecodeError::Code code) noexcept {
    switch (code) {
        case DecodeError::Code::Filtered: return "filtered";
        case DecodeError::Code::UnknownProgram: return "unknown program";
        case DecodeError::Code::TooShort: return "too short";
        case DecodeError::Code::UnknownDiscriminator: return "unknown discriminator";
        case DecodeError::Code::Malformed: return "malformed";
    }
    return "unknown";
}

// =============================================================================
// Layout decoders
// =============================================================================

namespace {

using DecodeFn = std::optional<EventBody> (*)(BorshReader&, const DecodeContext&);

struct DecodeRule {
    const char* name;
    std::size_t min_size;  // including discriminator
    DecodeFn decode;
};

const Pubkey& account_at(const DecodeContext& ctx, std::size_t i) {
    return (*ctx.accounts)[i];
}

bool has_accounts(const DecodeContext& ctx, std::size_t n) {
    return ctx.accounts != nullptr && ctx.accounts->size() >= n;
}

template <typename T>
std::optional<EventBody> finish(const BorshReader& r, T&& event) {
    if (!r.ok()) return std::nullopt;
    return EventBody(std::forward<T>(event));
}

// ---- pump.fun events --------------------------------------------------------

std::optional<EventBody> pumpfun_create_event(BorshReader& r, const DecodeContext&) {
    PumpFunCreateEvent e;
    e.name = r.string();
    e.symbol = r.string();
    e.uri = r.string();
    e.mint = r.pubkey();
    e.bonding_curve = r.pubkey();
    e.user = r.pubkey();
    // Reserves were appended to the event in a later program version
    if (r.remaining() >= 32 + 8 * 5) {
        e.creator = r.pubkey();
        e.timestamp = r.i64();
        e.virtual_token_reserves = r.u64();
        e.virtual_sol_reserves = r.u64();
        e.real_token_reserves = r.u64();
        e.token_total_supply = r.u64();
    }
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpfun_trade_event(BorshReader& r, const DecodeContext&) {
    PumpFunTradeEvent e;
    e.mint = r.pubkey();
    e.sol_amount = r.u64();
    e.token_amount = r.u64();
    e.is_buy = r.boolean();
    e.user = r.pubkey();
    e.timestamp = r.i64();
    e.virtual_sol_reserves = r.u64();
    e.virtual_token_reserves = r.u64();
    e.real_sol_reserves = r.u64();
    e.real_token_reserves = r.u64();
    if (r.remaining() >= 32 + 8 + 8 + 32 + 8 + 8) {
        e.fee_recipient = r.pubkey();
        e.fee_basis_points = r.u64();
        e.fee = r.u64();
        e.creator = r.pubkey();
        e.creator_fee_basis_points = r.u64();
        e.creator_fee = r.u64();
    }
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpfun_complete_event(BorshReader& r, const DecodeContext&) {
    PumpFunCompleteEvent e;
    e.user = r.pubkey();
    e.mint = r.pubkey();
    e.bonding_curve = r.pubkey();
    e.timestamp = r.i64();
    return finish(r, std::move(e));
}

// ---- pump.fun instructions --------------------------------------------------

std::optional<EventBody> pumpfun_create_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, 8)) return std::nullopt;
    PumpFunCreateEvent e;
    e.name = r.string();
    e.symbol = r.string();
    e.uri = r.string();
    e.mint = account_at(ctx, 0);
    e.bonding_curve = account_at(ctx, 2);
    e.user = account_at(ctx, 7);
    e.creator = r.remaining() >= 32 ? r.pubkey() : e.user;
    e.virtual_token_reserves = pf::INITIAL_VIRTUAL_TOKEN_RESERVES;
    e.virtual_sol_reserves = pf::INITIAL_VIRTUAL_SOL_RESERVES;
    e.real_token_reserves = pf::INITIAL_REAL_TOKEN_RESERVES;
    e.token_total_supply = pf::TOKEN_TOTAL_SUPPLY;
    return finish(r, std::move(e));
}

// buy: (token_amount, max_sol_cost); sell: (token_amount, min_sol_output)
std::optional<EventBody> pumpfun_trade_ix(BorshReader& r, const DecodeContext& ctx, bool is_buy) {
    if (!has_accounts(ctx, 7)) return std::nullopt;
    PumpFunTradeEvent e;
    e.token_amount = r.u64();
    e.sol_amount = r.u64();
    e.is_buy = is_buy;
    e.mint = account_at(ctx, 2);
    e.bonding_curve = account_at(ctx, 3);
    e.user = account_at(ctx, 6);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpfun_buy_ix(BorshReader& r, const DecodeContext& ctx) {
    return pumpfun_trade_ix(r, ctx, true);
}

std::optional<EventBody> pumpfun_sell_ix(BorshReader& r, const DecodeContext& ctx) {
    return pumpfun_trade_ix(r, ctx, false);
}

// ---- PumpSwap events --------------------------------------------------------

template <typename E>
void read_swap_tail(BorshReader& r, E& e) {
    e.pool = r.pubkey();
    e.user = r.pubkey();
    e.user_base_token_account = r.pubkey();
    e.user_quote_token_account = r.pubkey();
    e.protocol_fee_recipient = r.pubkey();
    e.protocol_fee_recipient_token_account = r.pubkey();
    if (r.remaining() >= 32 + 8 + 8) {
        e.coin_creator = r.pubkey();
        e.coin_creator_fee_basis_points = r.u64();
        e.coin_creator_fee = r.u64();
    }
}

std::optional<EventBody> pumpswap_buy_event(BorshReader& r, const DecodeContext&) {
    PumpSwapBuyEvent e;
    e.timestamp = r.i64();
    e.base_amount_out = r.u64();
    e.max_quote_amount_in = r.u64();
    e.user_base_token_reserves = r.u64();
    e.user_quote_token_reserves = r.u64();
    e.pool_base_token_reserves = r.u64();
    e.pool_quote_token_reserves = r.u64();
    e.quote_amount_in = r.u64();
    e.lp_fee_basis_points = r.u64();
    e.lp_fee = r.u64();
    e.protocol_fee_basis_points = r.u64();
    e.protocol_fee = r.u64();
    e.quote_amount_in_with_lp_fee = r.u64();
    e.user_quote_amount_in = r.u64();
    read_swap_tail(r, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_sell_event(BorshReader& r, const DecodeContext&) {
    PumpSwapSellEvent e;
    e.timestamp = r.i64();
    e.base_amount_in = r.u64();
    e.min_quote_amount_out = r.u64();
    e.user_base_token_reserves = r.u64();
    e.user_quote_token_reserves = r.u64();
    e.pool_base_token_reserves = r.u64();
    e.pool_quote_token_reserves = r.u64();
    e.quote_amount_out = r.u64();
    e.lp_fee_basis_points = r.u64();
    e.lp_fee = r.u64();
    e.protocol_fee_basis_points = r.u64();
    e.protocol_fee = r.u64();
    e.quote_amount_out_without_lp_fee = r.u64();
    e.user_quote_amount_out = r.u64();
    read_swap_tail(r, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_create_pool_event(BorshReader& r, const DecodeContext&) {
    PumpSwapCreatePoolEvent e;
    e.timestamp = r.i64();
    e.index = r.u16();
    e.creator = r.pubkey();
    e.base_mint = r.pubkey();
    e.quote_mint = r.pubkey();
    e.base_mint_decimals = r.u8();
    e.quote_mint_decimals = r.u8();
    e.base_amount_in = r.u64();
    e.quote_amount_in = r.u64();
    e.pool_base_amount = r.u64();
    e.pool_quote_amount = r.u64();
    e.minimum_liquidity = r.u64();
    e.initial_liquidity = r.u64();
    e.lp_token_amount_out = r.u64();
    e.pool_bump = r.u8();
    e.pool = r.pubkey();
    e.lp_mint = r.pubkey();
    e.user_base_token_account = r.pubkey();
    e.user_quote_token_account = r.pubkey();
    if (r.remaining() >= 32) e.coin_creator = r.pubkey();
    return finish(r, std::move(e));
}

template <typename E>
void read_liquidity_tail(BorshReader& r, E& e) {
    e.user_base_token_reserves = r.u64();
    e.user_quote_token_reserves = r.u64();
    e.pool_base_token_reserves = r.u64();
    e.pool_quote_token_reserves = r.u64();
}

template <typename E>
void read_liquidity_accounts(BorshReader& r, E& e) {
    e.pool = r.pubkey();
    e.user = r.pubkey();
    e.user_base_token_account = r.pubkey();
    e.user_quote_token_account = r.pubkey();
    e.user_pool_token_account = r.pubkey();
}

std::optional<EventBody> pumpswap_deposit_event(BorshReader& r, const DecodeContext&) {
    PumpSwapDepositEvent e;
    e.timestamp = r.i64();
    e.lp_token_amount_out = r.u64();
    e.max_base_amount_in = r.u64();
    e.max_quote_amount_in = r.u64();
    read_liquidity_tail(r, e);
    e.base_amount_in = r.u64();
    e.quote_amount_in = r.u64();
    e.lp_mint_supply = r.u64();
    read_liquidity_accounts(r, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_withdraw_event(BorshReader& r, const DecodeContext&) {
    PumpSwapWithdrawEvent e;
    e.timestamp = r.i64();
    e.lp_token_amount_in = r.u64();
    e.min_base_amount_out = r.u64();
    e.min_quote_amount_out = r.u64();
    read_liquidity_tail(r, e);
    e.base_amount_out = r.u64();
    e.quote_amount_out = r.u64();
    e.lp_mint_supply = r.u64();
    read_liquidity_accounts(r, e);
    return finish(r, std::move(e));
}

// ---- PumpSwap instructions --------------------------------------------------

constexpr std::size_t PUMPSWAP_SWAP_ACCOUNTS = 11;

template <typename E>
void swap_accounts(const DecodeContext& ctx, E& e) {
    e.pool = account_at(ctx, 0);
    e.user = account_at(ctx, 1);
    e.base_mint = account_at(ctx, 3);
    e.quote_mint = account_at(ctx, 4);
    e.user_base_token_account = account_at(ctx, 5);
    e.user_quote_token_account = account_at(ctx, 6);
    e.protocol_fee_recipient = account_at(ctx, 9);
    e.protocol_fee_recipient_token_account = account_at(ctx, 10);
}

std::optional<EventBody> pumpswap_buy_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, PUMPSWAP_SWAP_ACCOUNTS)) return std::nullopt;
    PumpSwapBuyEvent e;
    e.base_amount_out = r.u64();
    e.max_quote_amount_in = r.u64();
    swap_accounts(ctx, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_sell_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, PUMPSWAP_SWAP_ACCOUNTS)) return std::nullopt;
    PumpSwapSellEvent e;
    e.base_amount_in = r.u64();
    e.min_quote_amount_out = r.u64();
    swap_accounts(ctx, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_create_pool_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, 8)) return std::nullopt;
    PumpSwapCreatePoolEvent e;
    e.index = r.u16();
    e.base_amount_in = r.u64();
    e.quote_amount_in = r.u64();
    if (r.remaining() >= 32) e.coin_creator = r.pubkey();
    // Initial liquidity becomes the pool reserves
    e.pool_base_amount = e.base_amount_in;
    e.pool_quote_amount = e.quote_amount_in;
    e.pool = account_at(ctx, 0);
    e.creator = account_at(ctx, 2);
    e.base_mint = account_at(ctx, 3);
    e.quote_mint = account_at(ctx, 4);
    e.lp_mint = account_at(ctx, 5);
    e.user_base_token_account = account_at(ctx, 6);
    e.user_quote_token_account = account_at(ctx, 7);
    return finish(r, std::move(e));
}

template <typename E>
void liquidity_accounts(const DecodeContext& ctx, E& e) {
    e.pool = account_at(ctx, 0);
    e.user = account_at(ctx, 2);
    e.user_base_token_account = account_at(ctx, 6);
    e.user_quote_token_account = account_at(ctx, 7);
    e.user_pool_token_account = account_at(ctx, 8);
}

std::optional<EventBody> pumpswap_deposit_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, 9)) return std::nullopt;
    PumpSwapDepositEvent e;
    e.lp_token_amount_out = r.u64();
    e.max_base_amount_in = r.u64();
    e.max_quote_amount_in = r.u64();
    liquidity_accounts(ctx, e);
    return finish(r, std::move(e));
}

std::optional<EventBody> pumpswap_withdraw_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, 9)) return std::nullopt;
    PumpSwapWithdrawEvent e;
    e.lp_token_amount_in = r.u64();
    e.min_base_amount_out = r.u64();
    e.min_quote_amount_out = r.u64();
    liquidity_accounts(ctx, e);
    return finish(r, std::move(e));
}

// ---- Raydium Launchpad ------------------------------------------------------

std::optional<EventBody> bonk_trade_event(BorshReader& r, const DecodeContext&) {
    BonkTradeEvent e;
    e.pool_state = r.pubkey();
    e.total_base_sell = r.u64();
    e.virtual_base = r.u64();
    e.virtual_quote = r.u64();
    e.real_base_before = r.u64();
    e.real_quote_before = r.u64();
    e.real_base_after = r.u64();
    e.real_quote_after = r.u64();
    e.amount_in = r.u64();
    e.amount_out = r.u64();
    e.protocol_fee = r.u64();
    e.platform_fee = r.u64();
    e.share_fee = r.u64();
    uint8_t direction = r.u8();
    if (direction > 1) return std::nullopt;
    e.side = direction == 0 ? Side::Buy : Side::Sell;
    e.pool_status = r.u8();
    return finish(r, std::move(e));
}

std::optional<EventBody> bonk_pool_create_event(BorshReader& r, const DecodeContext&) {
    BonkPoolCreateEvent e;
    e.pool_state = r.pubkey();
    e.creator = r.pubkey();
    e.config = r.pubkey();
    e.base_decimals = r.u8();
    e.name = r.string();
    e.symbol = r.string();
    e.uri = r.string();
    return finish(r, std::move(e));
}

std::optional<EventBody> bonk_trade_ix(BorshReader& r, const DecodeContext& ctx, Side side) {
    if (!has_accounts(ctx, 11)) return std::nullopt;
    BonkTradeEvent e;
    e.amount_in = r.u64();
    e.amount_out = r.u64();  // minimum_amount_out
    r.u64();                 // share_fee_rate
    e.side = side;
    e.payer = account_at(ctx, 0);
    e.pool_state = account_at(ctx, 4);
    e.base_mint = account_at(ctx, 9);
    e.quote_mint = account_at(ctx, 10);
    return finish(r, std::move(e));
}

std::optional<EventBody> bonk_buy_ix(BorshReader& r, const DecodeContext& ctx) {
    return bonk_trade_ix(r, ctx, Side::Buy);
}

std::optional<EventBody> bonk_sell_ix(BorshReader& r, const DecodeContext& ctx) {
    return bonk_trade_ix(r, ctx, Side::Sell);
}

std::optional<EventBody> bonk_initialize_ix(BorshReader& r, const DecodeContext& ctx) {
    if (!has_accounts(ctx, 8)) return std::nullopt;
    BonkPoolCreateEvent e;
    e.base_decimals = r.u8();
    e.name = r.string();
    e.symbol = r.string();
    e.uri = r.string();
    e.creator = account_at(ctx, 1);
    e.config = account_at(ctx, 2);
    e.pool_state = account_at(ctx, 5);
    e.base_mint = account_at(ctx, 6);
    e.quote_mint = account_at(ctx, 7);
    return finish(r, std::move(e));
}

// =============================================================================
// Registry
// =============================================================================

using RuleKey = std::pair<Pubkey, Discriminator>;

const std::map<RuleKey, DecodeRule>& decode_rules() {
    static const std::map<RuleKey, DecodeRule> rules = {
        {{pf::PROGRAM, pf::CREATE_EVENT}, {"pumpfun.CreateEvent", 8 + 12 + 96, pumpfun_create_event}},
        {{pf::PROGRAM, pf::TRADE_EVENT}, {"pumpfun.TradeEvent", 8 + 121, pumpfun_trade_event}},
        {{pf::PROGRAM, pf::COMPLETE_EVENT}, {"pumpfun.CompleteEvent", 8 + 104, pumpfun_complete_event}},
        {{pf::PROGRAM, pf::CREATE_IX}, {"pumpfun.create", 8 + 12, pumpfun_create_ix}},
        {{pf::PROGRAM, pf::BUY_IX}, {"pumpfun.buy", 8 + 16, pumpfun_buy_ix}},
        {{pf::PROGRAM, pf::SELL_IX}, {"pumpfun.sell", 8 + 16, pumpfun_sell_ix}},

        {{ps::PROGRAM, ps::BUY_EVENT}, {"pumpswap.BuyEvent", 8 + 112 + 192, pumpswap_buy_event}},
        {{ps::PROGRAM, ps::SELL_EVENT}, {"pumpswap.SellEvent", 8 + 112 + 192, pumpswap_sell_event}},
        {{ps::PROGRAM, ps::CREATE_POOL_EVENT}, {"pumpswap.CreatePoolEvent", 8 + 293, pumpswap_create_pool_event}},
        {{ps::PROGRAM, ps::DEPOSIT_EVENT}, {"pumpswap.DepositEvent", 8 + 248, pumpswap_deposit_event}},
        {{ps::PROGRAM, ps::WITHDRAW_EVENT}, {"pumpswap.WithdrawEvent", 8 + 248, pumpswap_withdraw_event}},
        {{ps::PROGRAM, ps::BUY_IX}, {"pumpswap.buy", 8 + 16, pumpswap_buy_ix}},
        {{ps::PROGRAM, ps::SELL_IX}, {"pumpswap.sell", 8 + 16, pumpswap_sell_ix}},
        {{ps::PROGRAM, ps::CREATE_POOL_IX}, {"pumpswap.create_pool", 8 + 18, pumpswap_create_pool_ix}},
        {{ps::PROGRAM, ps::DEPOSIT_IX}, {"pumpswap.deposit", 8 + 24, pumpswap_deposit_ix}},
        {{ps::PROGRAM, ps::WITHDRAW_IX}, {"pumpswap.withdraw", 8 + 24, pumpswap_withdraw_ix}},

        {{bk::PROGRAM, bk::TRADE_EVENT}, {"bonk.TradeEvent", 8 + 130, bonk_trade_event}},
        {{bk::PROGRAM, bk::POOL_CREATE_EVENT}, {"bonk.PoolCreateEvent", 8 + 109, bonk_pool_create_event}},
        {{bk::PROGRAM, bk::BUY_EXACT_IN_IX}, {"bonk.buy_exact_in", 8 + 24, bonk_buy_ix}},
        {{bk::PROGRAM, bk::SELL_EXACT_IN_IX}, {"bonk.sell_exact_in", 8 + 24, bonk_sell_ix}},
        {{bk::PROGRAM, bk::INITIALIZE_IX}, {"bonk.initialize", 8 + 13, bonk_initialize_ix}},
    };
    return rules;
}

std::size_t protocol_index(ProtocolTag p) noexcept {
    return static_cast<std::size_t>(p);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

// =============================================================================
// EventCodec
// =============================================================================

EventCodec::EventCodec()
    : EventCodec(std::set<ProtocolTag>(ALL_PROTOCOLS.begin(), ALL_PROTOCOLS.end())) {}

EventCodec::EventCodec(std::set<ProtocolTag> protocols)
    : protocols_(std::move(protocols)) {
    for (auto p : protocols_) enabled_[protocol_index(p)] = true;
}

std::optional<ProtocolTag> EventCodec::protocol_for_program(const Pubkey& program_id) noexcept {
    if (program_id == pf::PROGRAM) return ProtocolTag::PumpFun;
    if (program_id == ps::PROGRAM) return ProtocolTag::PumpSwap;
    if (program_id == bk::PROGRAM) return ProtocolTag::Bonk;
    return std::nullopt;
}

const Pubkey& EventCodec::program_for(ProtocolTag protocol) noexcept {
    switch (protocol) {
        case ProtocolTag::PumpFun: return pf::PROGRAM;
        case ProtocolTag::PumpSwap: return ps::PROGRAM;
        case ProtocolTag::Bonk: return bk::PROGRAM;
    }
    return pf::PROGRAM;
}

bool EventCodec::accepts(ProtocolTag protocol) const noexcept {
    return enabled_[protocol_index(protocol)];
}

bool EventCodec::accepts(const Pubkey& program_id) const noexcept {
    auto protocol = protocol_for_program(program_id);
    return protocol && accepts(*protocol);
}

std::vector<Pubkey> EventCodec::program_ids() const {
    std::vector<Pubkey> ids;
    for (auto p : protocols_) ids.push_back(program_for(p));
    return ids;
}

DecodeResult EventCodec::classify(const uint8_t* data, std::size_t size,
                                  const Pubkey& program_id,
                                  const DecodeContext& ctx) const {
    auto protocol = protocol_for_program(program_id);
    if (!protocol) {
        return DecodeError{DecodeError::Code::UnknownProgram,
                           "program " + program_id.to_base58() + " is not supported"};
    }
    if (!accepts(*protocol)) {
        return DecodeError{DecodeError::Code::Filtered,
                           std::string(to_string(*protocol)) + " is not selected"};
    }

    // Self-CPI events carry an extra tag in front of the event discriminator
    if (size >= 16 && std::memcmp(data, constants::EVENT_IX_TAG.data(), 8) == 0) {
        data += 8;
        size -= 8;
    }
    if (size < 8) {
        return DecodeError{DecodeError::Code::TooShort,
                           "payload of " + std::to_string(size) + " bytes has no discriminator"};
    }

    Discriminator disc{};
    std::memcpy(disc.data(), data, 8);
    const auto& rules = decode_rules();
    auto it = rules.find({program_id, disc});
    if (it == rules.end()) {
        return DecodeError{DecodeError::Code::UnknownDiscriminator,
                           "unknown " + std::string(to_string(*protocol)) +
                           " discriminator " + hex_encode(disc.data(), disc.size())};
    }

    const DecodeRule& rule = it->second;
    if (size < rule.min_size) {
        return DecodeError{DecodeError::Code::TooShort,
                           std::string(rule.name) + " needs " + std::to_string(rule.min_size) +
                           " bytes, got " + std::to_string(size)};
    }

    BorshReader reader(data + 8, size - 8);
    auto body = rule.decode(reader, ctx);
    if (!body) {
        return DecodeError{DecodeError::Code::Malformed, std::string(rule.name) + " failed to decode"};
    }

    TradeEvent event;
    event.meta.protocol = *protocol;
    event.meta.kind = kind_of(*body);
    event.meta.source = ctx.source;
    event.meta.signature = ctx.signature;
    event.meta.slot = ctx.slot;
    event.meta.program_id = program_id;
    event.meta.instruction_index = ctx.instruction_index;
    event.body = std::move(*body);
    return event;
}

void EventCodec::push_result(DecodeResult result, std::vector<TradeEvent>& out) const {
    if (auto* event = std::get_if<TradeEvent>(&result)) {
        out.push_back(std::move(*event));
        return;
    }
    const auto& err = std::get<DecodeError>(result);
    if (err.code == DecodeError::Code::UnknownDiscriminator || err.code == DecodeError::Code::Filtered) {
        spdlog::trace("codec: skipped payload: {}", err.message);
    } else {
        spdlog::debug("codec: skipped payload ({}): {}", to_string(err.code), err.message);
    }
}

void EventCodec::decode_logs(const TransactionView& tx,
                             const std::set<Pubkey>& skip_programs,
                             std::vector<TradeEvent>& out) const {
    // Invocation stack attributes each "Program data:" line to its emitting program
    std::vector<Pubkey> stack;
    uint32_t top_level = 0;

    for (const auto& line : tx.logs) {
        if (starts_with(line, "Program data: ")) {
            if (stack.empty()) continue;
            const Pubkey& program = stack.back();
            if (!accepts(program) || skip_programs.count(program)) continue;

            auto payload = base64_decode(std::string_view(line).substr(14));
            if (!payload) {
                spdlog::debug("codec: bad program data in {}", tx.signature.to_base58());
                continue;
            }
            DecodeContext ctx{tx.signature, tx.slot, EventSource::ProgramLog,
                              top_level > 0 ? top_level - 1 : 0, nullptr};
            push_result(classify(*payload, program, ctx), out);
            continue;
        }
        if (starts_with(line, "Program log: ") || starts_with(line, "Program return: ") ||
            !starts_with(line, "Program ")) {
            continue;
        }

        // "Program <id> invoke [n]" / "Program <id> success" / "Program <id> failed: ..."
        auto key_end = line.find(' ', 8);
        if (key_end == std::string::npos) continue;
        auto verb = line.substr(key_end + 1);
        if (starts_with(verb, "invoke")) {
            auto key = Pubkey::parse(line.substr(8, key_end - 8));
            if (stack.empty()) ++top_level;
            stack.push_back(key.value_or(Pubkey{}));
        } else if ((starts_with(verb, "success") || starts_with(verb, "failed")) && !stack.empty()) {
            stack.pop_back();
        }
    }
}

std::vector<TradeEvent> EventCodec::decode_transaction(const TransactionView& tx) const {
    std::vector<TradeEvent> events;

    if (tx.confirmed) {
        // Programs emitting self-CPI events are not decoded again from their logs
        std::set<Pubkey> cpi_programs;
        for (const auto& ix : tx.instructions) {
            if (!ix.inner || !accepts(ix.program_id)) continue;
            if (ix.data.size() < 16 ||
                std::memcmp(ix.data.data(), constants::EVENT_IX_TAG.data(), 8) != 0) {
                continue;
            }
            DecodeContext ctx{tx.signature, tx.slot, EventSource::InnerInstruction, ix.index, nullptr};
            auto before = events.size();
            push_result(classify(ix.data, ix.program_id, ctx), events);
            if (events.size() > before) cpi_programs.insert(ix.program_id);
        }
        decode_logs(tx, cpi_programs, events);
    } else {
        for (const auto& ix : tx.instructions) {
            if (ix.inner || !accepts(ix.program_id)) continue;
            DecodeContext ctx{tx.signature, tx.slot, EventSource::Instruction, ix.index, &ix.accounts};
            push_result(classify(ix.data, ix.program_id, ctx), events);
        }
    }

    mark_creator_trades(events);
    return events;
}

// =============================================================================
// Creator trades
// =============================================================================

void mark_creator_trades(std::vector<TradeEvent>& events) {
    struct Creation {
        std::optional<Pubkey> creator;
        bool traded = false;
        bool flagged = false;
    };
    // Keyed by mint, or by market when the mint is unknown
    std::map<Pubkey, Creation> created;

    auto key_of = [](const TradeEvent& e) -> std::optional<Pubkey> {
        if (auto mint = e.mint()) return mint;
        return e.market();
    };

    for (auto& event : events) {
        auto key = key_of(event);
        if (!key) continue;

        if (event.meta.kind == EventKind::Create) {
            created[*key] = Creation{event.user()};
            if (auto market = event.market(); market && *market != *key) {
                created[*market] = Creation{event.user()};
            }
            continue;
        }
        if (event.meta.kind != EventKind::Buy && event.meta.kind != EventKind::Sell) continue;

        auto it = created.find(*key);
        if (it == created.end()) {
            if (auto market = event.market()) it = created.find(*market);
        }
        if (it == created.end()) continue;

        auto& creation = it->second;
        const bool first = !creation.traded;
        creation.traded = true;
        if (creation.flagged) continue;

        auto user = event.user();
        if (user && creation.creator) {
            creation.flagged = *user == *creation.creator;
        } else {
            // Trader unknown: the first trade of the creation transaction is the creator's
            creation.flagged = first;
        }
        event.meta.is_creator_trade = creation.flagged;
    }
}

}  // namespace solx::trading
