// SolX Trading SDK - Event Codec Tests

#include <catch2/catch_test_macros.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/codec.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/market.hpp>

using namespace solx::trading;

namespace cst = solx::trading::constants;

namespace {

Pubkey key(uint8_t seed) {
    std::array<uint8_t, 32> raw{};
    raw.fill(seed);
    return Pubkey(raw);
}

Signature test_signature() {
    std::array<uint8_t, 64> raw{};
    raw.fill(0x5a);
    return Signature(raw);
}

Bytes pumpfun_trade_event(const Pubkey& mint, const Pubkey& user, bool is_buy) {
    return BorshWriter()
        .raw(cst::pumpfun::TRADE_EVENT)
        .pubkey(mint)
        .u64(1'000'000'000)        // sol_amount
        .u64(34'000'000'000'000)   // token_amount
        .boolean(is_buy)
        .pubkey(user)
        .i64(1'700'000'000)
        .u64(31'000'000'000)       // virtual_sol_reserves
        .u64(1'039'000'000'000'000)  // virtual_token_reserves
        .u64(1'000'000'000)        // real_sol_reserves
        .u64(759'100'000'000'000)  // real_token_reserves
        .pubkey(cst::pumpfun::FEE_RECIPIENT)
        .u64(95)
        .u64(9'500'000)
        .pubkey(user)
        .u64(5)
        .u64(500'000)
        .take();
}

Bytes pumpfun_create_event(const Pubkey& mint, const Pubkey& curve, const Pubkey& user) {
    return BorshWriter()
        .raw(cst::pumpfun::CREATE_EVENT)
        .string("Test Token")
        .string("TEST")
        .string("https://example.invalid/meta.json")
        .pubkey(mint)
        .pubkey(curve)
        .pubkey(user)
        .pubkey(user)
        .i64(1'700'000'000)
        .u64(cst::pumpfun::INITIAL_VIRTUAL_TOKEN_RESERVES)
        .u64(cst::pumpfun::INITIAL_VIRTUAL_SOL_RESERVES)
        .u64(cst::pumpfun::INITIAL_REAL_TOKEN_RESERVES)
        .u64(cst::pumpfun::TOKEN_TOTAL_SUPPLY)
        .take();
}

Bytes bonk_trade_event(const Pubkey& pool, uint8_t direction) {
    BorshWriter w;
    w.raw(cst::bonk::TRADE_EVENT).pubkey(pool);
    for (uint64_t v : {793'100'000'000'000ULL, 1'073'025'605'596'382ULL, 30'000'852'951ULL,
                       0ULL, 0ULL, 34'193'904'632'554ULL, 987'500'000ULL,
                       1'000'000'000ULL, 34'193'904'632'554ULL, 2'500'000ULL, 10'000'000ULL, 0ULL}) {
        w.u64(v);
    }
    w.u8(direction).u8(0);
    return w.take();
}

std::string program_invoke(const Pubkey& program, int depth) {
    return "Program " + program.to_base58() + " invoke [" + std::to_string(depth) + "]";
}

std::string program_success(const Pubkey& program) {
    return "Program " + program.to_base58() + " success";
}

std::string program_data(const Bytes& payload) {
    return "Program data: " + base64_encode(payload);
}

template <typename T>
const T& event_of(const DecodeResult& result) {
    REQUIRE(std::holds_alternative<TradeEvent>(result));
    const auto* body = std::get<TradeEvent>(result).get<T>();
    REQUIRE(body != nullptr);
    return *body;
}

DecodeError::Code error_of(const DecodeResult& result) {
    REQUIRE(std::holds_alternative<DecodeError>(result));
    return std::get<DecodeError>(result).code;
}

}  // namespace

TEST_CASE("Decoding pump.fun events", "[codec][pumpfun]") {
    EventCodec codec;
    const auto mint = key(1);
    const auto user = key(2);

    SECTION("TradeEvent fields") {
        DecodeContext ctx;
        ctx.signature = test_signature();
        ctx.slot = 321;
        auto result = codec.classify(pumpfun_trade_event(mint, user, true), cst::pumpfun::PROGRAM, ctx);
        const auto& e = event_of<PumpFunTradeEvent>(result);
        REQUIRE(e.mint == mint);
        REQUIRE(e.user == user);
        REQUIRE(e.is_buy);
        REQUIRE(e.sol_amount == 1'000'000'000);
        REQUIRE(e.token_amount == 34'000'000'000'000);
        REQUIRE(e.timestamp == 1'700'000'000);
        REQUIRE(e.virtual_sol_reserves == 31'000'000'000);
        REQUIRE(e.virtual_token_reserves == 1'039'000'000'000'000);
        REQUIRE(e.real_token_reserves == 759'100'000'000'000);
        REQUIRE(e.fee_recipient == cst::pumpfun::FEE_RECIPIENT);
        REQUIRE(e.fee_basis_points == 95);
        REQUIRE(e.creator == user);
        REQUIRE(e.creator_fee == 500'000);

        const auto& meta = std::get<TradeEvent>(result).meta;
        REQUIRE(meta.protocol == ProtocolTag::PumpFun);
        REQUIRE(meta.kind == EventKind::Buy);
        REQUIRE(meta.slot == 321);
        REQUIRE(meta.signature == test_signature());
        REQUIRE(meta.program_id == cst::pumpfun::PROGRAM);
    }

    SECTION("Sell direction") {
        auto result = codec.classify(pumpfun_trade_event(mint, user, false), cst::pumpfun::PROGRAM);
        REQUIRE(std::get<TradeEvent>(result).meta.kind == EventKind::Sell);
    }

    SECTION("Events from older program versions omit the fee tail") {
        auto payload = pumpfun_trade_event(mint, user, true);
        payload.resize(8 + 121);
        auto result = codec.classify(payload, cst::pumpfun::PROGRAM);
        const auto& e = event_of<PumpFunTradeEvent>(result);
        REQUIRE(e.real_token_reserves == 759'100'000'000'000);
        REQUIRE(e.creator.is_default());
    }

    SECTION("CreateEvent strings and reserves") {
        auto result = codec.classify(pumpfun_create_event(mint, key(3), user), cst::pumpfun::PROGRAM);
        const auto& e = event_of<PumpFunCreateEvent>(result);
        REQUIRE(e.name == "Test Token");
        REQUIRE(e.symbol == "TEST");
        REQUIRE(e.uri == "https://example.invalid/meta.json");
        REQUIRE(e.mint == mint);
        REQUIRE(e.bonding_curve == key(3));
        REQUIRE(e.user == user);
        REQUIRE(e.virtual_sol_reserves == cst::pumpfun::INITIAL_VIRTUAL_SOL_RESERVES);
        REQUIRE(std::get<TradeEvent>(result).meta.kind == EventKind::Create);
    }

    SECTION("Self-CPI tag in front of the discriminator") {
        BorshWriter w;
        w.raw(cst::EVENT_IX_TAG);
        auto inner = pumpfun_trade_event(mint, user, true);
        w.raw(inner.data(), inner.size());
        auto result = codec.classify(w.data(), cst::pumpfun::PROGRAM);
        REQUIRE(event_of<PumpFunTradeEvent>(result).mint == mint);
    }
}

TEST_CASE("Decoding Raydium Launchpad events", "[codec][bonk]") {
    EventCodec codec;

    SECTION("TradeEvent fields") {
        auto result = codec.classify(bonk_trade_event(key(9), 1), cst::bonk::PROGRAM);
        const auto& e = event_of<BonkTradeEvent>(result);
        REQUIRE(e.pool_state == key(9));
        REQUIRE(e.virtual_base == 1'073'025'605'596'382);
        REQUIRE(e.amount_in == 1'000'000'000);
        REQUIRE(e.platform_fee == 10'000'000);
        REQUIRE(e.side == Side::Sell);
        REQUIRE(std::get<TradeEvent>(result).meta.protocol == ProtocolTag::Bonk);
    }

    SECTION("Unknown trade direction is malformed") {
        auto result = codec.classify(bonk_trade_event(key(9), 2), cst::bonk::PROGRAM);
        REQUIRE(error_of(result) == DecodeError::Code::Malformed);
    }
}

TEST_CASE("Decode errors", "[codec]") {
    EventCodec codec;
    auto payload = pumpfun_trade_event(key(1), key(2), true);

    SECTION("Unsupported program") {
        REQUIRE(error_of(codec.classify(payload, key(77))) == DecodeError::Code::UnknownProgram);
    }

    SECTION("Unselected protocol") {
        EventCodec swap_only(std::set<ProtocolTag>{ProtocolTag::PumpSwap});
        REQUIRE(error_of(swap_only.classify(payload, cst::pumpfun::PROGRAM)) == DecodeError::Code::Filtered);
        REQUIRE_FALSE(swap_only.accepts(cst::pumpfun::PROGRAM));
        REQUIRE(swap_only.accepts(cst::pumpswap::PROGRAM));
        REQUIRE(swap_only.program_ids() == std::vector<Pubkey>{cst::pumpswap::PROGRAM});
    }

    SECTION("No discriminator") {
        Bytes short_payload{1, 2, 3};
        REQUIRE(error_of(codec.classify(short_payload, cst::pumpfun::PROGRAM)) == DecodeError::Code::TooShort);
    }

    SECTION("Unknown discriminator") {
        Bytes unknown(64, 0xee);
        REQUIRE(error_of(codec.classify(unknown, cst::pumpfun::PROGRAM)) ==
                DecodeError::Code::UnknownDiscriminator);
    }

    SECTION("Truncated event") {
        payload.resize(40);
        REQUIRE(error_of(codec.classify(payload, cst::pumpfun::PROGRAM)) == DecodeError::Code::TooShort);
    }

    SECTION("Oversized string length") {
        BorshWriter w;
        w.raw(cst::pumpfun::CREATE_EVENT).u32(5000);
        Bytes zeros(200, 0);
        w.raw(zeros.data(), zeros.size());
        REQUIRE(error_of(codec.classify(w.data(), cst::pumpfun::PROGRAM)) == DecodeError::Code::Malformed);
    }
}

TEST_CASE("Classify is total over arbitrary bytes", "[codec]") {
    EventCodec codec;
    const std::vector<Pubkey> programs = {cst::pumpfun::PROGRAM, cst::pumpswap::PROGRAM,
                                          cst::bonk::PROGRAM, key(5)};
    const std::vector<Pubkey> accounts(4, key(6));

    uint64_t state = 0x9e3779b97f4a7c15ULL;
    auto next = [&state]() {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<uint8_t>(state >> 56);
    };

    // Known discriminators followed by random tails exercise every layout decoder
    std::vector<cst::Discriminator> prefixes = {
        cst::pumpfun::CREATE_EVENT, cst::pumpfun::TRADE_EVENT, cst::pumpfun::CREATE_IX,
        cst::pumpfun::BUY_IX, cst::pumpswap::BUY_EVENT, cst::pumpswap::CREATE_POOL_EVENT,
        cst::pumpswap::DEPOSIT_IX, cst::bonk::TRADE_EVENT, cst::bonk::POOL_CREATE_EVENT,
        cst::bonk::INITIALIZE_IX};

    for (int round = 0; round < 400; ++round) {
        Bytes data;
        if (round % 2 == 0) {
            const auto& prefix = prefixes[static_cast<std::size_t>(round / 2) % prefixes.size()];
            data.assign(prefix.begin(), prefix.end());
        }
        std::size_t len = next() + (round % 3) * 100;
        for (std::size_t i = 0; i < len; ++i) data.push_back(next());

        DecodeContext ctx;
        ctx.source = EventSource::Instruction;
        ctx.accounts = round % 4 == 0 ? nullptr : &accounts;
        for (const auto& program : programs) {
            REQUIRE_NOTHROW(codec.classify(data, program, ctx));
        }
    }
}

TEST_CASE("Decoding confirmed transactions", "[codec]") {
    EventCodec codec;
    const auto mint = key(1);
    const auto user = key(2);
    const auto trade = pumpfun_trade_event(mint, user, true);

    TransactionView tx;
    tx.signature = test_signature();
    tx.slot = 99;
    tx.confirmed = true;

    SECTION("Program data log lines") {
        tx.logs = {
            program_invoke(cst::COMPUTE_BUDGET_PROGRAM, 1),
            program_success(cst::COMPUTE_BUDGET_PROGRAM),
            program_invoke(cst::pumpfun::PROGRAM, 1),
            "Program log: Instruction: Buy",
            program_data(trade),
            program_success(cst::pumpfun::PROGRAM),
        };
        auto events = codec.decode_transaction(tx);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].meta.source == EventSource::ProgramLog);
        REQUIRE(events[0].meta.instruction_index == 1);
        REQUIRE(events[0].meta.slot == 99);
        REQUIRE(events[0].mint() == mint);
    }

    SECTION("Data logged by another program is not attributed to pump.fun") {
        tx.logs = {
            program_invoke(cst::pumpfun::PROGRAM, 1),
            program_invoke(cst::TOKEN_PROGRAM, 2),
            program_data(trade),
            program_success(cst::TOKEN_PROGRAM),
            program_success(cst::pumpfun::PROGRAM),
        };
        REQUIRE(codec.decode_transaction(tx).empty());
    }

    SECTION("Self-CPI instructions take precedence over logs") {
        InstructionView outer;
        outer.program_id = cst::pumpfun::PROGRAM;
        outer.index = 0;
        InstructionView inner;
        inner.program_id = cst::pumpfun::PROGRAM;
        inner.data.assign(cst::EVENT_IX_TAG.begin(), cst::EVENT_IX_TAG.end());
        inner.data.insert(inner.data.end(), trade.begin(), trade.end());
        inner.index = 0;
        inner.inner = true;
        tx.instructions = {outer, inner};
        tx.logs = {program_invoke(cst::pumpfun::PROGRAM, 1), program_data(trade),
                   program_success(cst::pumpfun::PROGRAM)};

        auto events = codec.decode_transaction(tx);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].meta.source == EventSource::InnerInstruction);
    }

    SECTION("Malformed base64 is skipped") {
        tx.logs = {program_invoke(cst::pumpfun::PROGRAM, 1), "Program data: !!!not-base64",
                   program_success(cst::pumpfun::PROGRAM)};
        REQUIRE(codec.decode_transaction(tx).empty());
    }
}

TEST_CASE("Decoding unconfirmed instruction fragments", "[codec]") {
    EventCodec codec;
    std::vector<Pubkey> accounts;
    for (uint8_t i = 0; i < 12; ++i) accounts.push_back(key(static_cast<uint8_t>(20 + i)));

    TransactionView tx;
    tx.signature = test_signature();
    tx.confirmed = false;

    InstructionView buy;
    buy.program_id = cst::pumpfun::PROGRAM;
    buy.accounts = accounts;
    buy.data = BorshWriter().raw(cst::pumpfun::BUY_IX).u64(5'000'000).u64(200'000'000).take();
    buy.index = 2;
    tx.instructions = {buy};

    auto events = codec.decode_transaction(tx);
    REQUIRE(events.size() == 1);
    const auto* e = events[0].get<PumpFunTradeEvent>();
    REQUIRE(e != nullptr);
    REQUIRE(e->is_buy);
    REQUIRE(e->token_amount == 5'000'000);
    REQUIRE(e->sol_amount == 200'000'000);
    REQUIRE(e->mint == accounts[2]);
    REQUIRE(e->bonding_curve == accounts[3]);
    REQUIRE(e->user == accounts[6]);
    REQUIRE(events[0].meta.source == EventSource::Instruction);
    REQUIRE(events[0].meta.instruction_index == 2);

    SECTION("Instruction-derived trades carry no reserves") {
        REQUIRE_FALSE(MarketSnapshot::from_event(events[0]).has_value());
    }

    SECTION("Too few accounts is malformed, not a crash") {
        tx.instructions[0].accounts.resize(3);
        REQUIRE(codec.decode_transaction(tx).empty());
    }
}

TEST_CASE("Creator trade detection", "[codec]") {
    EventCodec codec;
    const auto mint = key(1);
    const auto creator = key(2);
    const auto other = key(3);

    auto decode = [&](const Bytes& payload) {
        return std::get<TradeEvent>(codec.classify(payload, cst::pumpfun::PROGRAM));
    };

    SECTION("Creator buying in its own creation transaction") {
        std::vector<TradeEvent> events = {
            decode(pumpfun_create_event(mint, key(4), creator)),
            decode(pumpfun_trade_event(mint, creator, true)),
            decode(pumpfun_trade_event(mint, other, true)),
        };
        mark_creator_trades(events);
        REQUIRE_FALSE(events[0].meta.is_creator_trade);
        REQUIRE(events[1].meta.is_creator_trade);
        REQUIRE_FALSE(events[2].meta.is_creator_trade);
    }

    SECTION("Only the creator's first trade is flagged") {
        std::vector<TradeEvent> events = {
            decode(pumpfun_create_event(mint, key(4), creator)),
            decode(pumpfun_trade_event(mint, other, true)),
            decode(pumpfun_trade_event(mint, creator, true)),
            decode(pumpfun_trade_event(mint, creator, true)),
        };
        mark_creator_trades(events);
        REQUIRE_FALSE(events[1].meta.is_creator_trade);
        REQUIRE(events[2].meta.is_creator_trade);
        REQUIRE_FALSE(events[3].meta.is_creator_trade);
    }

    SECTION("Trades without a creation event are never flagged") {
        std::vector<TradeEvent> events = {decode(pumpfun_trade_event(mint, creator, true))};
        mark_creator_trades(events);
        REQUIRE_FALSE(events[0].meta.is_creator_trade);
    }
}

TEST_CASE("Snapshots from observed events", "[codec][market]") {
    EventCodec codec;
    const auto mint = key(1);

    SECTION("pump.fun trade carries post-trade reserves") {
        auto event = std::get<TradeEvent>(
            codec.classify(pumpfun_trade_event(mint, key(2), true), cst::pumpfun::PROGRAM));
        auto snapshot = MarketSnapshot::from_event(event);
        REQUIRE(snapshot.has_value());
        const auto* curve = snapshot->get<BondingCurveState>();
        REQUIRE(curve != nullptr);
        REQUIRE(curve->virtual_sol_reserves == 31'000'000'000);
        REQUIRE(curve->real_token_reserves == 759'100'000'000'000);
        REQUIRE(curve->fee_basis_points == 95);
    }

    SECTION("pump.fun creation starts from the initial curve") {
        auto event = std::get<TradeEvent>(
            codec.classify(pumpfun_create_event(mint, key(4), key(2)), cst::pumpfun::PROGRAM));
        auto snapshot = MarketSnapshot::from_event(event);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->protocol() == ProtocolTag::PumpFun);
        REQUIRE(snapshot->get<BondingCurveState>()->creator == key(2));
        REQUIRE(snapshot->get<BondingCurveState>()->bonding_curve == key(4));
    }

    SECTION("Launchpad trade uses post-trade real reserves") {
        auto event = std::get<TradeEvent>(codec.classify(bonk_trade_event(key(9), 0), cst::bonk::PROGRAM));
        auto snapshot = MarketSnapshot::from_event(event);
        REQUIRE(snapshot.has_value());
        const auto* pool = snapshot->get<LaunchpadState>();
        REQUIRE(pool != nullptr);
        REQUIRE(pool->real_base == 34'193'904'632'554);
        REQUIRE(pool->real_quote == 987'500'000);
        REQUIRE(pool->protocol_fee_rate == cst::bonk::PROTOCOL_FEE_RATE);
    }
}
