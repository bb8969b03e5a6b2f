// SolX Trading SDK - Trade Engine Tests

#include <catch2/catch_test_macros.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/engine.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/math.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

using namespace solx::trading;

namespace cst = solx::trading::constants;

namespace {

Pubkey key(uint8_t seed) {
    std::array<uint8_t, 32> raw{};
    raw.fill(seed);
    return Pubkey(raw);
}

Hash blockhash() {
    std::array<uint8_t, 32> raw{};
    raw.fill(0x42);
    return Hash(raw);
}

BondingCurveState fresh_curve() {
    BondingCurveState curve;
    curve.virtual_sol_reserves = cst::pumpfun::INITIAL_VIRTUAL_SOL_RESERVES;
    curve.virtual_token_reserves = cst::pumpfun::INITIAL_VIRTUAL_TOKEN_RESERVES;
    curve.real_token_reserves = cst::pumpfun::INITIAL_REAL_TOKEN_RESERVES;
    curve.token_total_supply = cst::pumpfun::TOKEN_TOTAL_SUPPLY;
    return curve;
}

class FakeChain : public ChainReader {
public:
    std::map<Pubkey, AccountInfo> accounts_by_key;
    std::map<Pubkey, uint64_t> balances;

    Hash latest_blockhash() override { return blockhash(); }

    std::optional<AccountInfo> account(const Pubkey& k) override {
        auto it = accounts_by_key.find(k);
        if (it == accounts_by_key.end()) return std::nullopt;
        return it->second;
    }

    uint64_t token_balance(const Pubkey& token_account) override {
        auto it = balances.find(token_account);
        if (it == balances.end()) throw NetworkError("no token account " + token_account.to_base58());
        return it->second;
    }
};

// Accepts everything and remembers what it was handed
class RecordingRelay : public Relay {
public:
    RecordingRelay(std::string name, RelayKind kind, std::optional<Pubkey> tip = std::nullopt)
        : name_(std::move(name)), kind_(kind), tip_(tip) {}

    const std::string& name() const override { return name_; }
    RelayKind kind() const override { return kind_; }
    std::optional<Pubkey> tip_account() const override { return tip_; }

    Signature submit(const SignedTransaction& tx, const CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        seen.push_back(&tx);
        return tx.signature();
    }

    std::vector<const SignedTransaction*> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen;
    }

private:
    std::string name_;
    RelayKind kind_;
    std::optional<Pubkey> tip_;
    mutable std::mutex mutex_;
    std::vector<const SignedTransaction*> seen;
};

struct Fixture {
    std::shared_ptr<const Keypair> signer = std::make_shared<const Keypair>(Keypair::generate());
    std::shared_ptr<FakeChain> chain = std::make_shared<FakeChain>();
    std::shared_ptr<RecordingRelay> rpc = std::make_shared<RecordingRelay>("rpc", RelayKind::Rpc);
    std::shared_ptr<RecordingRelay> jito = std::make_shared<RecordingRelay>("jito", RelayKind::Jito, key(50));

    TradeEngine engine(std::vector<uint64_t> tips = {10'000}) const {
        TradeContext context{signer, Config::baseline().with_priority_fee(150'000, 1'000).with_tips(std::move(tips))};
        return TradeEngine(std::move(context), chain, AdapterRegistry::with_defaults(), {rpc, jito});
    }

    TradeRequest buy() const {
        TradeRequest request;
        request.protocol = ProtocolTag::PumpFun;
        request.side = Side::Buy;
        request.mint = key(11);
        request.creator = key(12);
        request.amount = 100'000;
        request.slippage_bps = 100;
        request.recent_blockhash = blockhash();
        request.snapshot = MarketSnapshot(fresh_curve());
        return request;
    }

    void install_curve(const Pubkey& mint) const {
        AccountInfo info;
        info.owner = cst::pumpfun::PROGRAM;
        info.data = BorshWriter()
            .raw(cst::pumpfun::BONDING_CURVE_ACCOUNT)
            .u64(cst::pumpfun::INITIAL_VIRTUAL_TOKEN_RESERVES)
            .u64(cst::pumpfun::INITIAL_VIRTUAL_SOL_RESERVES)
            .u64(cst::pumpfun::INITIAL_REAL_TOKEN_RESERVES)
            .u64(0)
            .u64(cst::pumpfun::TOKEN_TOTAL_SUPPLY)
            .boolean(false)
            .pubkey(key(12))
            .take();
        chain->accounts_by_key[PumpFunAdapter::bonding_curve_address(mint)] = info;
    }
};

uint64_t read_u64(const Bytes& data, std::size_t offset) {
    BorshReader reader(data);
    reader.skip(offset);
    return reader.u64();
}

}  // namespace

TEST_CASE("Trade preparation", "[engine]") {
    Fixture fx;
    auto engine = fx.engine();

    SECTION("Compute budget first, tip last") {
        auto prepared = engine.prepare(fx.buy());
        const auto& ixs = prepared.instructions;
        REQUIRE(ixs.size() == 5);

        REQUIRE(ixs[0].program_id == cst::COMPUTE_BUDGET_PROGRAM);
        REQUIRE(ixs[0].data[0] == 2);
        REQUIRE(ixs[1].program_id == cst::COMPUTE_BUDGET_PROGRAM);
        REQUIRE(ixs[1].data[0] == 3);
        REQUIRE(read_u64(ixs[1].data, 1) == 1'000);

        REQUIRE(ixs[2].program_id == cst::ASSOCIATED_TOKEN_PROGRAM);
        REQUIRE(ixs[3].program_id == cst::pumpfun::PROGRAM);

        REQUIRE(ixs[4].program_id == cst::SYSTEM_PROGRAM);
        REQUIRE(ixs[4].accounts[1].pubkey == key(50));
        REQUIRE(read_u64(ixs[4].data, 4) == 10'000);

        REQUIRE(prepared.quote.expected_out == 3'576'654'744);
        REQUIRE(prepared.quote.min_out == 3'540'888'196);
        REQUIRE(prepared.relays.size() == 2);
    }

    SECTION("Signed once by the payer") {
        auto prepared = engine.prepare(fx.buy());
        REQUIRE(prepared.transaction);
        REQUIRE(prepared.transaction->signatures().size() == 1);
        REQUIRE(prepared.transaction->message().account_keys()[0] == fx.signer->pubkey());
        REQUIRE(prepared.transaction->message().recent_blockhash() == blockhash());
        REQUIRE(prepared.transaction->wire().size() <= cst::PACKET_DATA_SIZE);
    }

    SECTION("Loaded accounts limit is optional") {
        auto request = fx.buy();
        PriorityFeeConfig fee;
        fee.loaded_accounts_data_size_limit = 64 * 1024;
        fee.tip_lamports = {5'000};
        request.priority_fee = fee;
        auto prepared = engine.prepare(request);
        REQUIRE(prepared.instructions.size() == 6);
        REQUIRE(prepared.instructions[2].program_id == cst::COMPUTE_BUDGET_PROGRAM);
        REQUIRE(prepared.instructions[2].data[0] == 4);
        REQUIRE(read_u64(prepared.instructions.back().data, 4) == 5'000);
    }

    SECTION("RPC-only submission skips tips") {
        auto request = fx.buy();
        request.use_relays = false;
        auto prepared = engine.prepare(request);
        REQUIRE(prepared.relays.size() == 1);
        REQUIRE(prepared.relays[0]->name() == "rpc");
        REQUIRE(prepared.instructions.size() == 4);
        REQUIRE(prepared.instructions.back().program_id == cst::pumpfun::PROGRAM);
    }

    SECTION("Blockhash falls back to the chain") {
        auto request = fx.buy();
        request.recent_blockhash.reset();
        REQUIRE(engine.prepare(request).transaction->message().recent_blockhash() == blockhash());
    }

    SECTION("Tip amounts must match the tip-taking relays") {
        REQUIRE_THROWS_AS(fx.engine({}).prepare(fx.buy()), ValidationError);
        REQUIRE_THROWS_AS(fx.engine({1, 2}).prepare(fx.buy()), ValidationError);
    }

    SECTION("Quote failures surface before signing") {
        auto request = fx.buy();
        request.min_output = 4'000'000'000;
        REQUIRE_THROWS_AS(engine.prepare(request), SlippageExceeded);

        request = fx.buy();
        request.amount = 0;
        REQUIRE_THROWS_AS(engine.prepare(request), ValidationError);
    }

    SECTION("Snapshot loaded from the chain when not supplied") {
        auto request = fx.buy();
        request.snapshot.reset();
        REQUIRE_THROWS_AS(engine.prepare(request), ValidationError);

        fx.install_curve(request.mint);
        auto prepared = engine.prepare(request);

        // loaded curves carry the protocol fees
        auto charged = fresh_curve();
        charged.creator = key(12);
        charged.fee_basis_points = cst::pumpfun::FEE_BASIS_POINTS;
        charged.creator_fee_basis_points = cst::pumpfun::CREATOR_FEE_BASIS_POINTS;
        REQUIRE(prepared.quote.expected_out == math::bonding_curve_buy_tokens(charged, 100'000));
        REQUIRE(prepared.quote.expected_out < 3'576'654'744);
    }
}

TEST_CASE("Engine construction", "[engine]") {
    Fixture fx;

    SECTION("Signer is required") {
        TradeContext context{nullptr, Config::baseline()};
        REQUIRE_THROWS_AS(TradeEngine(context, fx.chain), ValidationError);
    }

    SECTION("Relays default to the configured ones") {
        TradeContext context{fx.signer, Config::baseline()};
        TradeEngine engine(context, fx.chain);
        REQUIRE(engine.relays().size() == context.config.relays.size());
        REQUIRE(engine.payer() == fx.signer->pubkey());
    }

    SECTION("Configured lookup table must exist") {
        TradeContext context{fx.signer, Config::baseline().with_lookup_table(key(77))};
        REQUIRE_THROWS_AS(TradeEngine(context, fx.chain), ValidationError);
    }
}

TEST_CASE("Trade execution", "[engine]") {
    Fixture fx;
    auto engine = fx.engine();

    SECTION("One signed transaction goes to every relay") {
        auto result = engine.execute(fx.buy()).get();
        REQUIRE(result.protocol == ProtocolTag::PumpFun);
        REQUIRE(result.side == Side::Buy);
        REQUIRE(result.mint == key(11));
        REQUIRE((result.relay == "rpc" || result.relay == "jito"));
        REQUIRE(result.total_latency_us >= result.submit_latency_us);

        // the loser may still be running; both eventually see the same object
        std::vector<const SignedTransaction*> rpc_seen, jito_seen;
        for (int i = 0; i < 500; ++i) {
            rpc_seen = fx.rpc->received();
            jito_seen = fx.jito->received();
            if (!rpc_seen.empty() && !jito_seen.empty()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        REQUIRE(rpc_seen.size() == 1);
        REQUIRE(jito_seen.size() == 1);
        REQUIRE(rpc_seen[0] == jito_seen[0]);
        REQUIRE(result.signature == rpc_seen[0]->signature());
    }

    SECTION("Buy helper") {
        // no snapshot: the helper reads the curve from the chain
        fx.install_curve(key(11));
        auto result = engine.buy(ProtocolTag::PumpFun, key(11), key(12), 100'000, 100, blockhash(),
                                 std::nullopt, false);
        REQUIRE(result.get().relay == "rpc");
    }

    SECTION("Errors arrive through the future") {
        auto request = fx.buy();
        request.amount = 0;
        auto future = engine.execute(request);
        REQUIRE_THROWS_AS(future.get(), ValidationError);
    }
}

TEST_CASE("Sell by percentage", "[engine]") {
    Fixture fx;
    auto engine = fx.engine();
    const Pubkey mint = key(11);
    const Pubkey token_account = associated_token_address(fx.signer->pubkey(), mint);
    fx.install_curve(mint);

    SECTION("Percentage bounds") {
        fx.chain->balances[token_account] = 1'000'000;
        REQUIRE_THROWS_AS(engine.sell_percent(ProtocolTag::PumpFun, mint, key(12), 0, 100).get(),
                          ValidationError);
        REQUIRE_THROWS_AS(engine.sell_percent(ProtocolTag::PumpFun, mint, key(12), 101, 100).get(),
                          ValidationError);
    }

    SECTION("Empty token account") {
        fx.chain->balances[token_account] = 0;
        REQUIRE_THROWS_AS(engine.sell_percent(ProtocolTag::PumpFun, mint, key(12), 50, 100).get(),
                          ValidationError);
    }

    SECTION("Missing token account") {
        REQUIRE_THROWS_AS(engine.sell_percent(ProtocolTag::PumpFun, mint, key(12), 50, 100).get(),
                          NetworkError);
    }

    SECTION("Sells the requested share of the balance") {
        fx.chain->balances[token_account] = 1'000'000'000'000;
        auto result = engine.sell_percent(ProtocolTag::PumpFun, mint, key(12), 25, 500, false).get();
        REQUIRE(result.side == Side::Sell);
        REQUIRE(result.quote.amount_in == 250'000'000'000);
        REQUIRE(result.relay == "rpc");

        auto seen = fx.rpc->received();
        REQUIRE(seen.size() == 1);
        const auto& message = seen[0]->message();
        bool found = false;
        for (const auto& ix : message.instructions()) {
            if (message.account_keys()[ix.program_id_index] != cst::pumpfun::PROGRAM) continue;
            REQUIRE(read_u64(ix.data, 8) == 250'000'000'000);
            found = true;
        }
        REQUIRE(found);
    }
}

TEST_CASE("Create and buy", "[engine][pumpfun]") {
    Fixture fx;
    auto engine = fx.engine();
    auto mint = std::make_shared<const Keypair>(Keypair::generate());
    TokenMetadata metadata{"Example", "EXM", "https://example.invalid/exm.json"};

    SECTION("Mint co-signs the transaction") {
        auto result = engine.create_and_buy(mint, metadata, 100'000, 100, blockhash(), false).get();
        REQUIRE(result.mint == mint->pubkey());
        auto curve = BondingCurveState::after_initial_buy(mint->pubkey(), fx.signer->pubkey(), 0, 0);
        REQUIRE(result.quote.expected_out == math::bonding_curve_buy_tokens(curve, 100'000));

        auto seen = fx.rpc->received();
        REQUIRE(seen.size() == 1);
        REQUIRE(seen[0]->signatures().size() == 2);
        auto signers = seen[0]->message().signer_keys();
        REQUIRE(signers[0] == fx.signer->pubkey());
        REQUIRE(signers[1] == mint->pubkey());
    }

    SECTION("Mint keypair is required") {
        REQUIRE_THROWS_AS(engine.create_and_buy(nullptr, metadata, 100'000, 100, blockhash()).get(),
                          ValidationError);
    }
}
