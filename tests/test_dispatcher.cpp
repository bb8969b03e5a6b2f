// SolX Trading SDK - Relay Dispatcher Tests

#include <catch2/catch_test_macros.hpp>
#include <solx/trading/dispatcher.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/programs.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <sstream>
#include <thread>

using namespace solx::trading;

namespace {

// Accepts or rejects after a delay; gives up early when the race is cancelled
class ScriptedRelay : public Relay {
public:
    ScriptedRelay(std::string name, std::chrono::milliseconds delay, bool succeed,
                  RelayKind kind = RelayKind::Rpc)
        : name_(std::move(name)), delay_(delay), succeed_(succeed), kind_(kind) {}

    const std::string& name() const override { return name_; }
    RelayKind kind() const override { return kind_; }
    std::optional<Pubkey> tip_account() const override { return std::nullopt; }

    Signature submit(const SignedTransaction& tx, const CancellationToken& cancel) override {
        ++calls;
        auto deadline = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel.cancelled()) {
                saw_cancel = true;
                throw NetworkError(name_ + ": cancelled");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!succeed_) throw NetworkError(name_ + ": rejected", "http://relay.invalid", 500);
        return tx.signature();
    }

    std::atomic<int> calls{0};
    std::atomic<bool> saw_cancel{false};

private:
    std::string name_;
    std::chrono::milliseconds delay_;
    bool succeed_;
    RelayKind kind_;
};

std::shared_ptr<const SignedTransaction> signed_transfer(const Keypair& payer) {
    auto msg = Message::compile_legacy(payer.pubkey(),
                                       {programs::system::transfer(payer.pubkey(), Keypair::generate().pubkey(), 1)},
                                       Hash{});
    return std::make_shared<const SignedTransaction>(SignedTransaction::sign(std::move(msg), {&payer}));
}

}  // namespace

TEST_CASE("Relay race", "[dispatcher]") {
    auto payer = Keypair::generate();
    auto tx = signed_transfer(payer);
    using std::chrono::milliseconds;

    SECTION("Later success beats an earlier failure") {
        auto slow_ok = std::make_shared<ScriptedRelay>("a", milliseconds(10), true);
        auto fast_fail = std::make_shared<ScriptedRelay>("b", milliseconds(5), false);
        RelayDispatcher dispatcher({slow_ok, fast_fail});

        auto result = dispatcher.submit(tx).get();
        REQUIRE(result.relay == "a");
        REQUIRE(result.signature == tx->signature());
        REQUIRE(result.latency_us >= 10'000);
    }

    SECTION("First success wins and cancels the rest") {
        auto fast = std::make_shared<ScriptedRelay>("fast", milliseconds(1), true);
        auto slow = std::make_shared<ScriptedRelay>("slow", milliseconds(2'000), true);
        auto result = RelayDispatcher::race(tx, {fast, slow}).get();
        REQUIRE(result.relay == "fast");

        for (int i = 0; i < 500 && !slow->saw_cancel; ++i) {
            std::this_thread::sleep_for(milliseconds(2));
        }
        REQUIRE(slow->saw_cancel);
    }

    SECTION("Relays finishing after the race settles do not log") {
        std::ostringstream captured;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        auto previous = spdlog::default_logger();
        auto logger = std::make_shared<spdlog::logger>("dispatcher-test", sink);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);

        auto fast = std::make_shared<ScriptedRelay>("winner", milliseconds(1), true);
        auto late = std::make_shared<ScriptedRelay>("late-relay", milliseconds(2'000), false);
        auto result = RelayDispatcher::race(tx, {fast, late}).get();
        REQUIRE(result.relay == "winner");

        // The worker drops its reference once it has finished
        for (int i = 0; i < 1000 && late.use_count() > 1; ++i) {
            std::this_thread::sleep_for(milliseconds(2));
        }
        spdlog::set_default_logger(previous);

        REQUIRE(late.use_count() == 1);
        REQUIRE(late->saw_cancel);
        const auto output = captured.str();
        REQUIRE(output.find("winner") != std::string::npos);
        REQUIRE(output.find("late-relay") == std::string::npos);
    }

    SECTION("Every relay receives the same transaction once") {
        auto a = std::make_shared<ScriptedRelay>("a", milliseconds(1), true);
        auto b = std::make_shared<ScriptedRelay>("b", milliseconds(1), true);
        auto c = std::make_shared<ScriptedRelay>("c", milliseconds(1), true);
        auto result = RelayDispatcher::race(tx, {a, b, c}).get();
        REQUIRE(result.signature == tx->signature());

        for (int i = 0; i < 500 && (a->calls + b->calls + c->calls) < 3; ++i) {
            std::this_thread::sleep_for(milliseconds(2));
        }
        REQUIRE(a->calls == 1);
        REQUIRE(b->calls == 1);
        REQUIRE(c->calls == 1);
    }

    SECTION("All relays failing lists each failure") {
        auto a = std::make_shared<ScriptedRelay>("a", milliseconds(2), false);
        auto b = std::make_shared<ScriptedRelay>("b", milliseconds(4), false);
        auto future = RelayDispatcher::race(tx, {a, b});
        try {
            (void)future.get();
            FAIL("expected AllRelaysFailed");
        } catch (const AllRelaysFailed& e) {
            REQUIRE(e.failures().size() == 2);
            std::set<std::string> names;
            for (const auto& failure : e.failures()) {
                names.insert(failure.relay);
                REQUIRE(failure.message == failure.relay + ": rejected");
            }
            REQUIRE(names == std::set<std::string>{"a", "b"});
        }
    }

    SECTION("No relays") {
        REQUIRE_THROWS_AS(RelayDispatcher::race(tx, {}), ValidationError);
        RelayDispatcher empty(std::vector<std::shared_ptr<Relay>>{});
        REQUIRE_THROWS_AS(empty.submit(tx), ValidationError);
    }

    SECTION("No transaction") {
        auto a = std::make_shared<ScriptedRelay>("a", milliseconds(1), true);
        REQUIRE_THROWS_AS(RelayDispatcher::race(nullptr, {a}), ValidationError);
    }
}

TEST_CASE("Relay configuration helpers", "[relay]") {
    SECTION("Kind names") {
        REQUIRE(relay_kind_from_string("jito") == RelayKind::Jito);
        REQUIRE(relay_kind_from_string("rpc") == RelayKind::Rpc);
        REQUIRE_FALSE(relay_kind_from_string("carrier-pigeon").has_value());
        REQUIRE(std::string(to_string(RelayKind::Nozomi)) == "nozomi");
    }

    SECTION("Tip accounts") {
        REQUIRE(tip_accounts(RelayKind::Rpc).empty());
        REQUIRE(tip_accounts(RelayKind::Jito).size() == 8);
    }

    SECTION("HTTP relay picks a known tip account unless overridden") {
        RelayConfig cfg;
        cfg.name = "jito-ny";
        cfg.kind = RelayKind::Jito;
        cfg.url = "https://ny.mainnet.block-engine.jito.wtf";
        auto relay = make_relay(cfg);
        REQUIRE(relay->takes_tips());
        auto tip = relay->tip_account();
        REQUIRE(tip.has_value());
        auto known = tip_accounts(RelayKind::Jito);
        REQUIRE(std::find(known.begin(), known.end(), *tip) != known.end());

        std::array<uint8_t, 32> raw{};
        raw.fill(3);
        cfg.tip_account = Pubkey(raw);
        REQUIRE(make_relay(cfg)->tip_account() == Pubkey(raw));
    }

    SECTION("RPC relays take no tips") {
        RelayConfig cfg;
        cfg.name = "rpc";
        cfg.url = "https://api.mainnet-beta.solana.com";
        auto relay = make_relay(cfg);
        REQUIRE_FALSE(relay->takes_tips());
        REQUIRE_FALSE(relay->tip_account().has_value());
    }
}
