// SolX Trading SDK - Streaming Ingest Tests

#include <catch2/catch_test_macros.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/encoding.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/stream.hpp>
#include <solx/trading/streams/logs.hpp>
#include <solx/trading/streams/shredstream.hpp>
#include <solx/trading/transaction.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace solx::trading;

namespace cst = solx::trading::constants;

namespace {

using std::chrono::milliseconds;

BackoffPolicy fast_policy(int max_attempts) {
    BackoffPolicy policy;
    policy.base = milliseconds(1);
    policy.max = milliseconds(4);
    policy.multiplier = 2.0;
    policy.max_attempts = max_attempts;
    policy.jitter = 0.0;
    return policy;
}

Pubkey key(uint8_t seed) {
    std::array<uint8_t, 32> raw{};
    raw.fill(seed);
    return Pubkey(raw);
}

Bytes pumpfun_buy_payload() {
    BorshWriter w;
    w.raw(cst::pumpfun::TRADE_EVENT).pubkey(key(1)).u64(1'000'000'000).u64(34'000'000'000'000)
        .boolean(true).pubkey(key(2)).i64(1'700'000'000);
    for (uint64_t v : {31'000'000'000ULL, 1'039'000'000'000'000ULL, 1'000'000'000ULL, 759'100'000'000'000ULL}) {
        w.u64(v);
    }
    w.pubkey(cst::pumpfun::FEE_RECIPIENT).u64(95).u64(9'500'000).pubkey(key(2)).u64(5).u64(500'000);
    return w.take();
}

Bytes pumpswap_buy_payload() {
    BorshWriter w;
    w.raw(cst::pumpswap::BUY_EVENT).i64(1'700'000'000);
    for (int i = 0; i < 13; ++i) w.u64(1'000 + i);
    for (uint8_t seed = 10; seed < 16; ++seed) w.pubkey(key(seed));
    return w.take();
}

// One confirmed transaction in slot 7 that logs a pump.fun buy and then a PumpSwap buy
TransactionView mixed_transaction() {
    auto program_data = [](const Bytes& payload) { return "Program data: " + base64_encode(payload); };
    auto invoke = [](const Pubkey& program) { return "Program " + program.to_base58() + " invoke [1]"; };
    auto success = [](const Pubkey& program) { return "Program " + program.to_base58() + " success"; };

    TransactionView tx;
    tx.slot = 7;
    tx.logs = {
        invoke(cst::pumpfun::PROGRAM),
        program_data(pumpfun_buy_payload()),
        success(cst::pumpfun::PROGRAM),
        invoke(cst::pumpswap::PROGRAM),
        program_data(pumpswap_buy_payload()),
        success(cst::pumpswap::PROGRAM),
    };
    return tx;
}

// Scripted transport: refuses every connection, ends each session without
// data, or delivers one mixed transaction and holds the session open until cancelled
class FakeStream : public StreamClient {
public:
    enum class Mode { Refuse, CloseQuietly, DeliverAndHold };

    FakeStream(Mode mode, BackoffPolicy policy) : StreamClient("fake", policy), mode_(mode) {}

    using StreamClient::account_filter;

    std::atomic<int> sessions{0};
    std::atomic<int> deliveries{0};

protected:
    void run_session(const SubscribeOptions&, StreamSession& session) override {
        ++sessions;
        if (mode_ == Mode::Refuse) {
            throw NetworkError("connection refused", "fake://stream");
        }
        if (mode_ == Mode::CloseQuietly) return;

        std::mutex mutex;
        std::condition_variable cv;
        bool stop = false;
        StreamSession::CancelScope scope(session, [&]() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                stop = true;
            }
            cv.notify_all();
        });

        session.deliver(mixed_transaction());
        ++deliveries;

        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&]() { return stop; });
    }

private:
    Mode mode_;
};

template <typename Pred>
bool eventually(Pred pred) {
    for (int i = 0; i < 1000; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(2));
    }
    return pred();
}

}  // namespace

TEST_CASE("Reconnect backoff", "[stream]") {
    BackoffPolicy policy;
    policy.base = milliseconds(100);
    policy.max = milliseconds(1000);
    policy.multiplier = 2.0;
    policy.max_attempts = 5;
    policy.jitter = 0.1;
    Backoff backoff(policy);

    SECTION("Nominal delays grow and cap") {
        REQUIRE(backoff.nominal_delay(0) == milliseconds(0));
        REQUIRE(backoff.nominal_delay(1) == milliseconds(100));
        REQUIRE(backoff.nominal_delay(2) == milliseconds(200));
        REQUIRE(backoff.nominal_delay(4) == milliseconds(800));
        REQUIRE(backoff.nominal_delay(5) == milliseconds(1000));
        REQUIRE(backoff.nominal_delay(30) == milliseconds(1000));
    }

    SECTION("Jitter stays within ten percent") {
        for (int attempt = 1; attempt <= 5; ++attempt) {
            auto delay = backoff.next_delay();
            REQUIRE(delay.has_value());
            auto nominal = backoff.nominal_delay(attempt).count();
            REQUIRE(delay->count() >= nominal - nominal / 10);
            REQUIRE(delay->count() <= nominal + nominal / 10);
        }
        REQUIRE(backoff.attempts() == 5);
    }

    SECTION("Attempts run out and reset") {
        for (int i = 0; i < 5; ++i) REQUIRE(backoff.next_delay().has_value());
        REQUIRE(backoff.exhausted());
        REQUIRE_FALSE(backoff.next_delay().has_value());
        backoff.reset();
        REQUIRE(backoff.attempts() == 0);
        REQUIRE(backoff.next_delay().has_value());
    }

    SECTION("Policy from stream config") {
        StreamConfig config;
        config.reconnect_base_ms = 250;
        config.reconnect_max_ms = 4000;
        config.reconnect_multiplier = 1.5;
        config.max_reconnect_attempts = 3;
        auto from = BackoffPolicy::from(config);
        REQUIRE(from.base == milliseconds(250));
        REQUIRE(from.max == milliseconds(4000));
        REQUIRE(from.multiplier == 1.5);
        REQUIRE(from.max_attempts == 3);
    }
}

TEST_CASE("Subscription lifecycle", "[stream]") {
    SECTION("Gives up after the allowed reconnects") {
        FakeStream client(FakeStream::Mode::Refuse, fast_policy(2));
        std::exception_ptr terminal;
        std::atomic<int> terminal_calls{0};

        auto handle = client.subscribe(
            SubscribeOptions{},
            [](const TradeEvent&) {},
            [&](std::exception_ptr error) {
                terminal = error;
                ++terminal_calls;
            });
        handle->wait();

        REQUIRE(handle->state() == SubscriptionState::Failed);
        REQUIRE(client.sessions == 3);
        REQUIRE(terminal_calls == 1);
        REQUIRE(terminal);
        REQUIRE_THROWS_AS(std::rethrow_exception(terminal), NetworkError);
        REQUIRE(handle->error() == terminal);
    }

    SECTION("Sessions that close without data use up the attempts") {
        FakeStream client(FakeStream::Mode::CloseQuietly, fast_policy(2));
        auto handle = client.subscribe(SubscribeOptions{}, [](const TradeEvent&) {});
        handle->wait();

        REQUIRE(handle->state() == SubscriptionState::Failed);
        REQUIRE(client.sessions == 3);
        try {
            std::rethrow_exception(handle->error());
        } catch (const NetworkError& e) {
            REQUIRE(std::string(e.what()).find("stream closed by server") != std::string::npos);
        }
    }

    SECTION("Cancel ends a live session cleanly") {
        FakeStream client(FakeStream::Mode::DeliverAndHold, fast_policy(2));
        std::atomic<int> events{0};
        std::atomic<uint64_t> slot{0};
        std::atomic<int> terminal_calls{0};
        std::atomic<bool> terminal_null{false};

        auto handle = client.subscribe(
            SubscribeOptions{},
            [&](const TradeEvent& event) {
                slot = event.meta.slot;
                ++events;
            },
            [&](std::exception_ptr error) {
                terminal_null = (error == nullptr);
                ++terminal_calls;
            });

        REQUIRE(eventually([&]() { return events.load() == 2; }));
        REQUIRE(handle->state() == SubscriptionState::Streaming);
        REQUIRE(slot == 7);

        handle->cancel();
        handle->wait();
        REQUIRE(handle->cancelled());
        REQUIRE(handle->state() == SubscriptionState::Cancelled);
        REQUIRE_FALSE(handle->error());
        REQUIRE(terminal_calls == 1);
        REQUIRE(terminal_null);
        REQUIRE(client.sessions == 1);
    }

    SECTION("Protocol filter drops other protocols' events") {
        FakeStream client(FakeStream::Mode::DeliverAndHold, fast_policy(2));
        std::mutex mutex;
        std::vector<ProtocolTag> seen;

        SubscribeOptions options;
        options.protocols = {ProtocolTag::PumpSwap};
        auto handle = client.subscribe(options, [&](const TradeEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(event.meta.protocol);
        });

        REQUIRE(eventually([&]() { return client.deliveries.load() == 1; }));
        handle->cancel();
        handle->wait();

        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE(seen == std::vector<ProtocolTag>{ProtocolTag::PumpSwap});
    }

    SECTION("Throwing callback fails the subscription") {
        FakeStream client(FakeStream::Mode::DeliverAndHold, fast_policy(5));
        auto handle = client.subscribe(
            SubscribeOptions{},
            [](const TradeEvent&) { throw std::runtime_error("consumer broke"); });
        handle->wait();

        REQUIRE(handle->state() == SubscriptionState::Failed);
        REQUIRE(client.sessions == 1);
        REQUIRE_THROWS_AS(std::rethrow_exception(handle->error()), std::runtime_error);
    }

    SECTION("Destroying the handle cancels") {
        FakeStream client(FakeStream::Mode::DeliverAndHold, fast_policy(2));
        std::atomic<int> terminal_calls{0};
        {
            auto handle = client.subscribe(
                SubscribeOptions{},
                [](const TradeEvent&) {},
                [&](std::exception_ptr) { ++terminal_calls; });
        }
        REQUIRE(terminal_calls == 1);
    }

    SECTION("Handles come only from subscribe") {
        static_assert(!std::is_default_constructible_v<SubscriptionHandle>);
        static_assert(!std::is_copy_constructible_v<SubscriptionHandle>);
        FakeStream client(FakeStream::Mode::Refuse, fast_policy(0));
        auto handle = client.subscribe(SubscribeOptions{}, [](const TradeEvent&) {});
        REQUIRE(handle != nullptr);
        handle->wait();
        REQUIRE(client.sessions == 1);
    }

    SECTION("Invalid subscriptions") {
        FakeStream client(FakeStream::Mode::Refuse, fast_policy(0));
        REQUIRE_THROWS_AS(client.subscribe(SubscribeOptions{}, EventCallback{}), ValidationError);

        SubscribeOptions none;
        none.protocols.clear();
        REQUIRE_THROWS_AS(client.subscribe(none, [](const TradeEvent&) {}), ValidationError);
    }
}

TEST_CASE("Subscription account filter", "[stream]") {
    SubscribeOptions options;
    options.protocols = {ProtocolTag::PumpFun};
    options.account_include = {cst::pumpfun::PROGRAM, cst::SYSTEM_PROGRAM};

    auto accounts = FakeStream::account_filter(options);
    REQUIRE(accounts.size() == 2);
    REQUIRE(accounts[0] == cst::pumpfun::PROGRAM);
    REQUIRE(accounts[1] == cst::SYSTEM_PROGRAM);

    REQUIRE(FakeStream::account_filter(SubscribeOptions{}).size() == ALL_PROTOCOLS.size());
}

TEST_CASE("ShredStream entry batches", "[stream][shredstream]") {
    auto payer = Keypair::generate();
    Instruction ix;
    ix.program_id = cst::pumpfun::PROGRAM;
    ix.accounts = {AccountMeta::writable(payer.pubkey(), true)};
    ix.data = Bytes{1, 2, 3};
    std::array<uint8_t, 32> hash{};
    auto tx = SignedTransaction::sign(Message::compile_legacy(payer.pubkey(), {ix}, Hash(hash)), {&payer});

    BorshWriter batch;
    batch.u64(1).u64(12).raw(hash).u64(1).raw(tx.wire().data(), tx.wire().size());
    const Bytes bytes = batch.take();

    SECTION("Transactions touching a watched program") {
        auto views = ShredStreamClient::parse_entries(bytes.data(), bytes.size(), 99, {cst::pumpfun::PROGRAM});
        REQUIRE(views.has_value());
        REQUIRE(views->size() == 1);

        const auto& view = views->front();
        REQUIRE(view.signature == tx.signature());
        REQUIRE(view.slot == 99);
        REQUIRE_FALSE(view.confirmed);
        REQUIRE(view.instructions.size() == 1);
        REQUIRE(view.instructions[0].program_id == cst::pumpfun::PROGRAM);
        REQUIRE(view.instructions[0].accounts == std::vector<Pubkey>{payer.pubkey()});
        REQUIRE(view.instructions[0].data == Bytes{1, 2, 3});
    }

    SECTION("Other programs are skipped") {
        auto views = ShredStreamClient::parse_entries(bytes.data(), bytes.size(), 99, {cst::pumpswap::PROGRAM});
        REQUIRE(views.has_value());
        REQUIRE(views->empty());
    }

    SECTION("Malformed batches") {
        auto cut = ShredStreamClient::parse_entries(bytes.data(), bytes.size() - 10, 99, {cst::pumpfun::PROGRAM});
        REQUIRE_FALSE(cut.has_value());

        Bytes absurd = BorshWriter().u64(1'000'000).take();
        REQUIRE_FALSE(ShredStreamClient::parse_entries(absurd.data(), absurd.size(), 0, {}).has_value());
    }

    SECTION("Endpoint is required") {
        REQUIRE_THROWS_AS(ShredStreamClient(""), ValidationError);
    }
}

TEST_CASE("logsSubscribe notifications", "[stream][logs]") {
    std::array<uint8_t, 64> raw{};
    raw.fill(9);
    const Signature signature(raw);

    auto notification = [&](const std::string& err) {
        return std::string(R"({"jsonrpc":"2.0","method":"logsNotification","params":{"result":{"context":{"slot":4242},)") +
               R"("value":{"signature":")" + signature.to_base58() + R"(","err":)" + err +
               R"(,"logs":["Program 6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P invoke [1]","Program log: Instruction: Buy"]}},"subscription":3}})";
    };

    SECTION("Successful transaction") {
        auto view = LogsSubscribeClient::parse_notification(notification("null"));
        REQUIRE(view.has_value());
        REQUIRE(view->signature == signature);
        REQUIRE(view->slot == 4242);
        REQUIRE(view->confirmed);
        REQUIRE(view->logs.size() == 2);
        REQUIRE(view->instructions.empty());
    }

    SECTION("Failed transaction") {
        REQUIRE_FALSE(LogsSubscribeClient::parse_notification(notification(R"({"InstructionError":[0,"Custom"]})")).has_value());
    }

    SECTION("Other messages") {
        REQUIRE_FALSE(LogsSubscribeClient::parse_notification(R"({"jsonrpc":"2.0","result":3,"id":1})").has_value());
        REQUIRE_FALSE(LogsSubscribeClient::parse_notification(R"({"method":"logsNotification","params":{}})").has_value());
        REQUIRE_FALSE(LogsSubscribeClient::parse_notification("not json").has_value());
    }

    SECTION("Websocket URL required") {
        REQUIRE_THROWS_AS(LogsSubscribeClient("https://api.mainnet-beta.solana.com"), ValidationError);
        REQUIRE_NOTHROW(LogsSubscribeClient("ws://localhost:8900"));
    }
}
