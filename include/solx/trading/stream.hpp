// SolX Trading SDK - Streaming Ingest
// Reconnecting subscriptions that decode live transactions into trade events

#pragma once

#include <solx/trading/codec.hpp>
#include <solx/trading/config.hpp>
#include <solx/trading/events.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace solx::trading {

struct BackoffPolicy {
    std::chrono::milliseconds base{500};
    std::chrono::milliseconds max{30'000};
    double multiplier = 2.0;
    int max_attempts = 10;
    double jitter = 0.1;  // fraction of the delay, applied both ways

    static BackoffPolicy from(const StreamConfig& config);
};

// Exponential reconnect delays with bounded attempts
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy = {});

    // Delay before the next attempt; nullopt once attempts are exhausted
    std::optional<std::chrono::milliseconds> next_delay();

    // Delay for the n-th attempt (1-based) before jitter
    [[nodiscard]] std::chrono::milliseconds nominal_delay(int attempt) const;

    void reset() noexcept { attempts_ = 0; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }
    [[nodiscard]] bool exhausted() const noexcept { return attempts_ >= policy_.max_attempts; }
    [[nodiscard]] const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    BackoffPolicy policy_;
    int attempts_ = 0;
};

struct SubscribeOptions {
    std::set<ProtocolTag> protocols{ALL_PROTOCOLS.begin(), ALL_PROTOCOLS.end()};
    std::vector<Pubkey> account_include;   // in addition to the protocols' programs
    std::vector<Pubkey> account_required;
    std::optional<Signature> signature;
    Commitment commitment = Commitment::Confirmed;
};

using EventCallback = std::function<void(const TradeEvent&)>;
// Called once on the ingest thread when the subscription ends: the error,
// or nullptr after cancel(). Must not throw.
using TerminalCallback = std::function<void(std::exception_ptr)>;

enum class SubscriptionState : uint8_t {
    Connecting = 0,
    Streaming = 1,
    Reconnecting = 2,
    Cancelled = 3,
    Failed = 4
};

const char* to_string(SubscriptionState state) noexcept;

// Owns the ingest thread of one subscription. Destruction cancels and joins.
class SubscriptionHandle {
    // Only StreamClient can construct a handle
    struct Key {
        explicit Key() = default;
    };

public:
    explicit SubscriptionHandle(Key) {}
    ~SubscriptionHandle();

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    // Closes the live session and wakes a pending reconnect sleep
    void cancel();

    // Blocks until the subscription has ended and its terminal callback returned
    void wait();

    [[nodiscard]] SubscriptionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    [[nodiscard]] std::exception_ptr error() const;

private:
    friend class StreamClient;
    friend class StreamSession;

    void set_state(SubscriptionState state) noexcept { state_.store(state, std::memory_order_release); }
    void set_cancel_hook(std::function<void()> hook);
    // False when woken by cancel()
    bool sleep_for(std::chrono::milliseconds delay);
    void finish(std::exception_ptr error, const TerminalCallback& on_end);

    std::atomic<SubscriptionState> state_{SubscriptionState::Connecting};
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex hook_mutex_;  // held while the hook runs or changes
    std::function<void()> cancel_hook_;
    std::exception_ptr error_;
    bool finished_ = false;
    std::thread worker_;
};

// One connection attempt, handed to the transport
class StreamSession {
public:
    StreamSession(SubscriptionHandle& handle, const EventCodec& codec, const EventCallback& callback);

    // Registers the action that aborts this session's blocking read for the
    // lifetime of the scope. Declare it after the objects the hook touches.
    class CancelScope {
    public:
        CancelScope(StreamSession& session, std::function<void()> hook);
        ~CancelScope();

        CancelScope(const CancelScope&) = delete;
        CancelScope& operator=(const CancelScope&) = delete;

    private:
        StreamSession& session_;
    };

    void on_cancel(std::function<void()> hook);

    // Decodes `tx` through the subscription's codec and forwards its events
    void deliver(const TransactionView& tx);

    // Marks the session live; a live session resets the reconnect backoff
    void mark_live();

    [[nodiscard]] bool cancelled() const noexcept { return handle_.cancelled(); }
    [[nodiscard]] bool delivered() const noexcept { return delivered_; }
    [[nodiscard]] const EventCodec& codec() const noexcept { return codec_; }
    [[nodiscard]] std::exception_ptr callback_error() const noexcept { return callback_error_; }

private:
    SubscriptionHandle& handle_;
    const EventCodec& codec_;
    const EventCallback& callback_;
    bool delivered_ = false;
    std::exception_ptr callback_error_;
};

// Base transport. subscribe() runs sessions on a dedicated thread, reconnecting
// through Backoff until cancelled or out of attempts. The client must outlive
// the handles it returns.
class StreamClient {
public:
    virtual ~StreamClient() = default;

    std::unique_ptr<SubscriptionHandle> subscribe(SubscribeOptions options,
                                                  EventCallback on_event,
                                                  TerminalCallback on_end = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const BackoffPolicy& backoff() const noexcept { return backoff_; }

protected:
    StreamClient(std::string name, BackoffPolicy backoff);

    // Blocks for one session. Returns when the server ends the stream, throws
    // NetworkError on transport failure, and returns promptly once the hook fires.
    virtual void run_session(const SubscribeOptions& options, StreamSession& session) = 0;

    // Programs selected by `options` plus its extra accounts
    static std::vector<Pubkey> account_filter(const SubscribeOptions& options);

private:
    void run(SubscriptionHandle& handle, const SubscribeOptions& options,
             const EventCallback& on_event, const TerminalCallback& on_end);

    std::string name_;
    BackoffPolicy backoff_;
};

}  // namespace solx::trading
