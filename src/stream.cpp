// SolX Trading SDK - Streaming Ingest Implementation

#include <solx/trading/stream.hpp>
#include <solx/trading/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace solx::trading {

namespace {

double random_jitter(double base_value, double jitter_factor) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);
    return base_value * (1.0 + dis(gen));
}

}  // namespace

// =============================================================================
// Backoff
// =============================================================================

BackoffPolicy BackoffPolicy::from(const StreamConfig& config) {
    BackoffPolicy policy;
    policy.base = std::chrono::milliseconds(config.reconnect_base_ms);
    policy.max = std::chrono::milliseconds(config.reconnect_max_ms);
    policy.multiplier = config.reconnect_multiplier;
    policy.max_attempts = config.max_reconnect_attempts;
    return policy;
}

Backoff::Backoff(BackoffPolicy policy) : policy_(policy) {}

std::chrono::milliseconds Backoff::nominal_delay(int attempt) const {
    if (attempt <= 0) return std::chrono::milliseconds(0);
    double delay = static_cast<double>(policy_.base.count()) * std::pow(policy_.multiplier, attempt - 1);
    delay = std::min(delay, static_cast<double>(policy_.max.count()));
    return std::chrono::milliseconds(std::llround(delay));
}

std::optional<std::chrono::milliseconds> Backoff::next_delay() {
    if (exhausted()) return std::nullopt;
    ++attempts_;
    double delay = static_cast<double>(nominal_delay(attempts_).count());
    delay = random_jitter(delay, policy_.jitter);
    return std::chrono::milliseconds(std::llround(delay));
}

const char* to_string(SubscriptionState state) noexcept {
    switch (state) {
        case SubscriptionState::Connecting: return "connecting";
        case SubscriptionState::Streaming: return "streaming";
        case SubscriptionState::Reconnecting: return "reconnecting";
        case SubscriptionState::Cancelled: return "cancelled";
        case SubscriptionState::Failed: return "failed";
    }
    return "unknown";
}

// =============================================================================
// SubscriptionHandle
// =============================================================================

SubscriptionHandle::~SubscriptionHandle() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SubscriptionHandle::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    }
    cv_.notify_all();
    std::lock_guard<std::mutex> hook_lock(hook_mutex_);
    if (cancel_hook_) cancel_hook_();
}

void SubscriptionHandle::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return finished_; });
}

std::exception_ptr SubscriptionHandle::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void SubscriptionHandle::set_cancel_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> hook_lock(hook_mutex_);
    cancel_hook_ = std::move(hook);
    // cancel() may have run before the session registered
    if (cancel_hook_ && cancelled()) cancel_hook_();
}

bool SubscriptionHandle::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, delay, [this]() { return cancelled(); });
    return !cancelled();
}

void SubscriptionHandle::finish(std::exception_ptr error, const TerminalCallback& on_end) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
    }
    set_cancel_hook(nullptr);
    set_state(error ? SubscriptionState::Failed : SubscriptionState::Cancelled);
    if (on_end) on_end(error);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

// =============================================================================
// StreamSession
// =============================================================================

StreamSession::StreamSession(SubscriptionHandle& handle, const EventCodec& codec,
                             const EventCallback& callback)
    : handle_(handle), codec_(codec), callback_(callback) {}

void StreamSession::on_cancel(std::function<void()> hook) {
    handle_.set_cancel_hook(std::move(hook));
}

StreamSession::CancelScope::CancelScope(StreamSession& session, std::function<void()> hook)
    : session_(session) {
    session_.on_cancel(std::move(hook));
}

StreamSession::CancelScope::~CancelScope() {
    session_.on_cancel(nullptr);
}

void StreamSession::mark_live() {
    if (!delivered_) {
        delivered_ = true;
        handle_.set_state(SubscriptionState::Streaming);
    }
}

void StreamSession::deliver(const TransactionView& tx) {
    mark_live();
    for (const auto& event : codec_.decode_transaction(tx)) {
        if (handle_.cancelled()) return;
        try {
            callback_(event);
        } catch (...) {
            callback_error_ = std::current_exception();
            throw;
        }
    }
}

// =============================================================================
// StreamClient
// =============================================================================

StreamClient::StreamClient(std::string name, BackoffPolicy backoff)
    : name_(std::move(name)), backoff_(backoff) {}

std::vector<Pubkey> StreamClient::account_filter(const SubscribeOptions& options) {
    std::vector<Pubkey> accounts;
    for (auto protocol : options.protocols) {
        accounts.push_back(EventCodec::program_for(protocol));
    }
    for (const auto& key : options.account_include) {
        if (std::find(accounts.begin(), accounts.end(), key) == accounts.end()) {
            accounts.push_back(key);
        }
    }
    return accounts;
}

std::unique_ptr<SubscriptionHandle> StreamClient::subscribe(SubscribeOptions options,
                                                            EventCallback on_event,
                                                            TerminalCallback on_end) {
    if (!on_event) {
        throw ValidationError(name_ + ": subscribe requires an event callback");
    }
    if (options.protocols.empty()) {
        throw ValidationError(name_ + ": subscribe requires at least one protocol");
    }

    auto handle = std::make_unique<SubscriptionHandle>(SubscriptionHandle::Key{});
    SubscriptionHandle* raw = handle.get();
    raw->worker_ = std::thread([this, raw, options = std::move(options),
                                on_event = std::move(on_event), on_end = std::move(on_end)]() {
        run(*raw, options, on_event, on_end);
    });
    return handle;
}

void StreamClient::run(SubscriptionHandle& handle, const SubscribeOptions& options,
                       const EventCallback& on_event, const TerminalCallback& on_end) {
    const EventCodec codec(options.protocols);
    Backoff backoff(backoff_);
    std::exception_ptr failure;

    while (!handle.cancelled()) {
        handle.set_state(SubscriptionState::Connecting);
        StreamSession session(handle, codec, on_event);
        std::string reason;

        spdlog::info("{}: connecting (attempt {})", name_, backoff.attempts() + 1);
        try {
            run_session(options, session);
            reason = "stream closed by server";
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            if (!session.callback_error()) throw;
            reason = "event callback threw a non-standard exception";
        }
        handle.set_cancel_hook(nullptr);

        if (session.callback_error()) {
            spdlog::error("{}: event callback failed: {}", name_, reason);
            failure = session.callback_error();
            break;
        }
        if (handle.cancelled()) break;

        if (session.delivered()) backoff.reset();
        auto delay = backoff.next_delay();
        if (!delay) {
            spdlog::error("{}: giving up after {} reconnect attempts: {}",
                          name_, backoff.attempts(), reason);
            failure = std::make_exception_ptr(NetworkError(
                name_ + ": giving up after " + std::to_string(backoff.attempts()) +
                " reconnect attempts: " + reason));
            break;
        }

        spdlog::warn("{}: disconnected ({}), reconnecting in {}ms", name_, reason, delay->count());
        handle.set_state(SubscriptionState::Reconnecting);
        if (!handle.sleep_for(*delay)) break;
    }

    if (!failure) spdlog::info("{}: subscription cancelled", name_);
    handle.finish(failure, on_end);
}

}  // namespace solx::trading
