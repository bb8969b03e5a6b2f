// SolX Trading SDK - Relay Dispatcher Implementation

#include <solx/trading/dispatcher.hpp>
#include <solx/trading/errors.hpp>
#include <spdlog/spdlog.h>
#include <mutex>
#include <thread>

namespace solx::trading {

namespace {

struct RaceState {
    std::mutex mutex;
    std::promise<SubmissionResult> promise;
    bool settled = false;
    std::size_t pending = 0;
    std::vector<RelayFailure> failures;
    CancellationToken cancel;
};

}  // namespace

RelayDispatcher::RelayDispatcher(std::vector<std::shared_ptr<Relay>> relays)
    : relays_(std::move(relays)) {}

std::future<SubmissionResult> RelayDispatcher::submit(std::shared_ptr<const SignedTransaction> tx) const {
    return race(std::move(tx), relays_);
}

std::future<SubmissionResult> RelayDispatcher::race(std::shared_ptr<const SignedTransaction> tx,
                                                    const std::vector<std::shared_ptr<Relay>>& relays) {
    if (relays.empty()) {
        throw ValidationError("no relays selected for submission");
    }
    if (!tx) {
        throw ValidationError("no transaction to submit");
    }

    auto state = std::make_shared<RaceState>();
    state->pending = relays.size();
    auto future = state->promise.get_future();
    const int64_t started = now_us();

    for (const auto& relay : relays) {
        std::thread([state, tx, relay, started]() {
            std::optional<Signature> signature;
            std::string error;
            try {
                signature = relay->submit(*tx, state->cancel);
            } catch (const std::exception& e) {
                error = e.what();
            }
            const int64_t latency = now_us() - started;

            std::lock_guard<std::mutex> lock(state->mutex);
            --state->pending;
            // Workers outliving a settled race touch nothing global, spdlog included
            if (state->settled) return;

            if (signature) {
                state->settled = true;
                state->cancel.cancel();
                spdlog::info("relay {} accepted {} in {}us",
                             relay->name(), signature->to_base58(), latency);
                state->promise.set_value(SubmissionResult{relay->name(), *signature, latency});
                return;
            }
            spdlog::warn("relay {} failed after {}us: {}", relay->name(), latency, error);
            state->failures.push_back(RelayFailure{relay->name(), std::move(error)});

            if (state->pending == 0) {
                state->settled = true;
                state->promise.set_exception(std::make_exception_ptr(AllRelaysFailed(state->failures)));
            }
        }).detach();
    }

    return future;
}

}  // namespace solx::trading
