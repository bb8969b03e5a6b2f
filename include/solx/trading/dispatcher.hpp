// SolX Trading SDK - Relay Dispatcher
// Races one signed transaction across every selected relay; first acceptance wins

#pragma once

#include <solx/trading/relay.hpp>
#include <solx/trading/transaction.hpp>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace solx::trading {

struct SubmissionResult {
    std::string relay;
    Signature signature;
    int64_t latency_us = 0;
};

class RelayDispatcher {
public:
    explicit RelayDispatcher(std::vector<std::shared_ptr<Relay>> relays);

    // Race over the dispatcher's relays
    std::future<SubmissionResult> submit(std::shared_ptr<const SignedTransaction> tx) const;

    // One worker per relay. The first success fulfils the future and cancels the rest;
    // if all fail the future holds AllRelaysFailed. ValidationError for no relays.
    // Workers still running once the future is ready exit without logging.
    static std::future<SubmissionResult> race(std::shared_ptr<const SignedTransaction> tx,
                                              const std::vector<std::shared_ptr<Relay>>& relays);

    [[nodiscard]] const std::vector<std::shared_ptr<Relay>>& relays() const noexcept { return relays_; }

private:
    std::vector<std::shared_ptr<Relay>> relays_;
};

}  // namespace solx::trading
