// SolX Trading SDK - Protocol Adapter Implementation

#include <solx/trading/adapter.hpp>
#include <solx/trading/adapters/bonk.hpp>
#include <solx/trading/adapters/pumpfun.hpp>
#include <solx/trading/adapters/pumpswap.hpp>
#include <solx/trading/math.hpp>
#include <algorithm>

namespace solx::trading {

const char* to_string(Requirement r) noexcept {
    switch (r) {
        case Requirement::MarketSnapshot: return "a market snapshot";
        case Requirement::Creator: return "a creator";
    }
    return "unknown";
}

// =============================================================================
// ProtocolAdapter
// =============================================================================

void ProtocolAdapter::check_quote_input(uint64_t amount, uint16_t slippage_bps) {
    if (slippage_bps > math::BPS_DENOMINATOR) {
        throw ValidationError("slippage " + std::to_string(slippage_bps) +
                              " bps exceeds 10000");
    }
    if (amount == 0) {
        throw ValidationError("trade amount must be positive");
    }
}

Quote ProtocolAdapter::make_quote(Side side, uint64_t amount, uint64_t expected_out,
                                  uint16_t slippage_bps) const {
    if (expected_out == 0) {
        throw ValidationError(std::string(name()) + " " + to_string(side) + " of " +
                              std::to_string(amount) + " yields no output");
    }
    Quote q;
    q.side = side;
    q.amount_in = amount;
    q.expected_out = expected_out;
    q.min_out = math::apply_slippage_floor(expected_out, slippage_bps);
    q.slippage_bps = slippage_bps;
    return q;
}

const MarketSnapshot& ProtocolAdapter::require_snapshot(const BuildRequest& request) const {
    if (!request.snapshot) {
        throw ValidationError(std::string(name()) + " adapter requires " +
                              to_string(Requirement::MarketSnapshot));
    }
    return *request.snapshot;
}

Quote ProtocolAdapter::bounded_quote(const BuildRequest& request) const {
    auto q = quote(request.side, request.amount, request.slippage_bps, require_snapshot(request));
    if (request.min_output) {
        if (q.min_out < *request.min_output) {
            throw SlippageExceeded(q.min_out, *request.min_output);
        }
        q.min_out = std::max(q.min_out, *request.min_output);
    }
    return q;
}

// =============================================================================
// AdapterRegistry
// =============================================================================

AdapterRegistry AdapterRegistry::with_defaults() {
    AdapterRegistry registry;
    registry.add(std::make_shared<PumpFunAdapter>(), std::make_shared<PumpFunLoader>());
    registry.add(std::make_shared<PumpSwapAdapter>(), std::make_shared<PumpSwapLoader>());
    registry.add(std::make_shared<BonkAdapter>(), std::make_shared<BonkLoader>());
    return registry;
}

void AdapterRegistry::add(std::shared_ptr<const ProtocolAdapter> adapter,
                          std::shared_ptr<const SnapshotLoader> loader) {
    if (!adapter) {
        throw ValidationError("cannot register a null adapter");
    }
    auto protocol = adapter->protocol();
    entries_[protocol] = Entry{std::move(adapter), std::move(loader)};
}

const ProtocolAdapter& AdapterRegistry::get(ProtocolTag protocol) const {
    auto it = entries_.find(protocol);
    if (it == entries_.end()) {
        throw ValidationError(std::string("no adapter registered for ") + to_string(protocol));
    }
    return *it->second.adapter;
}

const SnapshotLoader* AdapterRegistry::loader(ProtocolTag protocol) const noexcept {
    auto it = entries_.find(protocol);
    return it == entries_.end() ? nullptr : it->second.loader.get();
}

bool AdapterRegistry::contains(ProtocolTag protocol) const noexcept {
    return entries_.count(protocol) != 0;
}

std::vector<ProtocolTag> AdapterRegistry::protocols() const {
    std::vector<ProtocolTag> out;
    out.reserve(entries_.size());
    for (const auto& [protocol, entry] : entries_) out.push_back(protocol);
    return out;
}

}  // namespace solx::trading
