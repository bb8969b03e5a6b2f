// SolX Trading SDK - Protocol Adapter Interface
// Abstract interface for quoting and building trades on each launchpad or pool program

#pragma once

#include <solx/trading/errors.hpp>
#include <solx/trading/market.hpp>
#include <solx/trading/types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace solx::trading {

class ChainReader;

// Protocol-specific knobs; each adapter reads the ones it understands
struct ProtocolParams {
    std::optional<Pubkey> pool;          // PumpSwap pool, derived from the mint when absent
    std::optional<Pubkey> quote_mint;    // defaults to WSOL
    bool wrap_sol = true;                // wrap/unwrap SOL around WSOL-quoted trades
    bool close_token_account = false;    // close the token account after a sell
    std::optional<uint64_t> share_fee_rate;
};

struct Quote {
    Side side = Side::Buy;
    uint64_t amount_in = 0;
    uint64_t expected_out = 0;
    uint64_t min_out = 0;
    uint16_t slippage_bps = 0;
};

// Inputs an adapter needs beyond side, mint and amount
enum class Requirement : uint8_t {
    MarketSnapshot = 0,
    Creator = 1
};

const char* to_string(Requirement r) noexcept;

struct BuildRequest {
    Side side = Side::Buy;
    Pubkey payer;
    Pubkey mint;
    uint64_t amount = 0;  // exact input: lamports for buys, tokens for sells
    uint16_t slippage_bps = 0;
    std::optional<MarketSnapshot> snapshot;
    std::optional<Pubkey> creator;
    ProtocolParams params;
    std::optional<uint64_t> min_output;  // caller bound, must not exceed the quoted one
};

// Base adapter interface. Adapters are pure: no network I/O.
class ProtocolAdapter {
public:
    virtual ~ProtocolAdapter() = default;

    // Properties
    [[nodiscard]] virtual ProtocolTag protocol() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual const Pubkey& program_id() const = 0;
    [[nodiscard]] virtual std::vector<Requirement> requirements() const = 0;

    // Throws ValidationError on bad input or an untradable market
    [[nodiscard]] virtual Quote quote(Side side,
                                      uint64_t amount,
                                      uint16_t slippage_bps,
                                      const MarketSnapshot& snapshot) const = 0;

    // Instructions for one trade, without compute budget or tips
    [[nodiscard]] virtual std::vector<Instruction> build(const BuildRequest& request) const = 0;

    // Quote for `request` with the caller's min_output applied.
    // Throws SlippageExceeded when the caller asks for more than the quote allows.
    [[nodiscard]] Quote bounded_quote(const BuildRequest& request) const;

protected:
    const MarketSnapshot& require_snapshot(const BuildRequest& request) const;

    template <typename T>
    const T& require_state(const MarketSnapshot& snapshot) const {
        if (const T* state = snapshot.get<T>()) return *state;
        throw ValidationError(std::string(name()) + " adapter received a " +
                              to_string(snapshot.protocol()) + " market snapshot");
    }

    // Shared quote arithmetic: validates inputs and derives the slippage floor
    static void check_quote_input(uint64_t amount, uint16_t slippage_bps);
    Quote make_quote(Side side, uint64_t amount, uint64_t expected_out, uint16_t slippage_bps) const;
};

// Reads the chain state an adapter quotes against
class SnapshotLoader {
public:
    virtual ~SnapshotLoader() = default;
    virtual MarketSnapshot load(ChainReader& chain,
                                const Pubkey& mint,
                                const ProtocolParams& params) const = 0;
};

// Adapters and loaders keyed by protocol
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    // pump.fun, PumpSwap and Raydium Launchpad with their loaders
    static AdapterRegistry with_defaults();

    void add(std::shared_ptr<const ProtocolAdapter> adapter,
             std::shared_ptr<const SnapshotLoader> loader = nullptr);

    // ValidationError for an unregistered protocol
    [[nodiscard]] const ProtocolAdapter& get(ProtocolTag protocol) const;
    [[nodiscard]] const SnapshotLoader* loader(ProtocolTag protocol) const noexcept;
    [[nodiscard]] bool contains(ProtocolTag protocol) const noexcept;
    [[nodiscard]] std::vector<ProtocolTag> protocols() const;

private:
    struct Entry {
        std::shared_ptr<const ProtocolAdapter> adapter;
        std::shared_ptr<const SnapshotLoader> loader;
    };
    std::map<ProtocolTag, Entry> entries_;
};

}  // namespace solx::trading
