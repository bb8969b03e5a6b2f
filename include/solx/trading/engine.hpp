// SolX Trading SDK - Trade Engine
// Quote, build, sign once and race across relays

#pragma once

#include <solx/trading/adapter.hpp>
#include <solx/trading/adapters/pumpfun.hpp>
#include <solx/trading/config.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/dispatcher.hpp>
#include <solx/trading/relay.hpp>
#include <solx/trading/rpc.hpp>
#include <solx/trading/transaction.hpp>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace solx::trading {

// Signer and settings shared by every call on one engine
struct TradeContext {
    std::shared_ptr<const Keypair> signer;
    Config config;
};

struct TradeRequest {
    ProtocolTag protocol = ProtocolTag::PumpFun;
    Side side = Side::Buy;
    Pubkey mint;
    std::optional<Pubkey> creator;
    uint64_t amount = 0;
    uint16_t slippage_bps = 0;
    std::optional<Hash> recent_blockhash;
    std::optional<PriorityFeeConfig> priority_fee;  // overrides the config's
    bool use_relays = true;                         // false: RPC relays only, no tips
    ProtocolParams params;
    std::optional<MarketSnapshot> snapshot;         // skips the chain read
    std::optional<uint64_t> min_output;
};

// Everything up to dispatch: a signed transaction and where it would go
struct PreparedTrade {
    Quote quote;
    std::vector<Instruction> instructions;
    std::shared_ptr<const SignedTransaction> transaction;
    std::vector<std::shared_ptr<Relay>> relays;
};

struct TradeResult {
    ProtocolTag protocol = ProtocolTag::PumpFun;
    Side side = Side::Buy;
    Pubkey mint;
    Quote quote;
    std::string relay;
    Signature signature;
    int64_t submit_latency_us = 0;
    int64_t total_latency_us = 0;
};

class TradeEngine {
public:
    // Relays default to one per configured RelayConfig. The configured lookup
    // table, if any, is read through `chain` here.
    TradeEngine(TradeContext context,
                std::shared_ptr<ChainReader> chain,
                AdapterRegistry registry = AdapterRegistry::with_defaults(),
                std::vector<std::shared_ptr<Relay>> relays = {});

    // Steps up to and including signing; nothing is sent
    PreparedTrade prepare(const TradeRequest& request) const;

    std::future<TradeResult> execute(TradeRequest request) const;

    std::future<TradeResult> buy(ProtocolTag protocol,
                                 const Pubkey& mint,
                                 std::optional<Pubkey> creator,
                                 uint64_t sol_amount,
                                 uint16_t slippage_bps,
                                 std::optional<Hash> recent_blockhash = std::nullopt,
                                 std::optional<PriorityFeeConfig> priority_fee = std::nullopt,
                                 bool use_relays = true,
                                 ProtocolParams params = {}) const;

    std::future<TradeResult> sell(ProtocolTag protocol,
                                  const Pubkey& mint,
                                  std::optional<Pubkey> creator,
                                  uint64_t token_amount,
                                  uint16_t slippage_bps,
                                  std::optional<Hash> recent_blockhash = std::nullopt,
                                  std::optional<PriorityFeeConfig> priority_fee = std::nullopt,
                                  bool use_relays = true,
                                  ProtocolParams params = {}) const;

    // Sells `percent` (1-100) of the payer's token account balance
    std::future<TradeResult> sell_percent(ProtocolTag protocol,
                                          const Pubkey& mint,
                                          std::optional<Pubkey> creator,
                                          uint32_t percent,
                                          uint16_t slippage_bps,
                                          bool use_relays = true,
                                          ProtocolParams params = {}) const;

    // pump.fun create followed by the creator's first buy, co-signed by the mint
    std::future<TradeResult> create_and_buy(std::shared_ptr<const Keypair> mint,
                                            TokenMetadata metadata,
                                            uint64_t sol_amount,
                                            uint16_t slippage_bps,
                                            std::optional<Hash> recent_blockhash = std::nullopt,
                                            bool use_relays = true) const;

    [[nodiscard]] const TradeContext& context() const noexcept { return context_; }
    [[nodiscard]] const AdapterRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const std::vector<std::shared_ptr<Relay>>& relays() const noexcept { return relays_; }
    [[nodiscard]] Pubkey payer() const;

private:
    struct Assembly {
        std::vector<Instruction> body;
        std::vector<const Keypair*> extra_signers;
        std::optional<PriorityFeeConfig> priority_fee;
        std::optional<Hash> recent_blockhash;
        bool use_relays = true;
    };

    MarketSnapshot snapshot_for(const TradeRequest& request, const ProtocolAdapter& adapter) const;
    std::vector<std::shared_ptr<Relay>> select_relays(bool use_relays) const;
    PreparedTrade assemble(Quote quote, Assembly assembly) const;
    TradeResult dispatch(const PreparedTrade& prepared, ProtocolTag protocol, Side side,
                         const Pubkey& mint, int64_t started_us) const;

    TradeContext context_;
    std::shared_ptr<ChainReader> chain_;
    AdapterRegistry registry_;
    std::vector<std::shared_ptr<Relay>> relays_;
    std::optional<AddressLookupTable> lookup_table_;
};

}  // namespace solx::trading
