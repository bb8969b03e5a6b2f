// SolX Trading SDK - Trade Engine Implementation

#include <solx/trading/engine.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/math.hpp>
#include <solx/trading/programs.hpp>
#include <solx/trading/timer.hpp>
#include <spdlog/spdlog.h>

namespace solx::trading {

TradeEngine::TradeEngine(TradeContext context,
                         std::shared_ptr<ChainReader> chain,
                         AdapterRegistry registry,
                         std::vector<std::shared_ptr<Relay>> relays)
    : context_(std::move(context)),
      chain_(std::move(chain)),
      registry_(std::move(registry)),
      relays_(std::move(relays)) {
    if (!context_.signer) {
        throw ValidationError("trade context has no signer");
    }
    if (relays_.empty()) {
        for (const auto& relay : context_.config.relays) {
            relays_.push_back(make_relay(relay));
        }
    }
    if (context_.config.general.lookup_table) {
        if (!chain_) {
            throw ValidationError("a lookup table is configured but there is no chain reader to load it");
        }
        lookup_table_ = chain_->lookup_table(*context_.config.general.lookup_table);
        spdlog::info("loaded lookup table {} with {} addresses",
                     lookup_table_->key.to_base58(), lookup_table_->addresses.size());
    }
}

Pubkey TradeEngine::payer() const {
    return context_.signer->pubkey();
}

// =============================================================================
// Preparation
// =============================================================================

MarketSnapshot TradeEngine::snapshot_for(const TradeRequest& request,
                                         const ProtocolAdapter& adapter) const {
    if (request.snapshot) return *request.snapshot;

    const SnapshotLoader* loader = registry_.loader(request.protocol);
    if (!loader) {
        throw ValidationError(std::string(adapter.name()) + " adapter requires " +
                              to_string(Requirement::MarketSnapshot) + " and has no loader");
    }
    if (!chain_) {
        throw ValidationError("no chain reader to load " + std::string(adapter.name()) + " market state");
    }
    return loader->load(*chain_, request.mint, request.params);
}

std::vector<std::shared_ptr<Relay>> TradeEngine::select_relays(bool use_relays) const {
    std::vector<std::shared_ptr<Relay>> selected;
    for (const auto& relay : relays_) {
        if (use_relays || !relay->takes_tips()) selected.push_back(relay);
    }
    if (selected.empty()) {
        throw ValidationError(use_relays ? "no relays configured" : "no RPC relay configured");
    }
    return selected;
}

PreparedTrade TradeEngine::prepare(const TradeRequest& request) const {
    TradeTimer timer(std::string(to_string(request.protocol)) + " " + to_string(request.side));
    const auto& adapter = registry_.get(request.protocol);

    BuildRequest build;
    build.side = request.side;
    build.payer = payer();
    build.mint = request.mint;
    build.amount = request.amount;
    build.slippage_bps = request.slippage_bps;
    build.creator = request.creator;
    build.params = request.params;
    build.min_output = request.min_output;

    timer.stage("snapshot");
    build.snapshot = snapshot_for(request, adapter);

    timer.stage("build");
    Quote quote = adapter.bounded_quote(build);
    Assembly assembly;
    assembly.body = adapter.build(build);
    assembly.priority_fee = request.priority_fee;
    assembly.recent_blockhash = request.recent_blockhash;
    assembly.use_relays = request.use_relays;

    timer.stage("sign");
    auto prepared = assemble(quote, std::move(assembly));
    timer.finish();
    return prepared;
}

PreparedTrade TradeEngine::assemble(Quote quote, Assembly assembly) const {
    const PriorityFeeConfig& fee = assembly.priority_fee ? *assembly.priority_fee
                                                         : context_.config.priority_fee;
    const Pubkey payer_key = payer();

    PreparedTrade prepared;
    prepared.quote = quote;
    prepared.relays = select_relays(assembly.use_relays);

    auto& ixs = prepared.instructions;
    ixs.push_back(programs::compute_budget::set_compute_unit_limit(fee.compute_unit_limit));
    ixs.push_back(programs::compute_budget::set_compute_unit_price(fee.compute_unit_price));
    if (fee.loaded_accounts_data_size_limit) {
        ixs.push_back(programs::compute_budget::set_loaded_accounts_data_size_limit(
            *fee.loaded_accounts_data_size_limit));
    }
    ixs.insert(ixs.end(), std::make_move_iterator(assembly.body.begin()),
               std::make_move_iterator(assembly.body.end()));

    std::size_t tip_relays = 0;
    for (const auto& relay : prepared.relays) {
        if (relay->takes_tips()) ++tip_relays;
    }
    if (tip_relays > 0) {
        if (fee.tip_lamports.size() != tip_relays) {
            throw ValidationError(std::to_string(fee.tip_lamports.size()) + " tip amounts for " +
                                  std::to_string(tip_relays) + " tip-taking relays");
        }
        std::size_t next = 0;
        for (const auto& relay : prepared.relays) {
            if (!relay->takes_tips()) continue;
            auto account = relay->tip_account();
            if (!account) {
                throw ValidationError("relay " + relay->name() + " has no tip account");
            }
            ixs.push_back(programs::system::transfer(payer_key, *account, fee.tip_lamports[next++]));
        }
    }

    Hash blockhash;
    if (assembly.recent_blockhash) {
        blockhash = *assembly.recent_blockhash;
    } else if (chain_) {
        blockhash = chain_->latest_blockhash();
    } else {
        throw ValidationError("no recent blockhash supplied and no chain reader to fetch one");
    }

    Message message = lookup_table_
        ? Message::compile_v0(payer_key, ixs, blockhash, {*lookup_table_})
        : Message::compile_legacy(payer_key, ixs, blockhash);

    std::vector<const Keypair*> signers{context_.signer.get()};
    signers.insert(signers.end(), assembly.extra_signers.begin(), assembly.extra_signers.end());
    auto tx = std::make_shared<const SignedTransaction>(SignedTransaction::sign(std::move(message), signers));

    if (tx->wire().size() > constants::PACKET_DATA_SIZE) {
        throw ValidationError("transaction is " + std::to_string(tx->wire().size()) +
                              " bytes, above the " + std::to_string(constants::PACKET_DATA_SIZE) +
                              " byte packet limit");
    }
    prepared.transaction = std::move(tx);
    return prepared;
}

// =============================================================================
// Dispatch
// =============================================================================

TradeResult TradeEngine::dispatch(const PreparedTrade& prepared, ProtocolTag protocol, Side side,
                                  const Pubkey& mint, int64_t started_us) const {
    auto submission = RelayDispatcher::race(prepared.transaction, prepared.relays).get();

    TradeResult result;
    result.protocol = protocol;
    result.side = side;
    result.mint = mint;
    result.quote = prepared.quote;
    result.relay = submission.relay;
    result.signature = submission.signature;
    result.submit_latency_us = submission.latency_us;
    result.total_latency_us = now_us() - started_us;

    spdlog::info("{} {} {} in={} min_out={} landed via {}: {} ({}us)",
                 to_string(protocol), to_string(side), mint.to_base58(),
                 result.quote.amount_in, result.quote.min_out, result.relay,
                 result.signature.to_base58(), result.total_latency_us);
    return result;
}

std::future<TradeResult> TradeEngine::execute(TradeRequest request) const {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        const int64_t started = now_us();
        auto prepared = prepare(request);
        return dispatch(prepared, request.protocol, request.side, request.mint, started);
    });
}

// =============================================================================
// Convenience entry points
// =============================================================================

std::future<TradeResult> TradeEngine::buy(ProtocolTag protocol,
                                          const Pubkey& mint,
                                          std::optional<Pubkey> creator,
                                          uint64_t sol_amount,
                                          uint16_t slippage_bps,
                                          std::optional<Hash> recent_blockhash,
                                          std::optional<PriorityFeeConfig> priority_fee,
                                          bool use_relays,
                                          ProtocolParams params) const {
    TradeRequest request;
    request.protocol = protocol;
    request.side = Side::Buy;
    request.mint = mint;
    request.creator = creator;
    request.amount = sol_amount;
    request.slippage_bps = slippage_bps;
    request.recent_blockhash = recent_blockhash;
    request.priority_fee = std::move(priority_fee);
    request.use_relays = use_relays;
    request.params = std::move(params);
    return execute(std::move(request));
}

std::future<TradeResult> TradeEngine::sell(ProtocolTag protocol,
                                           const Pubkey& mint,
                                           std::optional<Pubkey> creator,
                                           uint64_t token_amount,
                                           uint16_t slippage_bps,
                                           std::optional<Hash> recent_blockhash,
                                           std::optional<PriorityFeeConfig> priority_fee,
                                           bool use_relays,
                                           ProtocolParams params) const {
    TradeRequest request;
    request.protocol = protocol;
    request.side = Side::Sell;
    request.mint = mint;
    request.creator = creator;
    request.amount = token_amount;
    request.slippage_bps = slippage_bps;
    request.recent_blockhash = recent_blockhash;
    request.priority_fee = std::move(priority_fee);
    request.use_relays = use_relays;
    request.params = std::move(params);
    return execute(std::move(request));
}

std::future<TradeResult> TradeEngine::sell_percent(ProtocolTag protocol,
                                                   const Pubkey& mint,
                                                   std::optional<Pubkey> creator,
                                                   uint32_t percent,
                                                   uint16_t slippage_bps,
                                                   bool use_relays,
                                                   ProtocolParams params) const {
    return std::async(std::launch::async,
                      [this, protocol, mint, creator, percent, slippage_bps, use_relays,
                       params = std::move(params)]() {
        const int64_t started = now_us();
        if (percent == 0 || percent > 100) {
            throw ValidationError("sell percentage must be between 1 and 100, got " +
                                  std::to_string(percent));
        }
        if (!chain_) {
            throw ValidationError("no chain reader to read the token balance");
        }

        const Pubkey account = associated_token_address(payer(), mint);
        const uint64_t balance = chain_->token_balance(account);
        const auto amount = static_cast<uint64_t>(static_cast<math::u128>(balance) * percent / 100);
        if (amount == 0) {
            throw ValidationError("token account " + account.to_base58() + " holds " +
                                  std::to_string(balance) + "; nothing to sell");
        }
        spdlog::debug("selling {}% of {} = {}", percent, balance, amount);

        TradeRequest request;
        request.protocol = protocol;
        request.side = Side::Sell;
        request.mint = mint;
        request.creator = creator;
        request.amount = amount;
        request.slippage_bps = slippage_bps;
        request.use_relays = use_relays;
        request.params = params;

        auto prepared = prepare(request);
        return dispatch(prepared, protocol, Side::Sell, mint, started);
    });
}

std::future<TradeResult> TradeEngine::create_and_buy(std::shared_ptr<const Keypair> mint,
                                                     TokenMetadata metadata,
                                                     uint64_t sol_amount,
                                                     uint16_t slippage_bps,
                                                     std::optional<Hash> recent_blockhash,
                                                     bool use_relays) const {
    return std::async(std::launch::async,
                      [this, mint = std::move(mint), metadata = std::move(metadata),
                       sol_amount, slippage_bps, recent_blockhash, use_relays]() {
        const int64_t started = now_us();
        if (!mint) {
            throw ValidationError("create_and_buy requires the mint keypair");
        }
        const auto* adapter = dynamic_cast<const PumpFunAdapter*>(&registry_.get(ProtocolTag::PumpFun));
        if (!adapter) {
            throw ValidationError("registered pumpfun adapter cannot create tokens");
        }

        TradeTimer timer("pumpfun create_and_buy");
        const Pubkey payer_key = payer();
        const Pubkey& mint_key = mint->pubkey();

        BuildRequest build;
        build.side = Side::Buy;
        build.payer = payer_key;
        build.mint = mint_key;
        build.amount = sol_amount;
        build.slippage_bps = slippage_bps;
        build.creator = payer_key;
        build.snapshot = MarketSnapshot(BondingCurveState::after_initial_buy(mint_key, payer_key, 0, 0));

        timer.stage("build");
        Quote quote = adapter->bounded_quote(build);
        Assembly assembly;
        assembly.body.push_back(adapter->build_create(payer_key, mint_key, metadata, payer_key));
        for (auto& ix : adapter->build(build)) {
            assembly.body.push_back(std::move(ix));
        }
        assembly.extra_signers.push_back(mint.get());
        assembly.recent_blockhash = recent_blockhash;
        assembly.use_relays = use_relays;

        timer.stage("sign");
        auto prepared = assemble(quote, std::move(assembly));
        timer.finish();
        return dispatch(prepared, ProtocolTag::PumpFun, Side::Buy, mint_key, started);
    });
}

}  // namespace solx::trading
