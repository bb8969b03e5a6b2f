// SolX Trading SDK - Basic Example
// Demonstrates configuration, quoting and a buy followed by a partial sell

#include <solx/trading/config.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/engine.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/rpc.hpp>
#include <iostream>

using namespace solx::trading;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <keypair.json> <mint> [config.toml]\n";
        return 2;
    }

    try {
        // Build configuration
        Config config = argc > 3 ? Config::from_file(argv[3]) : Config::baseline();
        config.validate();
        setup_logging(config.general);

        auto signer = std::make_shared<const Keypair>(Keypair::from_json_file(argv[1]));
        const Pubkey mint = Pubkey::from_base58(argv[2]);
        std::cout << "Payer: " << signer->pubkey().to_base58() << "\n";

        auto rpc = std::make_shared<RpcClient>(config.general.rpc_url,
                                               config.general.commitment,
                                               config.general.timeout_ms);
        TradeEngine engine(TradeContext{signer, config}, rpc);

        for (const auto& relay : engine.relays()) {
            std::cout << "Relay: " << relay->name() << " (" << to_string(relay->kind()) << ")\n";
        }

        // Quote without sending
        TradeRequest request;
        request.protocol = ProtocolTag::PumpFun;
        request.side = Side::Buy;
        request.mint = mint;
        request.amount = 10'000'000;  // 0.01 SOL
        request.slippage_bps = 500;

        auto prepared = engine.prepare(request);
        std::cout << "\nQuote: " << prepared.quote.amount_in << " lamports -> "
                  << prepared.quote.expected_out << " tokens (min " << prepared.quote.min_out << ")\n";
        std::cout << "Transaction: " << prepared.transaction->wire().size() << " bytes, "
                  << prepared.relays.size() << " relays\n";

        // Buy
        std::cout << "\nBuying...\n";
        auto bought = engine.execute(request).get();
        std::cout << "Landed via " << bought.relay << ": " << bought.signature.to_base58()
                  << " (" << bought.total_latency_us << "us)\n";

        // Sell half of the balance through RPC only
        std::cout << "\nSelling 50%...\n";
        auto sold = engine.sell_percent(ProtocolTag::PumpFun, mint, std::nullopt, 50, 500, false).get();
        std::cout << "Sold " << sold.quote.amount_in << " tokens via " << sold.relay << ": "
                  << sold.signature.to_base58() << "\n";

    } catch (const SlippageExceeded& e) {
        std::cerr << "Slippage: achievable " << e.achievable() << ", requested " << e.requested() << "\n";
        return 1;
    } catch (const AllRelaysFailed& e) {
        for (const auto& failure : e.failures()) {
            std::cerr << failure.relay << ": " << failure.message << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
