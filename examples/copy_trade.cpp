// SolX Trading SDK - Copy Trade Example
// Follows a wallet's pump.fun buys from a Geyser stream and mirrors them

#include <solx/trading/config.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/engine.hpp>
#include <solx/trading/market.hpp>
#include <solx/trading/rpc.hpp>
#include <solx/trading/streams/geyser.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace solx::trading;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

}  // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <config.toml> <keypair.json> <wallet-to-follow>\n";
        return 2;
    }

    try {
        Config config = Config::from_file(argv[1]);
        config.validate();
        setup_logging(config.general);

        auto signer = std::make_shared<const Keypair>(Keypair::from_json_file(argv[2]));
        const Pubkey leader = Pubkey::from_base58(argv[3]);

        auto rpc = std::make_shared<RpcClient>(config.general.rpc_url,
                                               config.general.commitment,
                                               config.general.timeout_ms);
        TradeEngine engine(TradeContext{signer, config}, rpc);
        auto geyser = GeyserClient::from_config(config.stream);

        SubscribeOptions options;
        options.protocols = {ProtocolTag::PumpFun};
        options.account_required = {leader};

        auto handle = geyser->subscribe(
            options,
            [&](const TradeEvent& event) {
                const auto* trade = event.get<PumpFunTradeEvent>();
                if (!trade || !trade->is_buy || trade->user != leader) return;

                std::cout << "Leader bought " << trade->mint.to_base58() << " for "
                          << trade->sol_amount << " lamports in slot " << event.meta.slot << "\n";

                // Post-trade reserves price our order without another read
                TradeRequest request;
                request.protocol = ProtocolTag::PumpFun;
                request.side = Side::Buy;
                request.mint = trade->mint;
                request.creator = trade->creator;
                request.amount = std::min<uint64_t>(trade->sol_amount, 50'000'000);
                request.slippage_bps = 1'000;
                request.snapshot = MarketSnapshot::from_event(event);

                try {
                    auto result = engine.execute(std::move(request)).get();
                    std::cout << "Copied via " << result.relay << ": " << result.signature.to_base58() << "\n";
                } catch (const std::exception& e) {
                    std::cerr << "Copy failed: " << e.what() << "\n";
                }
            },
            [](std::exception_ptr error) {
                if (!error) return;
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    std::cerr << "Stream ended: " << e.what() << "\n";
                }
                g_stop = true;
            });

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        std::cout << "Following " << leader.to_base58() << ", Ctrl-C to stop\n";
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        handle->cancel();
        handle->wait();
        std::cout << "Stopped.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
