// SolX Trading SDK - Core Types Implementation

#include <solx/trading/types.hpp>
#include <algorithm>
#include <cctype>

namespace solx::trading {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::optional<ProtocolTag> protocol_from_string(std::string_view name) {
    auto n = lower(name);
    if (n == "pumpfun" || n == "pump.fun" || n == "pump_fun") return ProtocolTag::PumpFun;
    if (n == "pumpswap" || n == "pump_swap" || n == "pumpamm") return ProtocolTag::PumpSwap;
    if (n == "bonk" || n == "launchpad" || n == "raydium_launchpad") return ProtocolTag::Bonk;
    return std::nullopt;
}

std::optional<Commitment> commitment_from_string(std::string_view name) {
    auto n = lower(name);
    if (n == "processed") return Commitment::Processed;
    if (n == "confirmed") return Commitment::Confirmed;
    if (n == "finalized") return Commitment::Finalized;
    return std::nullopt;
}

}  // namespace solx::trading
