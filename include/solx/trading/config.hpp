// SolX Trading SDK - Configuration
// Builder pattern for fluent configuration

#pragma once

#include <solx/trading/relay.hpp>
#include <solx/trading/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace solx::trading {

// General SDK settings
struct GeneralConfig {
    std::string log_level = "info";
    std::string rpc_url;
    Commitment commitment = Commitment::Confirmed;
    int timeout_ms = 10000;
    std::optional<Pubkey> lookup_table;
};

// Compute budget and relay tips
struct PriorityFeeConfig {
    uint32_t compute_unit_limit = 200'000;
    uint64_t compute_unit_price = 400'000;  // micro-lamports per unit
    std::optional<uint32_t> loaded_accounts_data_size_limit;
    // One amount per tip-taking relay, in relay order
    std::vector<uint64_t> tip_lamports;
};

// Ingest endpoints and reconnect policy
struct StreamConfig {
    std::string geyser_url;
    std::optional<std::string> geyser_token;
    std::string shredstream_url;
    std::string ws_url;
    int reconnect_base_ms = 500;
    int reconnect_max_ms = 30'000;
    double reconnect_multiplier = 2.0;
    int max_reconnect_attempts = 10;
};

// Main SDK configuration
class Config {
public:
    GeneralConfig general;
    PriorityFeeConfig priority_fee;
    std::vector<RelayConfig> relays;
    StreamConfig stream;

    Config() = default;

    // Mainnet RPC, confirmed commitment, 200k units at 400k micro-lamports,
    // no tips, one RPC relay on the same endpoint
    static Config baseline();

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Inverse of from_toml
    [[nodiscard]] std::string to_toml() const;

    // Throws ValidationError for settings no trade could succeed with
    void validate() const;

    // Builder methods
    Config& with_rpc(std::string_view url) {
        general.rpc_url = std::string(url);
        return *this;
    }

    Config& with_commitment(Commitment commitment) {
        general.commitment = commitment;
        return *this;
    }

    Config& with_relay(RelayConfig relay) {
        relays.push_back(std::move(relay));
        return *this;
    }

    Config& with_priority_fee(uint32_t unit_limit, uint64_t unit_price) {
        priority_fee.compute_unit_limit = unit_limit;
        priority_fee.compute_unit_price = unit_price;
        return *this;
    }

    Config& with_tips(std::vector<uint64_t> lamports) {
        priority_fee.tip_lamports = std::move(lamports);
        return *this;
    }

    Config& with_lookup_table(const Pubkey& table) {
        general.lookup_table = table;
        return *this;
    }

    Config& with_stream(StreamConfig cfg) {
        stream = std::move(cfg);
        return *this;
    }

    Config& set_timeout(int ms) {
        general.timeout_ms = ms;
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }
};

// Installs the default spdlog logger with the configured level
void setup_logging(const GeneralConfig& general);

}  // namespace solx::trading
