// SolX Trading SDK - Relays Implementation

#include <solx/trading/relay.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/errors.hpp>
#include "http.hpp"
#include <spdlog/spdlog.h>
#include <random>

namespace solx::trading {

const char* to_string(RelayKind kind) noexcept {
    switch (kind) {
        case RelayKind::Rpc: return "rpc";
        case RelayKind::Jito: return "jito";
        case RelayKind::Nozomi: return "nozomi";
        case RelayKind::ZeroSlot: return "zeroslot";
        case RelayKind::NextBlock: return "nextblock";
        case RelayKind::Node1: return "node1";
    }
    return "unknown";
}

std::optional<RelayKind> relay_kind_from_string(std::string_view name) {
    if (name == "rpc") return RelayKind::Rpc;
    if (name == "jito") return RelayKind::Jito;
    if (name == "nozomi" || name == "temporal") return RelayKind::Nozomi;
    if (name == "zeroslot" || name == "0slot") return RelayKind::ZeroSlot;
    if (name == "nextblock") return RelayKind::NextBlock;
    if (name == "node1") return RelayKind::Node1;
    return std::nullopt;
}

std::vector<Pubkey> tip_accounts(RelayKind kind) {
    namespace tips = constants::tips;
    switch (kind) {
        case RelayKind::Rpc: return {};
        case RelayKind::Jito: return {tips::JITO.begin(), tips::JITO.end()};
        case RelayKind::Nozomi: return {tips::NOZOMI.begin(), tips::NOZOMI.end()};
        case RelayKind::ZeroSlot: return {tips::ZERO_SLOT.begin(), tips::ZERO_SLOT.end()};
        case RelayKind::NextBlock: return {tips::NEXT_BLOCK.begin(), tips::NEXT_BLOCK.end()};
        case RelayKind::Node1: return {tips::NODE1.begin(), tips::NODE1.end()};
    }
    return {};
}

// =============================================================================
// HttpRelay
// =============================================================================

namespace {

json send_transaction_request(const std::string& encoded, bool rpc_node) {
    json options = {{"encoding", "base64"}};
    if (rpc_node) {
        options["skipPreflight"] = true;
        options["maxRetries"] = 0;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "sendTransaction"},
        {"params", json::array({encoded, options})}
    };
}

std::size_t random_index(std::size_t n) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng);
}

}  // namespace

HttpRelay::HttpRelay(RelayConfig config)
    : config_(std::move(config)),
      http_(std::make_unique<HttpClient>(config_.url, config_.timeout_ms)) {}

HttpRelay::~HttpRelay() = default;

std::optional<Pubkey> HttpRelay::tip_account() const {
    if (!takes_tips()) return std::nullopt;
    if (config_.tip_account) return config_.tip_account;
    auto accounts = tip_accounts(config_.kind);
    return accounts[random_index(accounts.size())];
}

Signature HttpRelay::submit(const SignedTransaction& tx, const CancellationToken& cancel) {
    if (cancel.cancelled()) {
        throw NetworkError("submission cancelled", config_.url);
    }

    const std::string encoded = tx.to_base64();
    const std::string token = config_.auth_token.value_or("");
    std::string suffix;
    HttpHeaders headers;
    json body;

    switch (config_.kind) {
        case RelayKind::Rpc:
            if (!token.empty()) headers["Authorization"] = "Bearer " + token;
            body = send_transaction_request(encoded, true);
            break;
        case RelayKind::Jito:
            suffix = "/api/v1/transactions";
            if (!token.empty()) headers["x-jito-auth"] = token;
            body = send_transaction_request(encoded, false);
            break;
        case RelayKind::Nozomi:
            suffix = "/?c=" + token;
            body = send_transaction_request(encoded, false);
            break;
        case RelayKind::ZeroSlot:
            suffix = "?api-key=" + token;
            body = send_transaction_request(encoded, false);
            break;
        case RelayKind::NextBlock:
            suffix = "/api/v2/submit";
            if (!token.empty()) headers["Authorization"] = token;
            body = {
                {"transaction", {{"content", encoded}}},
                {"frontRunningProtection", false}
            };
            break;
        case RelayKind::Node1:
            if (!token.empty()) headers["api-key"] = token;
            body = send_transaction_request(encoded, false);
            break;
    }

    auto response = http_->post(suffix, body.dump(), headers);
    if (!response.error.empty()) {
        throw NetworkError(config_.name + ": " + response.error, config_.url);
    }
    if (!response.ok()) {
        throw NetworkError(config_.name + ": HTTP " + std::to_string(response.status) + ": " +
                           response.body, config_.url, response.status);
    }

    auto parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw NetworkError(config_.name + ": unexpected response: " + response.body,
                           config_.url, response.status);
    }
    if (parsed.contains("error") && !parsed["error"].is_null()) {
        const auto& err = parsed["error"];
        std::string message = err.is_object() && err.contains("message") && err["message"].is_string()
            ? err["message"].get<std::string>()
            : err.dump();
        throw NetworkError(config_.name + ": " + message, config_.url, response.status);
    }
    bool has_result = (parsed.contains("result") && !parsed["result"].is_null()) ||
                      parsed.contains("signature");
    if (!has_result) {
        throw NetworkError(config_.name + ": response carries no signature: " + response.body,
                           config_.url, response.status);
    }

    spdlog::debug("relay {}: accepted {}", config_.name, tx.signature().to_base58());
    return tx.signature();
}

std::shared_ptr<Relay> make_relay(const RelayConfig& config) {
    return std::make_shared<HttpRelay>(config);
}

}  // namespace solx::trading
