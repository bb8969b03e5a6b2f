// SolX Trading SDK - Relays
// Submission paths for signed transactions: plain RPC and tip-taking block engines

#pragma once

#include <solx/trading/transaction.hpp>
#include <solx/trading/types.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solx::trading {

enum class RelayKind : uint8_t {
    Rpc = 0,
    Jito = 1,
    Nozomi = 2,
    ZeroSlot = 3,
    NextBlock = 4,
    Node1 = 5
};

const char* to_string(RelayKind kind) noexcept;
std::optional<RelayKind> relay_kind_from_string(std::string_view name);

// Known tip accounts for a tip-taking relay kind; empty for Rpc
std::vector<Pubkey> tip_accounts(RelayKind kind);

struct RelayConfig {
    std::string name;
    RelayKind kind = RelayKind::Rpc;
    std::string url;
    std::string region;
    std::optional<std::string> auth_token;
    int timeout_ms = 5000;
    std::optional<Pubkey> tip_account;  // overrides the random pick
};

// Shared cooperative cancellation flag
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Relay interface. submit() blocks until the relay accepts or rejects.
class Relay {
public:
    virtual ~Relay() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual RelayKind kind() const = 0;
    [[nodiscard]] bool takes_tips() const { return kind() != RelayKind::Rpc; }

    // Account to tip for this submission; nullopt for relays without tips
    [[nodiscard]] virtual std::optional<Pubkey> tip_account() const = 0;

    // Returns the accepted signature; throws NetworkError on rejection or I/O failure
    virtual Signature submit(const SignedTransaction& tx, const CancellationToken& cancel) = 0;
};

class HttpClient;

// JSON-over-HTTP relay, request shape chosen by kind
class HttpRelay : public Relay {
public:
    explicit HttpRelay(RelayConfig config);
    ~HttpRelay() override;

    [[nodiscard]] const std::string& name() const override { return config_.name; }
    [[nodiscard]] RelayKind kind() const override { return config_.kind; }
    [[nodiscard]] std::optional<Pubkey> tip_account() const override;
    [[nodiscard]] const RelayConfig& config() const noexcept { return config_; }

    Signature submit(const SignedTransaction& tx, const CancellationToken& cancel) override;

private:
    RelayConfig config_;
    std::unique_ptr<HttpClient> http_;
};

std::shared_ptr<Relay> make_relay(const RelayConfig& config);

}  // namespace solx::trading
