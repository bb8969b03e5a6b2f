// SolX Trading SDK - Chain Reader
// Read-only chain access used by snapshot loaders and the trade engine

#pragma once

#include <solx/trading/transaction.hpp>
#include <solx/trading/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solx::trading {

struct AccountInfo {
    Pubkey owner;
    uint64_t lamports = 0;
    Bytes data;
    bool executable = false;
};

// Abstract so tests can substitute in-memory state
class ChainReader {
public:
    virtual ~ChainReader() = default;

    virtual Hash latest_blockhash() = 0;
    virtual std::optional<AccountInfo> account(const Pubkey& key) = 0;
    // Same order as `keys`; default issues one read per key
    virtual std::vector<std::optional<AccountInfo>> accounts(const std::vector<Pubkey>& keys);
    // Raw token amount held by an SPL token account
    virtual uint64_t token_balance(const Pubkey& token_account) = 0;

    // Loads and decodes an address lookup table; ValidationError when absent
    AddressLookupTable lookup_table(const Pubkey& key);
};

class HttpClient;

// JSON-RPC reader over HTTP
class RpcClient : public ChainReader {
public:
    explicit RpcClient(std::string url,
                       Commitment commitment = Commitment::Confirmed,
                       int timeout_ms = 10000);
    ~RpcClient() override;

    Hash latest_blockhash() override;
    std::optional<AccountInfo> account(const Pubkey& key) override;
    std::vector<std::optional<AccountInfo>> accounts(const std::vector<Pubkey>& keys) override;
    uint64_t token_balance(const Pubkey& token_account) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] Commitment commitment() const noexcept { return commitment_; }

private:
    std::string url_;
    Commitment commitment_;
    std::unique_ptr<HttpClient> http_;
};

}  // namespace solx::trading
