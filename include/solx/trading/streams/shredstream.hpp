// SolX Trading SDK - ShredStream
// Pre-confirmation transactions from a Jito ShredStream proxy

#pragma once

#include <solx/trading/stream.hpp>
#include <optional>
#include <string>
#include <vector>

namespace solx::trading {

class ShredStreamClient : public StreamClient {
public:
    // host:port of the proxy, or an http(s):// URL
    explicit ShredStreamClient(std::string endpoint, BackoffPolicy backoff = {});

    static std::unique_ptr<ShredStreamClient> from_config(const StreamConfig& config);

    // Transactions of a bincode Vec<Entry> that touch any of `programs`.
    // Accounts loaded through lookup tables are unknown here and left default.
    // nullopt when the batch is malformed.
    static std::optional<std::vector<TransactionView>> parse_entries(const uint8_t* data,
                                                                     std::size_t size,
                                                                     uint64_t slot,
                                                                     const std::vector<Pubkey>& programs);

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

protected:
    void run_session(const SubscribeOptions& options, StreamSession& session) override;

private:
    std::string endpoint_;
};

}  // namespace solx::trading
