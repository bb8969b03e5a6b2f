// SolX Trading SDK - Geyser Stream
// Confirmed transactions over Yellowstone gRPC

#pragma once

#include <solx/trading/stream.hpp>
#include <optional>
#include <string>

namespace solx::trading {

class GeyserClient : public StreamClient {
public:
    // `endpoint` is a URL; https:// selects TLS
    GeyserClient(std::string endpoint,
                 std::optional<std::string> x_token = std::nullopt,
                 BackoffPolicy backoff = {});

    static std::unique_ptr<GeyserClient> from_config(const StreamConfig& config);

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

protected:
    void run_session(const SubscribeOptions& options, StreamSession& session) override;

private:
    std::string endpoint_;
    std::optional<std::string> x_token_;
};

}  // namespace solx::trading
