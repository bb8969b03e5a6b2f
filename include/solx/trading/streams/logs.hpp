// SolX Trading SDK - Logs Subscription
// Program log events over the websocket logsSubscribe API

#pragma once

#include <solx/trading/stream.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace solx::trading {

class LogsSubscribeClient : public StreamClient {
public:
    // ws:// or wss:// URL
    explicit LogsSubscribeClient(std::string url, BackoffPolicy backoff = {});

    static std::unique_ptr<LogsSubscribeClient> from_config(const StreamConfig& config);

    // logsNotification payload as a logs-only view; nullopt for other messages
    // and for failed transactions
    static std::optional<TransactionView> parse_notification(std::string_view payload);

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

protected:
    void run_session(const SubscribeOptions& options, StreamSession& session) override;

private:
    template <typename Endpoint>
    void run_with(Endpoint& ws, const SubscribeOptions& options, StreamSession& session);

    std::string url_;
};

}  // namespace solx::trading
