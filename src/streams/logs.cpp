// SolX Trading SDK - Logs Subscription Implementation

#include <solx/trading/streams/logs.hpp>
#include <solx/trading/errors.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <deque>
#include <set>

namespace solx::trading {

using json = nlohmann::json;
using WsClient = websocketpp::client<websocketpp::config::asio_client>;
using WssClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using ConnectionHdl = websocketpp::connection_hdl;
using SslContext = websocketpp::lib::asio::ssl::context;

namespace {

// A transaction mentioning several subscribed programs arrives once per subscription
constexpr std::size_t DEDUP_WINDOW = 4096;

json logs_subscribe_request(int id, const Pubkey& program, Commitment commitment) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "logsSubscribe"},
        {"params", json::array({
            {{"mentions", json::array({program.to_base58()})}},
            {{"commitment", to_string(commitment)}}
        })}
    };
}

}  // namespace

LogsSubscribeClient::LogsSubscribeClient(std::string url, BackoffPolicy backoff)
    : StreamClient("logs", backoff), url_(std::move(url)) {
    if (url_.rfind("ws://", 0) != 0 && url_.rfind("wss://", 0) != 0) {
        throw ValidationError("logs subscription url must start with ws:// or wss://: '" + url_ + "'");
    }
}

std::unique_ptr<LogsSubscribeClient> LogsSubscribeClient::from_config(const StreamConfig& config) {
    return std::make_unique<LogsSubscribeClient>(config.ws_url, BackoffPolicy::from(config));
}

std::optional<TransactionView> LogsSubscribeClient::parse_notification(std::string_view payload) {
    auto msg = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (msg.is_discarded() || !msg.is_object() || msg.value("method", "") != "logsNotification") {
        return std::nullopt;
    }

    try {
        const auto& result = msg.at("params").at("result");
        const auto& value = result.at("value");
        if (value.contains("err") && !value["err"].is_null()) {
            return std::nullopt;
        }
        auto signature = Signature::parse(value.at("signature").get<std::string>());
        if (!signature) return std::nullopt;

        TransactionView view;
        view.signature = *signature;
        view.slot = result.at("context").at("slot").get<uint64_t>();
        view.confirmed = true;
        view.logs = value.at("logs").get<std::vector<std::string>>();
        return view;
    } catch (const json::exception& e) {
        spdlog::debug("logs: unexpected notification shape: {}", e.what());
        return std::nullopt;
    }
}

void LogsSubscribeClient::run_session(const SubscribeOptions& options, StreamSession& session) {
    if (url_.rfind("wss://", 0) == 0) {
        WssClient ws;
        ws.set_tls_init_handler([](ConnectionHdl) {
            auto ctx = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
            ctx->set_default_verify_paths();
            ctx->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
            return ctx;
        });
        run_with(ws, options, session);
    } else {
        WsClient ws;
        run_with(ws, options, session);
    }
}

template <typename Endpoint>
void LogsSubscribeClient::run_with(Endpoint& ws, const SubscribeOptions& options, StreamSession& session) {
    using MessagePtr = typename Endpoint::message_ptr;

    ws.clear_access_channels(websocketpp::log::alevel::all);
    ws.clear_error_channels(websocketpp::log::elevel::all);
    ws.init_asio();

    const auto mentions = account_filter(options);
    std::string failure;
    std::exception_ptr callback_error;
    std::deque<Signature> recent;
    std::set<Signature> seen;

    ws.set_open_handler([&](ConnectionHdl hdl) {
        for (std::size_t i = 0; i < mentions.size(); ++i) {
            auto request = logs_subscribe_request(static_cast<int>(i + 1), mentions[i], options.commitment);
            websocketpp::lib::error_code ec;
            ws.send(hdl, request.dump(), websocketpp::frame::opcode::text, ec);
            if (ec) {
                failure = "logsSubscribe send failed: " + ec.message();
                ws.stop();
                return;
            }
        }
        spdlog::info("logs: subscribed at {} for {} accounts", url_, mentions.size());
    });

    ws.set_message_handler([&](ConnectionHdl, MessagePtr msg) {
        auto view = parse_notification(msg->get_payload());
        if (!view) return;
        session.mark_live();
        if (!seen.insert(view->signature).second) return;
        recent.push_back(view->signature);
        if (recent.size() > DEDUP_WINDOW) {
            seen.erase(recent.front());
            recent.pop_front();
        }
        try {
            session.deliver(*view);
        } catch (...) {
            callback_error = std::current_exception();
            ws.stop();
        }
    });

    ws.set_fail_handler([&](ConnectionHdl hdl) {
        websocketpp::lib::error_code ec;
        auto con = ws.get_con_from_hdl(hdl, ec);
        failure = con ? con->get_ec().message() : "connection failed";
    });

    websocketpp::lib::error_code ec;
    auto con = ws.get_connection(url_, ec);
    if (ec) {
        throw NetworkError("logs: " + ec.message(), url_);
    }
    ws.connect(con);

    StreamSession::CancelScope cancel_scope(session, [&ws]() { ws.stop(); });
    ws.run();

    if (callback_error) std::rethrow_exception(callback_error);
    if (session.cancelled()) return;
    if (!failure.empty()) {
        throw NetworkError("logs: " + failure, url_);
    }
}

}  // namespace solx::trading
