// SolX Trading SDK - HTTP Transport Implementation

#include "http.hpp"
#include <solx/trading/errors.hpp>
#include <cpr/cpr.h>

namespace solx::trading {

HttpClient::HttpClient(std::string base_url, int timeout_ms, HttpHeaders headers)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms), headers_(std::move(headers)) {}

HttpResponse HttpClient::post(const std::string& suffix,
                              const std::string& body,
                              const HttpHeaders& extra) const {
    cpr::Header headers{{"Content-Type", "application/json"}};
    for (const auto& [k, v] : headers_) headers[k] = v;
    for (const auto& [k, v] : extra) headers[k] = v;

    auto response = cpr::Post(
        cpr::Url{base_url_ + suffix},
        headers,
        cpr::Body{body},
        cpr::Timeout{timeout_ms_});

    HttpResponse out;
    out.status = static_cast<int>(response.status_code);
    out.body = std::move(response.text);
    if (response.error) out.error = response.error.message;
    return out;
}

json HttpClient::post_json(const std::string& suffix, const json& body, const HttpHeaders& extra) const {
    auto url = base_url_ + suffix;
    auto response = post(suffix, body.dump(), extra);
    if (!response.error.empty()) {
        throw NetworkError(response.error, url);
    }
    if (!response.ok()) {
        throw NetworkError("HTTP " + std::to_string(response.status) + ": " + response.body,
                           url, response.status);
    }

    auto parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        throw NetworkError("invalid JSON response: " + response.body, url, response.status);
    }
    return parsed;
}

json HttpClient::rpc(const std::string& method, const json& params) const {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method},
        {"params", params}
    };
    return rpc_result(method, post_json("", request), base_url_);
}

json rpc_result(const std::string& method, const json& response, const std::string& url) {
    if (!response.is_object()) {
        throw NetworkError(method + " returned a non-object response", url);
    }
    if (auto it = response.find("error"); it != response.end() && !it->is_null()) {
        const auto& err = *it;
        auto message = err.is_object() && err.contains("message") && err["message"].is_string()
            ? err["message"].get<std::string>()
            : err.dump();
        throw NetworkError(method + " failed: " + message, url);
    }
    auto result = response.find("result");
    if (result == response.end()) {
        throw NetworkError(method + " returned no result", url);
    }
    return *result;
}

}  // namespace solx::trading
