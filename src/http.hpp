// SolX Trading SDK - HTTP Transport
// cpr + nlohmann::json client shared by the RPC reader and the HTTP relays

#pragma once

#include <solx/trading/rpc.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace solx::trading {

using json = nlohmann::json;
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string error;  // transport failure, empty when a response arrived

    [[nodiscard]] bool ok() const noexcept { return error.empty() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    HttpClient(std::string base_url, int timeout_ms, HttpHeaders headers = {});

    // Raw POST of `body` to base_url + suffix
    HttpResponse post(const std::string& suffix,
                      const std::string& body,
                      const HttpHeaders& extra = {}) const;

    // POST returning the parsed JSON body; NetworkError on transport, status or parse failure
    json post_json(const std::string& suffix, const json& body, const HttpHeaders& extra = {}) const;

    // JSON-RPC 2.0 call returning `result`; NetworkError on an `error` member
    json rpc(const std::string& method, const json& params) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    std::string base_url_;
    int timeout_ms_;
    HttpHeaders headers_;
};

// `result` member of a JSON-RPC response; NetworkError on an `error` member of any shape
json rpc_result(const std::string& method, const json& response, const std::string& url);

// One `base64`-encoded account value; null is an absent account
std::optional<AccountInfo> parse_account(const json& value, const std::string& url);

}  // namespace solx::trading
