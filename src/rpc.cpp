// SolX Trading SDK - Chain Reader Implementation

#include <solx/trading/rpc.hpp>
#include <solx/trading/accounts.hpp>
#include <solx/trading/encoding.hpp>
#include <solx/trading/errors.hpp>
#include "http.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace solx::trading {

// =============================================================================
// ChainReader
// =============================================================================

std::vector<std::optional<AccountInfo>> ChainReader::accounts(const std::vector<Pubkey>& keys) {
    std::vector<std::optional<AccountInfo>> out;
    out.reserve(keys.size());
    for (const auto& key : keys) out.push_back(account(key));
    return out;
}

AddressLookupTable ChainReader::lookup_table(const Pubkey& key) {
    auto info = account(key);
    if (!info) {
        throw ValidationError("address lookup table " + key.to_base58() + " not found");
    }
    auto table = accounts::decode_lookup_table(key, info->data);
    if (!table) {
        throw ValidationError("account " + key.to_base58() + " is not an address lookup table");
    }
    return *table;
}

// =============================================================================
// RpcClient
// =============================================================================

namespace {

// getMultipleAccounts limit per request
constexpr std::size_t MAX_ACCOUNTS_PER_CALL = 100;

// Shape errors in a response are network faults, not caller errors
template <typename F>
auto parse_response(const std::string& url, const char* method, F&& parse) -> decltype(parse()) {
    try {
        return parse();
    } catch (const json::exception& e) {
        throw NetworkError(std::string(method) + ": malformed response: " + e.what(), url);
    }
}

}  // namespace

std::optional<AccountInfo> parse_account(const json& value, const std::string& url) {
    if (value.is_null()) return std::nullopt;
    if (!value.is_object()) {
        throw NetworkError("account value is not an object", url);
    }

    AccountInfo info;
    info.lamports = value.value("lamports", uint64_t{0});
    info.executable = value.value("executable", false);
    auto owner = Pubkey::parse(value.at("owner").get<std::string>());
    if (!owner) {
        throw NetworkError("invalid account owner " + value.at("owner").dump(), url);
    }
    info.owner = *owner;

    const auto& data = value.at("data");
    if (!data.is_array() || data.empty()) {
        throw NetworkError("unexpected account data encoding", url);
    }
    auto decoded = base64_decode(data[0].get<std::string>());
    if (!decoded) {
        throw NetworkError("invalid base64 account data", url);
    }
    info.data = std::move(*decoded);
    return info;
}

RpcClient::RpcClient(std::string url, Commitment commitment, int timeout_ms)
    : url_(std::move(url)),
      commitment_(commitment),
      http_(std::make_unique<HttpClient>(url_, timeout_ms)) {}

RpcClient::~RpcClient() = default;

Hash RpcClient::latest_blockhash() {
    auto result = http_->rpc("getLatestBlockhash", json::array({
        {{"commitment", to_string(commitment_)}}
    }));
    auto hash = parse_response(url_, "getLatestBlockhash", [&] {
        return Hash::parse(result.at("value").at("blockhash").get<std::string>());
    });
    if (!hash) {
        throw NetworkError("invalid blockhash in getLatestBlockhash response", url_);
    }
    return *hash;
}

std::optional<AccountInfo> RpcClient::account(const Pubkey& key) {
    auto result = http_->rpc("getAccountInfo", json::array({
        key.to_base58(),
        {{"encoding", "base64"}, {"commitment", to_string(commitment_)}}
    }));
    return parse_response(url_, "getAccountInfo", [&] {
        return parse_account(result.at("value"), url_);
    });
}

std::vector<std::optional<AccountInfo>> RpcClient::accounts(const std::vector<Pubkey>& keys) {
    std::vector<std::optional<AccountInfo>> out;
    out.reserve(keys.size());

    for (std::size_t start = 0; start < keys.size(); start += MAX_ACCOUNTS_PER_CALL) {
        auto end = std::min(keys.size(), start + MAX_ACCOUNTS_PER_CALL);
        json batch = json::array();
        for (auto i = start; i < end; ++i) batch.push_back(keys[i].to_base58());

        auto result = http_->rpc("getMultipleAccounts", json::array({
            batch,
            {{"encoding", "base64"}, {"commitment", to_string(commitment_)}}
        }));
        parse_response(url_, "getMultipleAccounts", [&] {
            const auto& values = result.at("value");
            if (values.size() != end - start) {
                throw NetworkError("getMultipleAccounts returned " + std::to_string(values.size()) +
                                   " accounts for " + std::to_string(end - start) + " keys", url_);
            }
            for (const auto& v : values) out.push_back(parse_account(v, url_));
        });
    }

    spdlog::debug("rpc: loaded {} accounts from {}", keys.size(), url_);
    return out;
}

uint64_t RpcClient::token_balance(const Pubkey& token_account) {
    auto result = http_->rpc("getTokenAccountBalance", json::array({
        token_account.to_base58(),
        {{"commitment", to_string(commitment_)}}
    }));
    auto amount = parse_response(url_, "getTokenAccountBalance", [&] {
        return result.at("value").at("amount").get<std::string>();
    });
    try {
        return std::stoull(amount);
    } catch (const std::logic_error&) {
        throw NetworkError("invalid token amount " + amount, url_);
    }
}

}  // namespace solx::trading
