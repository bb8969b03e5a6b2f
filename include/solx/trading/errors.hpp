// SolX Trading SDK - Error Types
// Exception taxonomy shared by the engine, adapters, relays and streams

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace solx::trading {

// Base for every error the SDK throws
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// RPC, stream or relay I/O failure
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& msg,
                          std::string endpoint = {},
                          std::optional<int> status = std::nullopt)
        : Error(msg), endpoint_(std::move(endpoint)), status_(status) {}

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] std::optional<int> status() const noexcept { return status_; }

private:
    std::string endpoint_;
    std::optional<int> status_;
};

// Bad caller input or missing adapter prerequisite
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg) : Error(msg) {}
};

// Quote cannot satisfy the caller's minimum output
class SlippageExceeded : public Error {
public:
    SlippageExceeded(uint64_t achievable, uint64_t requested)
        : Error("slippage exceeded: achievable minimum output " + std::to_string(achievable) +
                " is below requested " + std::to_string(requested)),
          achievable_(achievable), requested_(requested) {}

    [[nodiscard]] uint64_t achievable() const noexcept { return achievable_; }
    [[nodiscard]] uint64_t requested() const noexcept { return requested_; }

private:
    uint64_t achievable_;
    uint64_t requested_;
};

struct RelayFailure {
    std::string relay;
    std::string message;
};

// Every relay in a fan-out reported failure
class AllRelaysFailed : public Error {
public:
    explicit AllRelaysFailed(std::vector<RelayFailure> failures)
        : Error(describe(failures)), failures_(std::move(failures)) {}

    [[nodiscard]] const std::vector<RelayFailure>& failures() const noexcept { return failures_; }

private:
    static std::string describe(const std::vector<RelayFailure>& failures) {
        std::string msg = "all " + std::to_string(failures.size()) + " relays failed";
        for (const auto& f : failures) {
            msg += "; " + f.relay + ": " + f.message;
        }
        return msg;
    }

    std::vector<RelayFailure> failures_;
};

// Key handling or signing failure
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& msg) : Error(msg) {}
};

}  // namespace solx::trading
