// SolX Trading SDK - Trade Timer
// Per-stage wall-clock timing for trade calls, reported at debug level

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace solx::trading {

class TradeTimer {
public:
    explicit TradeTimer(std::string label);
    ~TradeTimer();

    TradeTimer(const TradeTimer&) = delete;
    TradeTimer& operator=(const TradeTimer&) = delete;

    // Reports the running stage and starts `next`
    void stage(std::string_view next);

    // Reports the running stage; the destructor does nothing afterwards
    void finish();

    [[nodiscard]] int64_t stage_us() const noexcept;
    [[nodiscard]] int64_t total_us() const noexcept;

private:
    void report() const;

    std::string label_;
    std::string stage_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point stage_started_;
};

}  // namespace solx::trading
