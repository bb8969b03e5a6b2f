// SolX Trading SDK - Trade Timer Implementation

#include <solx/trading/timer.hpp>
#include <spdlog/spdlog.h>

namespace solx::trading {

namespace {

int64_t micros_since(std::chrono::steady_clock::time_point t) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t).count();
}

}  // namespace

TradeTimer::TradeTimer(std::string label)
    : label_(std::move(label)),
      stage_("start"),
      started_(std::chrono::steady_clock::now()),
      stage_started_(started_) {}

TradeTimer::~TradeTimer() {
    if (!stage_.empty()) report();
}

void TradeTimer::stage(std::string_view next) {
    if (!stage_.empty()) report();
    stage_ = std::string(next);
    stage_started_ = std::chrono::steady_clock::now();
}

void TradeTimer::finish() {
    if (stage_.empty()) return;
    report();
    spdlog::debug("{} total {}us", label_, total_us());
    stage_.clear();
}

int64_t TradeTimer::stage_us() const noexcept {
    return micros_since(stage_started_);
}

int64_t TradeTimer::total_us() const noexcept {
    return micros_since(started_);
}

void TradeTimer::report() const {
    spdlog::debug("{} {} took {}us", label_, stage_, stage_us());
}

}  // namespace solx::trading
