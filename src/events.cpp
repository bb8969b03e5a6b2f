// SolX Trading SDK - Trade Events Implementation

#include <solx/trading/events.hpp>
#include <type_traits>

namespace solx::trading {

namespace {

template <typename T, typename U>
inline constexpr bool is_a = std::is_same_v<std::decay_t<T>, U>;

std::optional<Pubkey> non_default(const Pubkey& key) {
    if (key.is_default()) return std::nullopt;
    return key;
}

}  // namespace

ProtocolTag protocol_of(const EventBody& body) noexcept {
    switch (body.index()) {
        case 0:
        case 1:
        case 2:
            return ProtocolTag::PumpFun;
        case 3:
        case 4:
        case 5:
        case 6:
        case 7:
            return ProtocolTag::PumpSwap;
        default:
            return ProtocolTag::Bonk;
    }
}

EventKind kind_of(const EventBody& body) noexcept {
    return std::visit([](const auto& e) -> EventKind {
        using E = decltype(e);
        if constexpr (is_a<E, PumpFunCreateEvent> ||
                      is_a<E, PumpSwapCreatePoolEvent> ||
                      is_a<E, BonkPoolCreateEvent>) {
            return EventKind::Create;
        } else if constexpr (is_a<E, PumpFunTradeEvent>) {
            return e.is_buy ? EventKind::Buy : EventKind::Sell;
        } else if constexpr (is_a<E, PumpFunCompleteEvent>) {
            return EventKind::Complete;
        } else if constexpr (is_a<E, PumpSwapBuyEvent>) {
            return EventKind::Buy;
        } else if constexpr (is_a<E, PumpSwapSellEvent>) {
            return EventKind::Sell;
        } else if constexpr (is_a<E, PumpSwapDepositEvent>) {
            return EventKind::Deposit;
        } else if constexpr (is_a<E, PumpSwapWithdrawEvent>) {
            return EventKind::Withdraw;
        } else {
            return e.side == Side::Buy ? EventKind::Buy : EventKind::Sell;
        }
    }, body);
}

std::optional<Pubkey> TradeEvent::mint() const {
    return std::visit([](const auto& e) -> std::optional<Pubkey> {
        using E = decltype(e);
        if constexpr (is_a<E, PumpFunCreateEvent> ||
                      is_a<E, PumpFunTradeEvent> ||
                      is_a<E, PumpFunCompleteEvent>) {
            return non_default(e.mint);
        } else if constexpr (is_a<E, PumpSwapBuyEvent> ||
                             is_a<E, PumpSwapSellEvent> ||
                             is_a<E, PumpSwapCreatePoolEvent> ||
                             is_a<E, BonkTradeEvent> ||
                             is_a<E, BonkPoolCreateEvent>) {
            return non_default(e.base_mint);
        } else {
            return std::nullopt;
        }
    }, body);
}

std::optional<Pubkey> TradeEvent::user() const {
    return std::visit([](const auto& e) -> std::optional<Pubkey> {
        using E = decltype(e);
        if constexpr (is_a<E, PumpSwapCreatePoolEvent> || is_a<E, BonkPoolCreateEvent>) {
            return non_default(e.creator);
        } else if constexpr (is_a<E, BonkTradeEvent>) {
            return non_default(e.payer);
        } else {
            return non_default(e.user);
        }
    }, body);
}

std::optional<Pubkey> TradeEvent::market() const {
    return std::visit([](const auto& e) -> std::optional<Pubkey> {
        using E = decltype(e);
        if constexpr (is_a<E, PumpFunCreateEvent> ||
                      is_a<E, PumpFunTradeEvent> ||
                      is_a<E, PumpFunCompleteEvent>) {
            return non_default(e.bonding_curve);
        } else if constexpr (is_a<E, BonkTradeEvent> || is_a<E, BonkPoolCreateEvent>) {
            return non_default(e.pool_state);
        } else {
            return non_default(e.pool);
        }
    }, body);
}

}  // namespace solx::trading
