#pragma once

#include <optional>
#include <string>

namespace bullion::domain {

enum class OrderSide {
    BUY,
    SELL
};

inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "buy";
        case OrderSide::SELL: return "sell";
        default: return "unknown";
    }
}

inline std::optional<OrderSide> parseOrderSide(const std::string& str) {
    if (str == "buy") return OrderSide::BUY;
    if (str == "sell") return OrderSide::SELL;
    return std::nullopt;
}

} // namespace bullion::domain
