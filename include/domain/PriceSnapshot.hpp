#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/OrderSide.hpp"
#include "enums/Symbol.hpp"
#include <optional>

namespace bullion::domain {

/**
 * @brief Текущая цена инструмента от оракула
 *
 * spot: задана только singlePrice.
 * gold96: askPrice (цена покупки, buy_price) и bidPrice (цена выкупа, sell_price).
 */
class PriceSnapshot {
public:
    Symbol symbol = Symbol::SPOT;
    std::optional<Decimal> bidPrice;
    std::optional<Decimal> askPrice;
    std::optional<Decimal> singlePrice;
    Timestamp asOf;

    static PriceSnapshot single(Symbol symbol, const Decimal& price) {
        PriceSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.singlePrice = price;
        return snapshot;
    }

    static PriceSnapshot twoSided(Symbol symbol, const Decimal& bid, const Decimal& ask) {
        PriceSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.bidPrice = bid;
        snapshot.askPrice = ask;
        return snapshot;
    }

    /**
     * @brief Цена за единицу для стороны сделки
     *
     * Покупатель платит ask, продавец получает bid.
     * Если есть единая цена, она используется для обеих сторон.
     */
    std::optional<Decimal> priceFor(OrderSide side) const {
        if (singlePrice) {
            return singlePrice;
        }
        return side == OrderSide::BUY ? askPrice : bidPrice;
    }

    /**
     * @brief Цена для оценки позиции (по цене выкупа)
     */
    std::optional<Decimal> valuationPrice() const {
        return priceFor(OrderSide::SELL);
    }
};

} // namespace bullion::domain
