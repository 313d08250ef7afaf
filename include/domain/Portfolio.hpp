#pragma once

#include "Decimal.hpp"
#include "enums/Symbol.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bullion::domain {

/**
 * @brief Позиция по одному инструменту
 *
 * currentPrice/marketValue пусты, если цена недоступна
 * или позиция не положительная.
 */
struct Holding {
    Symbol symbol = Symbol::SPOT;
    Decimal quantity;
    std::optional<Decimal> currentPrice;
    std::optional<Decimal> marketValue;
};

/**
 * @brief Портфель пользователя
 */
class Portfolio {
public:
    std::string userId;
    Decimal cash;
    std::vector<Holding> holdings;

    Decimal holdingsValue() const {
        Decimal total;
        for (const auto& holding : holdings) {
            if (holding.marketValue) {
                total += *holding.marketValue;
            }
        }
        return total;
    }

    Decimal totalValue() const {
        return cash + holdingsValue();
    }

    std::optional<Holding> find(Symbol symbol) const {
        for (const auto& holding : holdings) {
            if (holding.symbol == symbol) {
                return holding;
            }
        }
        return std::nullopt;
    }
};

} // namespace bullion::domain
