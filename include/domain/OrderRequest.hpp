#pragma once

#include "Decimal.hpp"
#include "enums/OrderSide.hpp"
#include "enums/Symbol.hpp"
#include <string>

namespace bullion::domain {

/**
 * @brief Запрос на создание ордера
 *
 * amount - сумма в THB, priority > 0 отправляет задачу в приоритетную полосу.
 */
class OrderRequest {
public:
    std::string userId;
    Symbol symbol = Symbol::SPOT;
    OrderSide side = OrderSide::BUY;
    Decimal amount;
    int priority = 0;

    OrderRequest() = default;

    OrderRequest(const std::string& user, Symbol sym, OrderSide s, const Decimal& amt, int prio = 0)
        : userId(user)
        , symbol(sym)
        , side(s)
        , amount(amt)
        , priority(prio)
    {}
};

} // namespace bullion::domain
