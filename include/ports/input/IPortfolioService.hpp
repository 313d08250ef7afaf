#pragma once

#include "domain/Portfolio.hpp"
#include <string>

namespace bullion::ports::input {

/**
 * @brief Интерфейс сервиса портфеля
 */
class IPortfolioService {
public:
    virtual ~IPortfolioService() = default;

    /**
     * @brief Баланс, позиции по исполненным ордерам и их оценка
     * @throws domain::OrderException (NOT_FOUND) если счёта нет
     */
    virtual domain::Portfolio getPortfolio(const std::string& userId) = 0;
};

} // namespace bullion::ports::input
