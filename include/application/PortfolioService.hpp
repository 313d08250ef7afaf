#pragma once

#include "ports/input/IPortfolioService.hpp"
#include "ports/output/ILedger.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IPriceOracle.hpp"
#include "domain/exceptions/OrderException.hpp"
#include <iostream>
#include <limits>
#include <map>
#include <memory>

namespace bullion::application {

/**
 * @brief Сервис портфеля
 *
 * Позиции считаются по исполненным ордерам: покупка прибавляет
 * executedQuantity, продажа вычитает. Оценка по цене выкупа
 * (spot - единая цена, gold96 - bid), только для положительных позиций.
 */
class PortfolioService : public ports::input::IPortfolioService {
public:
    PortfolioService(
        std::shared_ptr<ports::output::ILedger> ledger,
        std::shared_ptr<ports::output::IOrderRepository> orders,
        std::shared_ptr<ports::output::IPriceOracle> priceOracle
    ) : ledger_(std::move(ledger))
      , orders_(std::move(orders))
      , priceOracle_(std::move(priceOracle))
    {}

    domain::Portfolio getPortfolio(const std::string& userId) override {
        auto balance = ledger_->getBalance(userId);
        if (!balance) {
            throw domain::OrderException(domain::OrderErrorCode::NOT_FOUND, "Account not found: " + userId);
        }

        domain::Portfolio portfolio;
        portfolio.userId = userId;
        portfolio.cash = *balance;

        std::map<domain::Symbol, domain::Decimal> quantities = {
            {domain::Symbol::SPOT, domain::Decimal()},
            {domain::Symbol::GOLD96, domain::Decimal()}
        };

        auto history = orders_->findByUserId(userId, std::numeric_limits<size_t>::max(), 0);
        for (const auto& order : history) {
            if (order.status != domain::OrderStatus::COMPLETED) {
                continue;
            }
            if (order.side == domain::OrderSide::BUY) {
                quantities[order.symbol] += order.executedQuantity;
            } else {
                quantities[order.symbol] -= order.executedQuantity;
            }
        }

        for (const auto& [symbol, quantity] : quantities) {
            domain::Holding holding;
            holding.symbol = symbol;
            holding.quantity = quantity;

            if (quantity.isPositive()) {
                holding.currentPrice = valuationPrice(symbol);
                if (holding.currentPrice) {
                    holding.marketValue = (quantity * *holding.currentPrice).rounded(domain::CURRENCY_DIGITS);
                }
            }
            portfolio.holdings.push_back(holding);
        }

        return portfolio;
    }

private:
    std::shared_ptr<ports::output::ILedger> ledger_;
    std::shared_ptr<ports::output::IOrderRepository> orders_;
    std::shared_ptr<ports::output::IPriceOracle> priceOracle_;

    std::optional<domain::Decimal> valuationPrice(domain::Symbol symbol) {
        try {
            auto snapshot = priceOracle_->getCurrentPrice(symbol);
            return snapshot ? snapshot->valuationPrice() : std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[PortfolioService] Price lookup error for "
                      << domain::toString(symbol) << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }
};

} // namespace bullion::application
