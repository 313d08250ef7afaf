#pragma once

#include "domain/Decimal.hpp"
#include "domain/QueueTask.hpp"
#include "domain/Settlement.hpp"
#include "domain/enums/OrderSide.hpp"
#include "domain/enums/SettlementPolicy.hpp"
#include <stdexcept>

namespace bullion::application {

/**
 * @brief Расчёт исполнения ордера по текущей цене
 *
 * Чистая функция: ничего не пишет, только считает.
 *
 * Покупка (сумма уже удержана при создании ордера):
 * - delta = requestedAmount - executedAmount
 * - delta > 0 → REFUND, delta < 0 → ADDITIONAL_CHARGE, 0 → NONE
 *
 * Продажа (удержания не было): CREDIT на executedAmount.
 *
 * executedAmount округляется до сатанга (CURRENCY_DIGITS).
 */
class SettlementCalculator {
public:
    explicit SettlementCalculator(domain::SettlementPolicy policy = domain::SettlementPolicy::AMOUNT_PRESERVING)
        : policy_(policy)
    {}

    domain::SettlementPolicy policy() const { return policy_; }

    /**
     * @throws std::invalid_argument если цена не положительная
     */
    domain::SettlementPlan plan(
        const domain::OrderExecutionRequest& request,
        const domain::Decimal& currentPrice) const
    {
        if (!currentPrice.isPositive()) {
            throw std::invalid_argument("Settlement price must be positive, got " + currentPrice.toString());
        }

        domain::SettlementPlan plan;
        plan.executedPricePerUnit = currentPrice;
        plan.executedQuantity = policy_ == domain::SettlementPolicy::AMOUNT_PRESERVING
            ? request.requestedAmount / currentPrice
            : request.quantity;
        plan.calculatedAmount = plan.executedQuantity * currentPrice;
        plan.executedAmount = plan.calculatedAmount.rounded(domain::CURRENCY_DIGITS);
        plan.priceChange = currentPrice - request.quotedPricePerUnit;

        if (request.side == domain::OrderSide::SELL) {
            plan.balanceDelta = plan.executedAmount;
            plan.adjustment = domain::SettlementAdjustment::CREDIT;
            return plan;
        }

        plan.balanceDelta = request.requestedAmount - plan.executedAmount;
        if (plan.balanceDelta.isPositive()) {
            plan.adjustment = domain::SettlementAdjustment::REFUND;
        } else if (plan.balanceDelta.isNegative()) {
            plan.adjustment = domain::SettlementAdjustment::ADDITIONAL_CHARGE;
        } else {
            plan.adjustment = domain::SettlementAdjustment::NONE;
        }
        return plan;
    }

private:
    domain::SettlementPolicy policy_;
};

} // namespace bullion::application
