// include/domain/Settlement.hpp
#pragma once

#include "Decimal.hpp"
#include "Result.hpp"
#include "Timestamp.hpp"
#include "enums/SettlementAdjustment.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace bullion::domain {

/**
 * @brief Виды ошибок исполнения ордера
 *
 * Воркер выбирает компенсацию по виду ошибки.
 */
enum class SettlementErrorKind {
    PRICE_UNAVAILABLE,
    INSUFFICIENT_FUNDS_ON_SETTLEMENT,
    LEDGER_UNAVAILABLE,
    ORDER_NOT_FOUND,
    ORDER_CANCELLED,
    INVALID_PAYLOAD
};

inline std::string toString(SettlementErrorKind kind) {
    switch (kind) {
        case SettlementErrorKind::PRICE_UNAVAILABLE: return "PriceUnavailable";
        case SettlementErrorKind::INSUFFICIENT_FUNDS_ON_SETTLEMENT: return "InsufficientFundsOnSettlement";
        case SettlementErrorKind::LEDGER_UNAVAILABLE: return "LedgerUnavailable";
        case SettlementErrorKind::ORDER_NOT_FOUND: return "OrderNotFound";
        case SettlementErrorKind::ORDER_CANCELLED: return "OrderCancelled";
        case SettlementErrorKind::INVALID_PAYLOAD: return "InvalidPayload";
        default: return "Unknown";
    }
}

struct SettlementError {
    SettlementErrorKind kind;
    std::string message;
};

/**
 * @brief Расчёт исполнения по текущей цене (без побочных эффектов)
 *
 * balanceDelta - знаковая корректировка баланса:
 * > 0 возврат или зачисление, < 0 доплата, 0 без движения.
 */
struct SettlementPlan {
    Decimal executedPricePerUnit;
    Decimal executedQuantity;
    Decimal executedAmount;
    Decimal calculatedAmount;
    Decimal priceChange;
    Decimal balanceDelta;
    SettlementAdjustment adjustment = SettlementAdjustment::NONE;
};

/**
 * @brief Итог успешного исполнения
 */
struct SettlementOutcome {
    std::string orderId;
    Decimal originalPricePerUnit;
    SettlementPlan plan;
    Timestamp executedAt;

    /**
     * @brief Результат для TaskStatus.result
     */
    nlohmann::json toJson() const {
        nlohmann::json j;
        j["transaction_id"] = orderId;
        j["executed_price"] = plan.executedPricePerUnit.toString();
        j["original_price"] = originalPricePerUnit.toString();
        j["executed_quantity"] = plan.executedQuantity.toString();
        j["executed_amount"] = plan.executedAmount.toString();
        j["calculated_amount"] = plan.calculatedAmount.toString();
        j["price_change"] = plan.priceChange.toString();
        j["balance_adjustment"] = plan.balanceDelta.abs().toString();
        j["adjustment_type"] = toString(plan.adjustment);
        j["executed_at"] = executedAt.toString();
        j["reference_id"] = "TXN" + orderId;
        j["status"] = "executed";
        return j;
    }
};

using SettlementResult = Result<SettlementOutcome, SettlementError>;

} // namespace bullion::domain
