// include/domain/Order.hpp
#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderStatus.hpp"
#include "enums/Symbol.hpp"
#include "exceptions/OrderException.hpp"
#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Ордер (транзакция) пользователя
 *
 * Клиент задаёт сумму в THB, количество золота вычисляется из цены.
 * Поля executed* заполняются воркером при исполнении.
 *
 * Переходы статуса только вперёд:
 * - pending → processing
 * - pending | processing → failed
 * - processing → completed
 */
class Order {
public:
    std::string id;
    std::string userId;
    Symbol symbol;
    OrderSide side;
    Decimal requestedAmount;
    Decimal quotedPricePerUnit;
    // Предварительное количество: requestedAmount / quotedPricePerUnit
    Decimal quantity;
    Decimal executedQuantity;
    std::optional<Decimal> executedPricePerUnit;
    std::optional<Decimal> executedAmount;
    OrderStatus status;
    std::string processingId;
    std::string pollUrl;
    std::string errorMessage;
    // Удержание вернули (или его не было): повторная задача не возвращает его снова
    bool holdReleased = false;
    int priority = 0;
    Timestamp createdAt;
    Timestamp updatedAt;

    Order()
        : symbol(Symbol::SPOT)
        , side(OrderSide::BUY)
        , status(OrderStatus::PENDING)
    {}

    Order(const std::string& id_, const std::string& userId_,
          Symbol symbol_, OrderSide side_,
          const Decimal& amount, const Decimal& quotedPrice)
        : id(id_)
        , userId(userId_)
        , symbol(symbol_)
        , side(side_)
        , requestedAmount(amount)
        , quotedPricePerUnit(quotedPrice)
        , status(OrderStatus::PENDING)
        , createdAt(Timestamp::now())
        , updatedAt(createdAt)
    {}

    bool isTerminal() const {
        return domain::isTerminal(status);
    }

    void markProcessing() {
        if (status != OrderStatus::PENDING) {
            throw OrderException(OrderErrorCode::INVALID_STATE,
                "Order " + id + " cannot move from " + toString(status) + " to processing");
        }
        touch(OrderStatus::PROCESSING);
    }

    /**
     * @brief Зафиксировать результат исполнения
     */
    void complete(const Decimal& price, const Decimal& qty, const Decimal& amount) {
        if (status != OrderStatus::PROCESSING) {
            throw OrderException(OrderErrorCode::INVALID_STATE,
                "Order " + id + " cannot move from " + toString(status) + " to completed");
        }
        executedPricePerUnit = price;
        executedQuantity = qty;
        executedAmount = amount;
        errorMessage.clear();
        touch(OrderStatus::COMPLETED);
    }

    void fail(const std::string& reason) {
        if (isTerminal()) {
            throw OrderException(OrderErrorCode::INVALID_STATE,
                "Order " + id + " is already " + toString(status));
        }
        errorMessage = reason;
        touch(OrderStatus::FAILED);
    }

private:
    void touch(OrderStatus newStatus) {
        status = newStatus;
        updatedAt = Timestamp::now();
    }
};

} // namespace bullion::domain
