// include/domain/QueueTask.hpp
#pragma once

#include "Decimal.hpp"
#include "Order.hpp"
#include "Timestamp.hpp"
#include "enums/OrderSide.hpp"
#include "enums/QueueLane.hpp"
#include "enums/Symbol.hpp"
#include <string>

namespace bullion::domain {

/**
 * @brief Полезная нагрузка задачи исполнения ордера
 *
 * Версионированная структура: воркер принимает только конверты
 * с version == CURRENT_VERSION.
 */
struct OrderExecutionRequest {
    static constexpr int CURRENT_VERSION = 1;

    int version = CURRENT_VERSION;
    std::string orderId;
    std::string userId;
    Symbol symbol = Symbol::SPOT;
    OrderSide side = OrderSide::BUY;
    Decimal requestedAmount;
    Decimal quotedPricePerUnit;
    Decimal quantity;
    Timestamp createdAt;

    static OrderExecutionRequest fromOrder(const Order& order) {
        OrderExecutionRequest request;
        request.orderId = order.id;
        request.userId = order.userId;
        request.symbol = order.symbol;
        request.side = order.side;
        request.requestedAmount = order.requestedAmount;
        request.quotedPricePerUnit = order.quotedPricePerUnit;
        request.quantity = order.quantity;
        request.createdAt = order.createdAt;
        return request;
    }
};

/**
 * @brief Задача в очереди
 *
 * processingId связывает задачу с Order.processingId и с TaskStatus.
 * queuedAt проставляется очередью при enqueue.
 */
struct QueueTask {
    std::string processingId;
    OrderExecutionRequest payload;
    int priority = 0;
    Timestamp queuedAt;

    QueueLane lane() const {
        return laneForPriority(priority);
    }
};

} // namespace bullion::domain
