#pragma once

#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Статус ордера (он же статус задачи в очереди)
 *
 * Движется только вперёд: pending → processing → {completed | failed}.
 */
enum class OrderStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::PROCESSING: return "processing";
        case OrderStatus::COMPLETED: return "completed";
        case OrderStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

inline std::optional<OrderStatus> parseOrderStatus(const std::string& str) {
    if (str == "pending") return OrderStatus::PENDING;
    if (str == "processing") return OrderStatus::PROCESSING;
    if (str == "completed") return OrderStatus::COMPLETED;
    if (str == "failed") return OrderStatus::FAILED;
    return std::nullopt;
}

inline bool isTerminal(OrderStatus status) {
    return status == OrderStatus::COMPLETED || status == OrderStatus::FAILED;
}

/**
 * @brief Порядковый номер статуса в жизненном цикле
 *
 * completed и failed имеют одинаковый ранг: оба терминальные.
 */
inline int lifecycleRank(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return 0;
        case OrderStatus::PROCESSING: return 1;
        default: return 2;
    }
}

} // namespace bullion::domain
