#pragma once

#include "domain/Decimal.hpp"
#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/PollingResult.hpp"
#include "domain/QueueHealth.hpp"
#include <string>
#include <vector>

namespace bullion::ports::input {

/**
 * @brief Интерфейс сервиса ордеров
 *
 * Все синхронные ошибки выбрасываются как domain::OrderException.
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    // ============================================
    // ОРДЕРА
    // ============================================

    /**
     * @brief Создать ордер и поставить его в очередь на исполнение
     * @return Ордер в статусе processing с pollUrl
     */
    virtual domain::Order placeOrder(const domain::OrderRequest& request) = 0;

    /**
     * @brief Отменить ордер (только pending/processing)
     */
    virtual void cancel(const std::string& orderId, const std::string& userId) = 0;

    /**
     * @brief Опросить статус ордера
     */
    virtual domain::PollingResult pollStatus(const std::string& orderId, const std::string& userId) = 0;

    virtual domain::Order getOrder(const std::string& orderId, const std::string& userId) = 0;

    /**
     * @brief История ордеров, новые первыми
     */
    virtual std::vector<domain::Order> getHistory(
        const std::string& userId, size_t limit = 50, size_t offset = 0) = 0;

    // ============================================
    // БАЛАНС
    // ============================================

    virtual domain::Decimal getBalance(const std::string& userId) = 0;

    /**
     * @brief Пополнить баланс
     * @return Новый баланс
     */
    virtual domain::Decimal deposit(const std::string& userId, const domain::Decimal& amount) = 0;

    // ============================================
    // ОЧЕРЕДЬ
    // ============================================

    virtual domain::QueueHealth getQueueHealth() = 0;
};

} // namespace bullion::ports::input
