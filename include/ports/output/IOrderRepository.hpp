#pragma once

#include "domain/Order.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bullion::ports::output {

/**
 * @brief Хранилище ордеров (durable)
 *
 * Пишут только OrderService (создание, отмена) и ExecutionWorker (итог исполнения).
 * update() перезаписывает строку целиком: при гонке побеждает последняя запись.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    virtual void save(const domain::Order& order) = 0;

    virtual void update(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    /**
     * @brief Ордера пользователя, новые первыми
     */
    virtual std::vector<domain::Order> findByUserId(
        const std::string& userId, size_t limit = 50, size_t offset = 0) = 0;
};

} // namespace bullion::ports::output
