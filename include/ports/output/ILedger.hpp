#pragma once

#include "domain/Decimal.hpp"
#include <optional>
#include <string>

namespace bullion::ports::output {

/**
 * @brief Балансы пользователей (THB)
 *
 * Единственный источник правды о деньгах. Корректировки по одному
 * счёту сериализуются реализацией.
 */
class ILedger {
public:
    virtual ~ILedger() = default;

    /**
     * @brief Текущий баланс или nullopt, если счёта нет
     * @throws domain::LedgerException при недоступности хранилища
     */
    virtual std::optional<domain::Decimal> getBalance(const std::string& userId) = 0;

    /**
     * @brief Изменить баланс на знаковую дельту
     *
     * @return false без изменений, если счёта нет или баланс стал бы отрицательным
     * @throws domain::LedgerException при недоступности хранилища
     */
    virtual bool adjust(const std::string& userId, const domain::Decimal& delta) = 0;

    /**
     * @brief Открыть счёт (ничего не делает, если счёт уже есть)
     */
    virtual void openAccount(const std::string& userId, const domain::Decimal& initialBalance) = 0;
};

} // namespace bullion::ports::output
