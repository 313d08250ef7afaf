#pragma once

#include <stdexcept>
#include <string>

namespace bullion::domain {

/**
 * @brief Хранилище балансов недоступно или отказало
 *
 * Отказ в списании из-за нехватки средств - не исключение,
 * а false из ILedger::adjust().
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace bullion::domain
