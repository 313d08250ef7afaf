#pragma once

#include <stdexcept>
#include <string>

namespace bullion::domain {

/**
 * @brief Коды синхронных ошибок OrderService
 */
enum class OrderErrorCode {
    PRICE_UNAVAILABLE,
    INSUFFICIENT_FUNDS,
    QUEUE_UNAVAILABLE,
    LEDGER_UNAVAILABLE,
    NOT_FOUND,
    FORBIDDEN,
    INVALID_STATE,
    VALIDATION_ERROR
};

inline std::string toString(OrderErrorCode code) {
    switch (code) {
        case OrderErrorCode::PRICE_UNAVAILABLE: return "PriceUnavailable";
        case OrderErrorCode::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case OrderErrorCode::QUEUE_UNAVAILABLE: return "QueueUnavailable";
        case OrderErrorCode::LEDGER_UNAVAILABLE: return "LedgerUnavailable";
        case OrderErrorCode::NOT_FOUND: return "NotFound";
        case OrderErrorCode::FORBIDDEN: return "Forbidden";
        case OrderErrorCode::INVALID_STATE: return "InvalidState";
        case OrderErrorCode::VALIDATION_ERROR: return "ValidationError";
        default: return "Unknown";
    }
}

/**
 * @brief Исключение, выбрасываемое операциями над ордерами
 *
 * Вызывающий различает ошибки по code(), what() содержит текст для клиента.
 */
class OrderException : public std::runtime_error {
public:
    OrderException(OrderErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    OrderErrorCode code() const { return code_; }

private:
    OrderErrorCode code_;
};

} // namespace bullion::domain
