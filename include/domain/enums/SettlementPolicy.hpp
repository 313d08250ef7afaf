#pragma once

#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Политика пересчёта ордера по цене исполнения
 *
 * AMOUNT_PRESERVING - сумма фиксирована, пересчитывается количество.
 * QUANTITY_PRESERVING - фиксировано предварительное количество, пересчитывается сумма.
 */
enum class SettlementPolicy {
    AMOUNT_PRESERVING,
    QUANTITY_PRESERVING
};

inline std::string toString(SettlementPolicy policy) {
    switch (policy) {
        case SettlementPolicy::AMOUNT_PRESERVING: return "AMOUNT_PRESERVING";
        case SettlementPolicy::QUANTITY_PRESERVING: return "QUANTITY_PRESERVING";
        default: return "UNKNOWN";
    }
}

inline std::optional<SettlementPolicy> parseSettlementPolicy(const std::string& str) {
    if (str == "AMOUNT_PRESERVING") return SettlementPolicy::AMOUNT_PRESERVING;
    if (str == "QUANTITY_PRESERVING") return SettlementPolicy::QUANTITY_PRESERVING;
    return std::nullopt;
}

} // namespace bullion::domain
