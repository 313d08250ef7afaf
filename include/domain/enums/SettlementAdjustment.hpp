#pragma once

#include <string>

namespace bullion::domain {

/**
 * @brief Вид корректировки баланса при исполнении
 */
enum class SettlementAdjustment {
    NONE,
    REFUND,
    ADDITIONAL_CHARGE,
    CREDIT
};

inline std::string toString(SettlementAdjustment adjustment) {
    switch (adjustment) {
        case SettlementAdjustment::NONE: return "none";
        case SettlementAdjustment::REFUND: return "refund";
        case SettlementAdjustment::ADDITIONAL_CHARGE: return "additional_charge";
        case SettlementAdjustment::CREDIT: return "credit";
        default: return "unknown";
    }
}

} // namespace bullion::domain
