#pragma once

#include "domain/PriceSnapshot.hpp"
#include "domain/enums/Symbol.hpp"
#include <optional>

namespace bullion::ports::output {

/**
 * @brief Источник текущих цен
 *
 * nullopt означает, что цены для инструмента нет (или она не получена вовремя).
 * Устаревание цены не проверяется.
 */
class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    virtual std::optional<domain::PriceSnapshot> getCurrentPrice(domain::Symbol symbol) = 0;
};

} // namespace bullion::ports::output
