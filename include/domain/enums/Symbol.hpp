#pragma once

#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Торгуемый инструмент
 *
 * SPOT - мировое спот-золото, одна цена для обеих сторон.
 * GOLD96 - тайское золото 96.5%, отдельные цены покупки и продажи.
 */
enum class Symbol {
    SPOT,
    GOLD96
};

inline std::string toString(Symbol symbol) {
    switch (symbol) {
        case Symbol::SPOT: return "spot";
        case Symbol::GOLD96: return "gold96";
        default: return "unknown";
    }
}

inline std::optional<Symbol> parseSymbol(const std::string& str) {
    if (str == "spot") return Symbol::SPOT;
    if (str == "gold96") return Symbol::GOLD96;
    return std::nullopt;
}

} // namespace bullion::domain
