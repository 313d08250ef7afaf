#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace bullion::settings {

/**
 * @brief Настройки метрик конвейера ордеров
 *
 * - создание ордеров (по стороне сделки), отказы, отмены
 * - итоги исполнения
 * - корректировки баланса при исполнении (по типу)
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"orders_placed_total", "Total orders accepted for execution", "counter"},
            {"orders_rejected_total", "Total orders rejected at placement", "counter"},
            {"orders_cancelled_total", "Total orders cancelled by users", "counter"},
            {"orders_completed_total", "Total orders settled successfully", "counter"},
            {"orders_failed_total", "Total orders failed during execution", "counter"},
            {"settlement_adjustments_total", "Total balance adjustments made at settlement", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // Создание ордеров
            // ============================================
            "orders_placed_total{side=\"buy\"}",
            "orders_placed_total{side=\"sell\"}",
            "orders_rejected_total",
            "orders_cancelled_total",

            // ============================================
            // Исполнение
            // ============================================
            "orders_completed_total",
            "orders_failed_total",

            "settlement_adjustments_total{type=\"refund\"}",
            "settlement_adjustments_total{type=\"additional_charge\"}",
            "settlement_adjustments_total{type=\"credit\"}",
            "settlement_adjustments_total{type=\"none\"}"
        };
    }
};

} // namespace bullion::settings
