#pragma once

#include <string>
#include <vector>

namespace bullion::settings {

/**
 * @brief Определение метрики для Prometheus
 *
 * Содержит метаданные метрики: имя, описание и тип.
 * Используется для генерации HELP и TYPE комментариев в Prometheus формате.
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "orders_placed_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * @note Все ключи метрик перечисляются заранее в getAllKeys():
 *       по ним метрики инициализируются нулями и выводятся в заданном порядке.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    /**
     * @brief Получить определения всех метрик
     *
     * @return Вектор определений метрик
     */
    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @brief Получить все ключи метрик с labels
     *
     * @return Вектор ключей в формате "metric_name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace bullion::settings
