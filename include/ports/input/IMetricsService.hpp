#pragma once

#include <cstdint>
#include <string>
#include <map>

namespace bullion::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Определяет контракт для сбора и сериализации метрик в формате Prometheus.
 * Поддерживает только counter метрики с опциональными labels.
 *
 * @example
 * ```cpp
 * metricsService->increment("orders_completed_total");
 *
 * metricsService->increment("orders_placed_total", {{"side", "buy"}});
 *
 * std::string output = metricsService->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * Если метрика с данным ключом не существует, создаёт её со значением 1.
     *
     * @param name Имя метрики (например, "orders_placed_total")
     * @param labels Опциональные labels в формате {key: value}
     *
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение счётчика (0, если его нет)
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    /**
     * @brief Сериализовать метрики в Prometheus формат
     *
     * ```
     * # HELP metric_name Description
     * # TYPE metric_name counter
     * metric_name{label="value"} 42
     * ```
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace bullion::ports::input
