#pragma once

#include "settings/IQueueSettings.hpp"
#include <cstdlib>
#include <string>

namespace bullion::settings {

/**
 * @brief Настройки очереди задач
 *
 * Читает из ENV:
 * - QUEUE_NAME (default: trading_tasks)
 * - QUEUE_STATUS_TTL_SECONDS (default: 3600)
 * - QUEUE_POLL_INTERVAL_MS (default: 100) - шаг опроса PostgreSQL при ожидании задачи
 */
class QueueSettings : public IQueueSettings {
public:
    std::string getQueueName() const override {
        const char* name = std::getenv("QUEUE_NAME");
        return name ? name : "trading_tasks";
    }

    std::chrono::seconds getStatusTtl() const override {
        const char* ttl = std::getenv("QUEUE_STATUS_TTL_SECONDS");
        return std::chrono::seconds(ttl ? std::stoi(ttl) : 3600);
    }

    std::chrono::milliseconds getPollInterval() const override {
        const char* interval = std::getenv("QUEUE_POLL_INTERVAL_MS");
        return std::chrono::milliseconds(interval ? std::stoi(interval) : 100);
    }
};

} // namespace bullion::settings
