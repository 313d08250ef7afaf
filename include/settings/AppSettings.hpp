#pragma once

#include <cstdlib>
#include <string>

namespace bullion::settings {

/**
 * @brief Общие настройки приложения
 *
 * Читает из ENV:
 * - BULLION_STORAGE (default: postgres) - "postgres" или "memory"
 * - BULLION_POLL_URL_PREFIX (default: /trading/poll/)
 * - BULLION_HEALTH_LOG_INTERVAL_SECONDS (default: 30)
 * - BULLION_CLEAR_QUEUE_ON_START (default: false) - "true" сбрасывает
 *   невыполненные задачи при запуске
 */
class AppSettings {
public:
    AppSettings() {
        if (const char* val = std::getenv("BULLION_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("BULLION_POLL_URL_PREFIX")) {
            pollUrlPrefix_ = val;
        }
        if (const char* val = std::getenv("BULLION_HEALTH_LOG_INTERVAL_SECONDS")) {
            healthLogIntervalSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("BULLION_CLEAR_QUEUE_ON_START")) {
            clearQueueOnStart_ = std::string(val) == "true";
        }
    }

    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }
    std::string getPollUrlPrefix() const { return pollUrlPrefix_; }
    int getHealthLogIntervalSeconds() const { return healthLogIntervalSeconds_; }
    bool clearQueueOnStart() const { return clearQueueOnStart_; }

private:
    std::string storage_ = "postgres";
    std::string pollUrlPrefix_ = "/trading/poll/";
    int healthLogIntervalSeconds_ = 30;
    bool clearQueueOnStart_ = false;
};

} // namespace bullion::settings
