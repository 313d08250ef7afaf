#pragma once

#include "settings/IWorkerSettings.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace bullion::settings {

/**
 * @brief Настройки воркера исполнения
 *
 * Читает из ENV:
 * - WORKER_DEQUEUE_TIMEOUT_MS (default: 1000)
 * - WORKER_IDLE_SLEEP_MS (default: 100)
 * - WORKER_ERROR_BACKOFF_MS (default: 1000)
 * - SETTLEMENT_POLICY (default: AMOUNT_PRESERVING)
 *
 * @throws std::invalid_argument при неизвестной SETTLEMENT_POLICY
 */
class WorkerSettings : public IWorkerSettings {
public:
    WorkerSettings() {
        if (const char* val = std::getenv("WORKER_DEQUEUE_TIMEOUT_MS")) {
            dequeueTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("WORKER_IDLE_SLEEP_MS")) {
            idleSleep_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("WORKER_ERROR_BACKOFF_MS")) {
            errorBackoff_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("SETTLEMENT_POLICY")) {
            auto policy = domain::parseSettlementPolicy(val);
            if (!policy) {
                throw std::invalid_argument(std::string("Unknown SETTLEMENT_POLICY: ") + val);
            }
            policy_ = *policy;
        }
    }

    std::chrono::milliseconds getDequeueTimeout() const override { return dequeueTimeout_; }
    std::chrono::milliseconds getIdleSleep() const override { return idleSleep_; }
    std::chrono::milliseconds getErrorBackoff() const override { return errorBackoff_; }
    domain::SettlementPolicy getSettlementPolicy() const override { return policy_; }

private:
    std::chrono::milliseconds dequeueTimeout_{1000};
    std::chrono::milliseconds idleSleep_{100};
    std::chrono::milliseconds errorBackoff_{1000};
    domain::SettlementPolicy policy_ = domain::SettlementPolicy::AMOUNT_PRESERVING;
};

} // namespace bullion::settings
