#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

namespace bullion::domain {

struct QueueDepth {
    size_t normalCount = 0;
    size_t priorityCount = 0;

    size_t total() const { return normalCount + priorityCount; }

    bool operator==(const QueueDepth& other) const {
        return normalCount == other.normalCount && priorityCount == other.priorityCount;
    }
};

/**
 * @brief Состояние очереди для health-отчёта
 */
struct QueueHealth {
    size_t normalQueueDepth = 0;
    size_t priorityQueueDepth = 0;
    bool backendConnected = false;

    nlohmann::json toJson() const {
        return {
            {"normal_queue_depth", normalQueueDepth},
            {"priority_queue_depth", priorityQueueDepth},
            {"total", normalQueueDepth + priorityQueueDepth},
            {"backend_connected", backendConnected}
        };
    }
};

} // namespace bullion::domain
