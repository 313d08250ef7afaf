#pragma once

#include <string>

namespace bullion::domain {

/**
 * @brief Полоса очереди задач
 *
 * PRIORITY всегда вычерпывается раньше NORMAL.
 */
enum class QueueLane {
    NORMAL,
    PRIORITY
};

inline std::string toString(QueueLane lane) {
    switch (lane) {
        case QueueLane::NORMAL: return "normal";
        case QueueLane::PRIORITY: return "priority";
        default: return "unknown";
    }
}

inline QueueLane laneForPriority(int priority) {
    return priority > 0 ? QueueLane::PRIORITY : QueueLane::NORMAL;
}

} // namespace bullion::domain
