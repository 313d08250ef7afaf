#pragma once

#include "domain/QueueHealth.hpp"
#include "domain/QueueTask.hpp"
#include "domain/TaskStatus.hpp"
#include "domain/enums/OrderStatus.hpp"
#include "domain/enums/QueueLane.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace bullion::ports::output {

/**
 * @brief Очередь задач исполнения с двумя полосами и кэшем статусов
 *
 * - priority > 0 → приоритетная полоса, порядок (priority, queuedAt), меньший первым
 * - иначе → обычная FIFO-полоса
 * - приоритетная полоса всегда вычерпывается раньше обычной
 *
 * Ошибки бэкенда выбрасываются как domain::QueueException.
 */
class IWorkQueue {
public:
    virtual ~IWorkQueue() = default;

    /**
     * @brief Поставить задачу в очередь
     *
     * Генерирует processingId, если он пуст, проставляет queuedAt
     * и записывает TaskStatus pending.
     * @return processingId задачи
     */
    virtual std::string enqueue(domain::QueueTask task) = 0;

    /**
     * @brief Забрать задачу
     *
     * PRIORITY - неблокирующий pop из приоритетной полосы.
     * NORMAL - сначала приоритетная полоса, затем ожидание обычной до timeout.
     * Задача удаляется из очереди до обработки.
     */
    virtual std::optional<domain::QueueTask> dequeue(
        domain::QueueLane lane, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Перезаписать статус задачи (новый TTL, побеждает последняя запись)
     */
    virtual void setStatus(
        const std::string& processingId,
        domain::OrderStatus status,
        const std::optional<nlohmann::json>& result = std::nullopt) = 0;

    /**
     * @brief Статус задачи или nullopt после истечения TTL
     */
    virtual std::optional<domain::TaskStatus> getStatus(const std::string& processingId) = 0;

    virtual domain::QueueDepth queueDepth() = 0;

    virtual domain::QueueHealth health() = 0;

    /**
     * @brief Удалить все задачи из обеих полос (статусы не трогает)
     */
    virtual void clear() = 0;
};

} // namespace bullion::ports::output
