#pragma once

#include "Timestamp.hpp"
#include "enums/OrderStatus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace bullion::domain {

/**
 * @brief Эфемерный статус задачи в очереди
 *
 * Живёт независимо от строки Order и исчезает по TTL.
 * result - JSON с итогом исполнения ({error} при неудаче).
 */
class TaskStatus {
public:
    std::string processingId;
    OrderStatus status = OrderStatus::PENDING;
    std::optional<nlohmann::json> result;
    Timestamp updatedAt;

    TaskStatus() = default;

    TaskStatus(const std::string& id, OrderStatus s, std::optional<nlohmann::json> r = std::nullopt)
        : processingId(id)
        , status(s)
        , result(std::move(r))
        , updatedAt(Timestamp::now())
    {}

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["task_id"] = processingId;
        j["status"] = toString(status);
        j["updated_at"] = updatedAt.toString();
        j["result"] = result ? *result : nlohmann::json(nullptr);
        return j;
    }

    /**
     * @throws std::invalid_argument если статус неизвестен
     */
    static TaskStatus fromJson(const nlohmann::json& j) {
        auto parsed = parseOrderStatus(j.at("status").get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("Unknown task status: " + j.at("status").get<std::string>());
        }

        TaskStatus taskStatus;
        taskStatus.processingId = j.at("task_id").get<std::string>();
        taskStatus.status = *parsed;
        taskStatus.updatedAt = Timestamp::fromString(j.at("updated_at").get<std::string>());
        if (j.contains("result") && !j["result"].is_null()) {
            taskStatus.result = j["result"];
        }
        return taskStatus;
    }
};

} // namespace bullion::domain
