#pragma once

#include "Timestamp.hpp"
#include "enums/OrderStatus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Ответ на опрос статуса ордера
 *
 * message: "pending", "processing", "completed" или "failed: <причина>".
 * data и completedAt заполнены только для терминальных статусов.
 */
class PollingResult {
public:
    OrderStatus status = OrderStatus::PENDING;
    std::string message;
    std::optional<nlohmann::json> data;
    std::optional<Timestamp> completedAt;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["status"] = toString(status);
        j["message"] = message;
        j["data"] = data ? *data : nlohmann::json(nullptr);
        j["completed_at"] = completedAt ? nlohmann::json(completedAt->toString()) : nlohmann::json(nullptr);
        return j;
    }

    bool operator==(const PollingResult& other) const {
        return status == other.status
            && message == other.message
            && data == other.data
            && completedAt == other.completedAt;
    }
};

} // namespace bullion::domain
