// include/domain/TaskEnvelope.hpp
#pragma once

#include "QueueTask.hpp"
#include "Result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bullion::domain {

/**
 * @brief Причина отказа в разборе конверта
 *
 * processingId заполнен, если его удалось прочитать: по нему
 * очередь помечает статус задачи как failed.
 */
struct EnvelopeError {
    std::string reason;
    std::optional<std::string> processingId;
};

/**
 * @brief JSON-кодек задачи очереди
 *
 * Формат:
 * ```json
 * {
 *   "version": 1,
 *   "processing_id": "...",
 *   "priority": 0,
 *   "queued_at": "2024-05-01T10:00:00.000Z",
 *   "payload": {
 *     "order_id": "...", "user_id": "...",
 *     "symbol": "spot", "side": "buy",
 *     "requested_amount": "500.00",
 *     "quoted_price_per_unit": "2000.00",
 *     "quantity": "0.25",
 *     "created_at": "2024-05-01T10:00:00.000Z"
 *   }
 * }
 * ```
 * Десятичные значения передаются строками, чтобы не терять точность.
 */
class TaskEnvelope {
public:
    static std::string encode(const QueueTask& task) {
        const auto& p = task.payload;

        nlohmann::json payload;
        payload["order_id"] = p.orderId;
        payload["user_id"] = p.userId;
        payload["symbol"] = toString(p.symbol);
        payload["side"] = toString(p.side);
        payload["requested_amount"] = p.requestedAmount.toString();
        payload["quoted_price_per_unit"] = p.quotedPricePerUnit.toString();
        payload["quantity"] = p.quantity.toString();
        payload["created_at"] = p.createdAt.toString();

        nlohmann::json envelope;
        envelope["version"] = p.version;
        envelope["processing_id"] = task.processingId;
        envelope["priority"] = task.priority;
        envelope["queued_at"] = task.queuedAt.toString();
        envelope["payload"] = payload;
        return envelope.dump();
    }

    /**
     * @brief Разобрать и проверить конверт
     *
     * Отклоняет: не-JSON, другую версию, отсутствующие поля,
     * неизвестные symbol/side, неположительные сумму и цену.
     */
    static Result<QueueTask, EnvelopeError> decode(const std::string& raw) {
        using R = Result<QueueTask, EnvelopeError>;

        nlohmann::json envelope = nlohmann::json::parse(raw, nullptr, false);
        if (envelope.is_discarded() || !envelope.is_object()) {
            return R::failure({"Malformed task envelope", std::nullopt});
        }

        std::optional<std::string> processingId;
        if (envelope.contains("processing_id") && envelope["processing_id"].is_string()) {
            processingId = envelope["processing_id"].get<std::string>();
        }

        auto reject = [&processingId](const std::string& reason) {
            return R::failure({reason, processingId});
        };

        if (!envelope.contains("version") || !envelope["version"].is_number_integer()) {
            return reject("Task envelope has no version");
        }
        int version = envelope["version"].get<int>();
        if (version != OrderExecutionRequest::CURRENT_VERSION) {
            return reject("Unsupported task envelope version " + std::to_string(version));
        }
        if (!processingId || processingId->empty()) {
            return reject("Task envelope has no processing_id");
        }
        if (!envelope.contains("payload") || !envelope["payload"].is_object()) {
            return reject("Task envelope has no payload");
        }

        try {
            const auto& payload = envelope["payload"];

            QueueTask task;
            task.processingId = *processingId;
            task.priority = envelope.value("priority", 0);
            task.queuedAt = Timestamp::fromString(envelope.at("queued_at").get<std::string>());

            auto& request = task.payload;
            request.version = version;
            request.orderId = payload.at("order_id").get<std::string>();
            request.userId = payload.at("user_id").get<std::string>();

            auto symbol = parseSymbol(payload.at("symbol").get<std::string>());
            if (!symbol) {
                return reject("Unknown symbol: " + payload.at("symbol").get<std::string>());
            }
            request.symbol = *symbol;

            auto side = parseOrderSide(payload.at("side").get<std::string>());
            if (!side) {
                return reject("Unknown side: " + payload.at("side").get<std::string>());
            }
            request.side = *side;

            request.requestedAmount = Decimal::fromString(payload.at("requested_amount").get<std::string>());
            request.quotedPricePerUnit = Decimal::fromString(payload.at("quoted_price_per_unit").get<std::string>());
            request.quantity = Decimal::fromString(payload.at("quantity").get<std::string>());
            request.createdAt = Timestamp::fromString(payload.at("created_at").get<std::string>());

            if (request.orderId.empty() || request.userId.empty()) {
                return reject("Task payload has empty order_id or user_id");
            }
            if (!request.requestedAmount.isPositive()) {
                return reject("Task payload has non-positive requested_amount");
            }
            if (!request.quotedPricePerUnit.isPositive()) {
                return reject("Task payload has non-positive quoted_price_per_unit");
            }

            return R::success(task);

        } catch (const std::exception& e) {
            // nlohmann::json::exception (нет поля / не тот тип) и ошибки разбора чисел и дат
            return reject(std::string("Invalid task payload: ") + e.what());
        }
    }
};

} // namespace bullion::domain
