// include/adapters/secondary/queue/PostgresWorkQueue.hpp
#pragma once

#include "ports/output/IWorkQueue.hpp"
#include "settings/DbSettings.hpp"
#include "settings/IQueueSettings.hpp"
#include "domain/TaskEnvelope.hpp"
#include "domain/exceptions/QueueException.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace bullion::adapters::secondary {

/**
 * @brief Очередь задач на PostgreSQL
 *
 * Таблицы:
 * - queue_tasks - задачи обеих полос (lane = 'normal' | 'priority')
 * - queue_task_status - статусы задач с моментом истечения expires_at
 *
 * Выдача задачи - DELETE ... RETURNING по первой строке с FOR UPDATE SKIP LOCKED:
 * задача удаляется до обработки и не достаётся двум потребителям.
 * Ожидание обычной полосы - опрос с шагом QUEUE_POLL_INTERVAL_MS.
 */
class PostgresWorkQueue : public ports::output::IWorkQueue {
public:
    PostgresWorkQueue(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::IQueueSettings> queueSettings)
        : dbSettings_(std::move(dbSettings))
        , queueSettings_(std::move(queueSettings))
        , queueName_(queueSettings_->getQueueName())
    {
        initSchema();
    }

    std::string enqueue(domain::QueueTask task) override {
        if (task.processingId.empty()) {
            task.processingId = utils::UuidGenerator::processingId();
        }
        task.queuedAt = domain::Timestamp::now();

        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO queue_tasks (queue_name, lane, priority, queued_at, payload) "
                "VALUES ($1, $2, $3, to_timestamp($4::BIGINT / 1000.0), $5)",
                queueName_,
                domain::toString(task.lane()),
                task.priority,
                task.queuedAt.toEpochMillis(),
                domain::TaskEnvelope::encode(task)
            );
            writeStatus(txn, task.processingId, domain::OrderStatus::PENDING, std::nullopt);

            txn.commit();
            std::cout << "[PostgresWorkQueue] Enqueued " << task.processingId
                      << " (" << domain::toString(task.lane()) << ")" << std::endl;
            return task.processingId;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] enqueue error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

    std::optional<domain::QueueTask> dequeue(domain::QueueLane lane, std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;) {
            auto raw = pop(domain::QueueLane::PRIORITY);
            if (!raw && lane == domain::QueueLane::NORMAL) {
                raw = pop(domain::QueueLane::NORMAL);
            }

            if (raw) {
                auto decoded = domain::TaskEnvelope::decode(*raw);
                if (decoded.isOk()) {
                    return decoded.value();
                }
                rejectEnvelope(decoded.error());
                continue;
            }

            if (lane == domain::QueueLane::PRIORITY || std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(queueSettings_->getPollInterval());
        }
    }

    void setStatus(
        const std::string& processingId,
        domain::OrderStatus status,
        const std::optional<nlohmann::json>& result = std::nullopt) override
    {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            writeStatus(txn, processingId, status, result);
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] setStatus error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

    std::optional<domain::TaskStatus> getStatus(const std::string& processingId) override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT status, result::TEXT AS result, "
                "       (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms "
                "FROM queue_task_status "
                "WHERE processing_id = $1 AND expires_at > NOW()",
                processingId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            auto status = domain::parseOrderStatus(row["status"].as<std::string>());
            if (!status) {
                throw std::runtime_error("Unknown task status: " + row["status"].as<std::string>());
            }

            domain::TaskStatus taskStatus;
            taskStatus.processingId = processingId;
            taskStatus.status = *status;
            taskStatus.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_at_ms"].as<int64_t>());
            if (!row["result"].is_null()) {
                taskStatus.result = nlohmann::json::parse(row["result"].as<std::string>());
            }
            return taskStatus;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] getStatus error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

    domain::QueueDepth queueDepth() override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT lane, COUNT(*) AS cnt FROM queue_tasks "
                "WHERE queue_name = $1 GROUP BY lane",
                queueName_
            );
            txn.commit();

            domain::QueueDepth depth;
            for (const auto& row : result) {
                auto count = row["cnt"].as<size_t>();
                if (row["lane"].as<std::string>() == domain::toString(domain::QueueLane::PRIORITY)) {
                    depth.priorityCount = count;
                } else {
                    depth.normalCount = count;
                }
            }
            return depth;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] queueDepth error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

    domain::QueueHealth health() override {
        domain::QueueHealth h;
        try {
            auto depth = queueDepth();
            h.normalQueueDepth = depth.normalCount;
            h.priorityQueueDepth = depth.priorityCount;
            h.backendConnected = true;
        } catch (const domain::QueueException& e) {
            h.backendConnected = false;
        }
        return h;
    }

    void clear() override {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "DELETE FROM queue_tasks WHERE queue_name = $1",
                queueName_
            );
            txn.commit();
            std::cout << "[PostgresWorkQueue] Cleared " << result.affected_rows() << " tasks" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] clear error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::IQueueSettings> queueSettings_;
    std::string queueName_;

    std::optional<std::string> pop(domain::QueueLane lane) {
        // Приоритетная полоса: (priority, queued_at), обычная: FIFO по id
        const char* order = lane == domain::QueueLane::PRIORITY
            ? "ORDER BY priority, queued_at, id "
            : "ORDER BY id ";

        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(
                "DELETE FROM queue_tasks WHERE id = ("
                "    SELECT id FROM queue_tasks "
                "    WHERE queue_name = $1 AND lane = $2 ") + order +
                "    LIMIT 1 FOR UPDATE SKIP LOCKED"
                ") RETURNING payload",
                queueName_,
                domain::toString(lane)
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return result[0]["payload"].as<std::string>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] dequeue error: " << e.what() << std::endl;
            throw domain::QueueException(e.what());
        }
    }

    void writeStatus(pqxx::work& txn, const std::string& processingId, domain::OrderStatus status,
                     const std::optional<nlohmann::json>& result) {
        txn.exec("DELETE FROM queue_task_status WHERE expires_at <= NOW()");
        txn.exec_params(
            "INSERT INTO queue_task_status (processing_id, status, result, updated_at, expires_at) "
            "VALUES ($1, $2, NULLIF($3, '')::JSONB, NOW(), NOW() + make_interval(secs => $4)) "
            "ON CONFLICT (processing_id) DO UPDATE SET "
            "status = EXCLUDED.status, "
            "result = EXCLUDED.result, "
            "updated_at = EXCLUDED.updated_at, "
            "expires_at = EXCLUDED.expires_at",
            processingId,
            domain::toString(status),
            result ? result->dump() : std::string(),
            static_cast<int64_t>(queueSettings_->getStatusTtl().count())
        );
    }

    void rejectEnvelope(const domain::EnvelopeError& error) {
        std::cerr << "[PostgresWorkQueue] Rejected task envelope: " << error.reason << std::endl;
        if (error.processingId) {
            setStatus(*error.processingId, domain::OrderStatus::FAILED, nlohmann::json{{"error", error.reason}});
        }
    }

    void initSchema() {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS queue_tasks (
                    id BIGSERIAL PRIMARY KEY,
                    queue_name VARCHAR(64) NOT NULL,
                    lane VARCHAR(16) NOT NULL,
                    priority INT NOT NULL DEFAULT 0,
                    queued_at TIMESTAMPTZ NOT NULL,
                    payload TEXT NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_queue_tasks_lane
                ON queue_tasks(queue_name, lane, priority, queued_at, id);

                CREATE TABLE IF NOT EXISTS queue_task_status (
                    processing_id VARCHAR(64) PRIMARY KEY,
                    status VARCHAR(16) NOT NULL,
                    result JSONB,
                    updated_at TIMESTAMPTZ NOT NULL,
                    expires_at TIMESTAMPTZ NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_queue_task_status_expires
                ON queue_task_status(expires_at);
            )");

            txn.commit();
            std::cout << "[PostgresWorkQueue] Schema initialized (" << queueName_ << ")" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresWorkQueue] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace bullion::adapters::secondary
