// include/adapters/secondary/queue/InMemoryWorkQueue.hpp
#pragma once

#include "ports/output/IWorkQueue.hpp"
#include "settings/IQueueSettings.hpp"
#include "domain/TaskEnvelope.hpp"
#include "domain/exceptions/QueueException.hpp"
#include "utils/UuidGenerator.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <tuple>

namespace bullion::adapters::secondary {

/**
 * @brief In-memory очередь задач
 *
 * - обычная полоса: FIFO (std::deque)
 * - приоритетная полоса: std::set по (priority, queuedAt, seq)
 * - статусы задач: map с моментом истечения (steady_clock)
 *
 * Задачи хранятся закодированными, как в durable-бэкенде,
 * и проверяются при выдаче: битый конверт не доходит до воркера.
 */
class InMemoryWorkQueue : public ports::output::IWorkQueue {
public:
    explicit InMemoryWorkQueue(std::shared_ptr<settings::IQueueSettings> settings)
        : settings_(std::move(settings))
        , available_(true)
    {
        std::cout << "[InMemoryWorkQueue] Created (" << settings_->getQueueName() << ")" << std::endl;
    }

    std::string enqueue(domain::QueueTask task) override {
        ensureAvailable();

        if (task.processingId.empty()) {
            task.processingId = utils::UuidGenerator::processingId();
        }
        task.queuedAt = domain::Timestamp::now();
        auto raw = domain::TaskEnvelope::encode(task);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (task.lane() == domain::QueueLane::PRIORITY) {
                priority_.insert({task.priority, task.queuedAt.toEpochMillis(), sequence_++, raw});
            } else {
                normal_.push_back(raw);
            }
            writeStatus(task.processingId, domain::OrderStatus::PENDING, std::nullopt);
        }
        notEmpty_.notify_one();

        return task.processingId;
    }

    std::optional<domain::QueueTask> dequeue(domain::QueueLane lane, std::chrono::milliseconds timeout) override {
        ensureAvailable();

        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(mutex_);

        for (;;) {
            std::string raw;
            if (!priority_.empty()) {
                raw = priority_.begin()->payload;
                priority_.erase(priority_.begin());
            } else if (lane == domain::QueueLane::NORMAL && !normal_.empty()) {
                raw = normal_.front();
                normal_.pop_front();
            } else {
                if (lane == domain::QueueLane::PRIORITY) {
                    return std::nullopt;
                }
                if (notEmpty_.wait_until(lock, deadline) == std::cv_status::timeout
                    && priority_.empty() && normal_.empty()) {
                    return std::nullopt;
                }
                if (!available_) {
                    throw domain::QueueException("Queue backend unavailable");
                }
                continue;
            }

            auto decoded = domain::TaskEnvelope::decode(raw);
            if (decoded.isOk()) {
                return decoded.value();
            }
            rejectEnvelope(decoded.error());
        }
    }

    void setStatus(
        const std::string& processingId,
        domain::OrderStatus status,
        const std::optional<nlohmann::json>& result = std::nullopt) override
    {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(mutex_);
        writeStatus(processingId, status, result);
    }

    std::optional<domain::TaskStatus> getStatus(const std::string& processingId) override {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = statuses_.find(processingId);
        if (it == statuses_.end()) {
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= it->second.expiresAt) {
            statuses_.erase(it);
            return std::nullopt;
        }
        return it->second.status;
    }

    domain::QueueDepth queueDepth() override {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(mutex_);
        return {normal_.size(), priority_.size()};
    }

    domain::QueueHealth health() override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::QueueHealth h;
        h.normalQueueDepth = normal_.size();
        h.priorityQueueDepth = priority_.size();
        h.backendConnected = available_;
        return h;
    }

    void clear() override {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = normal_.size() + priority_.size();
        normal_.clear();
        priority_.clear();
        std::cout << "[InMemoryWorkQueue] Cleared " << dropped << " tasks" << std::endl;
    }

    // ============================================
    // Для тестов
    // ============================================

    /**
     * @brief Положить в полосу произвольную строку в обход кодека
     */
    void pushRaw(domain::QueueLane lane, const std::string& payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (lane == domain::QueueLane::PRIORITY) {
                priority_.insert({1, domain::Timestamp::now().toEpochMillis(), sequence_++, payload});
            } else {
                normal_.push_back(payload);
            }
        }
        notEmpty_.notify_one();
    }

    /**
     * @brief Сколько статусов хранится, включая ещё не вычищенные протухшие
     */
    size_t storedStatusCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_.size();
    }

    /**
     * @brief Имитировать отказ бэкенда: все операции бросают QueueException
     */
    void setAvailable(bool available) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            available_ = available;
        }
        notEmpty_.notify_all();
    }

private:
    struct PriorityEntry {
        int priority;
        int64_t queuedAtMillis;
        uint64_t sequence;
        std::string payload;

        bool operator<(const PriorityEntry& other) const {
            return std::tie(priority, queuedAtMillis, sequence)
                 < std::tie(other.priority, other.queuedAtMillis, other.sequence);
        }
    };

    struct StoredStatus {
        domain::TaskStatus status;
        std::chrono::steady_clock::time_point expiresAt;
    };

    std::shared_ptr<settings::IQueueSettings> settings_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::deque<std::string> normal_;
    std::set<PriorityEntry> priority_;
    std::map<std::string, StoredStatus> statuses_;
    uint64_t sequence_ = 0;
    std::atomic<bool> available_;

    void ensureAvailable() const {
        if (!available_) {
            throw domain::QueueException("Queue backend unavailable");
        }
    }

    void writeStatus(const std::string& processingId, domain::OrderStatus status,
                     const std::optional<nlohmann::json>& result) {
        purgeExpiredStatuses();
        statuses_[processingId] = {
            domain::TaskStatus(processingId, status, result),
            std::chrono::steady_clock::now() + settings_->getStatusTtl()
        };
    }

    void purgeExpiredStatuses() {
        auto now = std::chrono::steady_clock::now();
        for (auto it = statuses_.begin(); it != statuses_.end();) {
            if (now >= it->second.expiresAt) {
                it = statuses_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void rejectEnvelope(const domain::EnvelopeError& error) {
        std::cerr << "[InMemoryWorkQueue] Rejected task envelope: " << error.reason << std::endl;
        if (error.processingId) {
            writeStatus(*error.processingId, domain::OrderStatus::FAILED,
                        nlohmann::json{{"error", error.reason}});
        }
    }
};

} // namespace bullion::adapters::secondary
