// include/application/ExecutionWorker.hpp
#pragma once

#include "application/SettlementCalculator.hpp"
#include "domain/Order.hpp"
#include "domain/QueueTask.hpp"
#include "domain/Settlement.hpp"
#include "domain/enums/QueueLane.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILedger.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IWorkQueue.hpp"
#include "settings/IWorkerSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace bullion::application {

/**
 * @brief Обработчик задачи, зарегистрированный на полосу очереди
 */
using TaskHandler = std::function<void(const domain::QueueTask&)>;

/**
 * @brief Состояние воркера для health-отчёта
 *
 * processedCount - все обработанные задачи, failedCount - те из них,
 * что закончились ошибкой.
 */
struct WorkerStatus {
    bool running = false;
    uint64_t processedCount = 0;
    uint64_t failedCount = 0;
};

/**
 * @brief Фоновый исполнитель ордеров
 *
 * Цикл на отдельном потоке:
 * 1. задача из приоритетной полосы
 * 2. задача из обычной полосы (с ожиданием до dequeueTimeout)
 * 3. если работы не было, пауза idleSleep
 *
 * Исключение в цикле логируется, после него пауза errorBackoff.
 * Цикл завершается только по stop().
 *
 * processTask() переоценивает ордер по текущей цене и сверяет баланс.
 * Ошибки исполнения возвращаются как SettlementError, компенсация
 * выбирается по виду ошибки.
 */
class ExecutionWorker {
public:
    ExecutionWorker(
        std::shared_ptr<ports::output::IWorkQueue> queue,
        std::shared_ptr<ports::output::IOrderRepository> orders,
        std::shared_ptr<ports::output::ILedger> ledger,
        std::shared_ptr<ports::output::IPriceOracle> priceOracle,
        std::shared_ptr<settings::IWorkerSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : queue_(std::move(queue))
      , orders_(std::move(orders))
      , ledger_(std::move(ledger))
      , priceOracle_(std::move(priceOracle))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
      , calculator_(settings_->getSettlementPolicy())
      , running_(false)
      , processedCount_(0)
      , failedCount_(0)
    {
        auto process = [this](const domain::QueueTask& task) { processTask(task); };
        handlers_[domain::QueueLane::PRIORITY] = process;
        handlers_[domain::QueueLane::NORMAL] = process;

        std::cout << "[ExecutionWorker] Created (policy="
                  << domain::toString(calculator_.policy()) << ")" << std::endl;
    }

    ~ExecutionWorker() {
        stop();
    }

    ExecutionWorker(const ExecutionWorker&) = delete;
    ExecutionWorker& operator=(const ExecutionWorker&) = delete;

    /**
     * @brief Заменить обработчик полосы (до start())
     */
    void registerHandler(domain::QueueLane lane, TaskHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[lane] = std::move(handler);
    }

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() { loop(); });
        std::cout << "[ExecutionWorker] Started" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[ExecutionWorker] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    WorkerStatus status() const {
        WorkerStatus s;
        s.running = running_;
        s.processedCount = processedCount_;
        s.failedCount = failedCount_;
        return s;
    }

    /**
     * @brief Одна итерация цикла: приоритетная полоса, затем обычная
     *
     * @return Сколько задач обработано (0, 1 или 2)
     * @throws domain::QueueException если очередь недоступна
     */
    int runOnce() {
        int handled = 0;
        auto timeout = settings_->getDequeueTimeout();

        if (auto task = queue_->dequeue(domain::QueueLane::PRIORITY, timeout)) {
            dispatch(*task);
            ++handled;
        }
        if (auto task = queue_->dequeue(domain::QueueLane::NORMAL, timeout)) {
            dispatch(*task);
            ++handled;
        }
        return handled;
    }

    /**
     * @brief Исполнить задачу
     *
     * Никогда не бросает: любой исход записывается в OrderStore и WorkQueue
     * (ошибки самих записей только логируются).
     */
    domain::SettlementResult processTask(const domain::QueueTask& task) {
        std::cout << "[ExecutionWorker] Processing task " << task.processingId
                  << " for order " << task.payload.orderId << std::endl;

        std::optional<domain::Order> order;
        auto result = settle(task, order);

        ++processedCount_;
        if (result.isOk()) {
            recordSuccess(task, *order, result.value());
        } else {
            ++failedCount_;
            compensate(task, order, result.error());
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IWorkQueue> queue_;
    std::shared_ptr<ports::output::IOrderRepository> orders_;
    std::shared_ptr<ports::output::ILedger> ledger_;
    std::shared_ptr<ports::output::IPriceOracle> priceOracle_;
    std::shared_ptr<settings::IWorkerSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    SettlementCalculator calculator_;

    std::map<domain::QueueLane, TaskHandler> handlers_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> processedCount_;
    std::atomic<uint64_t> failedCount_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;

    void loop() {
        while (running_) {
            try {
                if (runOnce() == 0) {
                    pause(settings_->getIdleSleep());
                }
            } catch (const std::exception& e) {
                std::cerr << "[ExecutionWorker] Loop error: " << e.what() << std::endl;
                pause(settings_->getErrorBackoff());
            }
        }
    }

    void pause(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        wakeup_.wait_for(lock, duration, [this]() { return !running_; });
    }

    void dispatch(const domain::QueueTask& task) {
        TaskHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(task.lane());
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }

        if (!handler) {
            std::cerr << "[ExecutionWorker] No handler for lane " << domain::toString(task.lane())
                      << ", task " << task.processingId << " dropped" << std::endl;
            return;
        }
        handler(task);
    }

    // ============================================
    // ИСПОЛНЕНИЕ
    // ============================================

    domain::SettlementResult settle(const domain::QueueTask& task, std::optional<domain::Order>& order) {
        using R = domain::SettlementResult;
        using Kind = domain::SettlementErrorKind;
        const auto& request = task.payload;

        try {
            order = orders_->findById(request.orderId);
        } catch (const std::exception& e) {
            return R::failure({Kind::ORDER_NOT_FOUND, std::string("Failed to load order: ") + e.what()});
        }
        if (!order) {
            return R::failure({Kind::ORDER_NOT_FOUND, "Order " + request.orderId + " not found"});
        }
        if (order->processingId != task.processingId) {
            return R::failure({Kind::INVALID_PAYLOAD,
                "Task " + task.processingId + " does not belong to order " + order->id});
        }
        if (order->status == domain::OrderStatus::COMPLETED) {
            return R::failure({Kind::INVALID_PAYLOAD, "Order " + order->id + " is already settled"});
        }
        if (order->status == domain::OrderStatus::FAILED) {
            if (order->holdReleased) {
                return R::failure({Kind::INVALID_PAYLOAD, "Order " + order->id + " already failed and released its hold"});
            }
            return R::failure({Kind::ORDER_CANCELLED, order->errorMessage});
        }

        setTaskStatus(task.processingId, domain::OrderStatus::PROCESSING, std::nullopt);
        if (order->status == domain::OrderStatus::PENDING) {
            order->markProcessing();
        }

        // 1. Текущая цена (не котировка на момент создания)
        std::optional<domain::PriceSnapshot> snapshot;
        try {
            snapshot = priceOracle_->getCurrentPrice(request.symbol);
        } catch (const std::exception& e) {
            return R::failure({Kind::PRICE_UNAVAILABLE, std::string("Price lookup failed: ") + e.what()});
        }
        auto price = snapshot ? snapshot->priceFor(request.side) : std::nullopt;
        if (!price || !price->isPositive()) {
            return R::failure({Kind::PRICE_UNAVAILABLE,
                "Current price not available for " + domain::toString(request.symbol)});
        }

        // 2. Пересчёт количества и суммы
        auto plan = calculator_.plan(request, *price);

        // 3. Сверка баланса
        if (!plan.balanceDelta.isZero()) {
            bool adjusted = false;
            try {
                adjusted = ledger_->adjust(request.userId, plan.balanceDelta);
            } catch (const std::exception& e) {
                return R::failure({Kind::LEDGER_UNAVAILABLE, std::string("Ledger error: ") + e.what()});
            }
            if (!adjusted) {
                if (plan.balanceDelta.isNegative()) {
                    return R::failure({Kind::INSUFFICIENT_FUNDS_ON_SETTLEMENT,
                        "Insufficient funds for additional charge of " + plan.balanceDelta.abs().toString()});
                }
                return R::failure({Kind::LEDGER_UNAVAILABLE, "Account " + request.userId + " not found"});
            }
        }

        domain::SettlementOutcome outcome;
        outcome.orderId = order->id;
        outcome.originalPricePerUnit = request.quotedPricePerUnit;
        outcome.plan = plan;
        outcome.executedAt = domain::Timestamp::now();
        return R::success(outcome);
    }

    void recordSuccess(const domain::QueueTask& task, domain::Order& order, const domain::SettlementOutcome& outcome) {
        const auto& plan = outcome.plan;
        order.complete(plan.executedPricePerUnit, plan.executedQuantity, plan.executedAmount);

        try {
            orders_->update(order);
        } catch (const std::exception& e) {
            std::cerr << "[ExecutionWorker] Failed to update order " << order.id << ": " << e.what() << std::endl;
        }
        setTaskStatus(task.processingId, domain::OrderStatus::COMPLETED, outcome.toJson());

        metrics_->increment("orders_completed_total");
        metrics_->increment("settlement_adjustments_total", {{"type", domain::toString(plan.adjustment)}});

        std::cout << "[ExecutionWorker] Order " << order.id << " completed: "
                  << plan.executedQuantity << " @ " << plan.executedPricePerUnit
                  << " = " << plan.executedAmount
                  << " (" << domain::toString(plan.adjustment) << " " << plan.balanceDelta.abs() << ")"
                  << std::endl;
    }

    // ============================================
    // КОМПЕНСАЦИЯ
    // ============================================

    void compensate(const domain::QueueTask& task, std::optional<domain::Order>& order, const domain::SettlementError& error) {
        using Kind = domain::SettlementErrorKind;

        std::cerr << "[ExecutionWorker] Task " << task.processingId << " failed ("
                  << domain::toString(error.kind) << "): " << error.message << std::endl;

        switch (error.kind) {
            case Kind::INVALID_PAYLOAD:
                // Чужая или повторная задача: ордер и баланс не трогаем
                return;

            case Kind::ORDER_NOT_FOUND:
                // Без строки ордера нет и удержания: баланс не трогаем
                setTaskStatus(task.processingId, domain::OrderStatus::FAILED, nlohmann::json{{"error", error.message}});
                metrics_->increment("orders_failed_total");
                return;

            case Kind::ORDER_CANCELLED: {
                std::string reason = error.message;
                auto refundError = refundHold(task.payload);
                if (refundError) {
                    reason += "; refund failed: " + *refundError;
                    order->errorMessage = reason;
                }
                order->holdReleased = !refundError;
                updateOrder(*order);

                setTaskStatus(task.processingId, domain::OrderStatus::FAILED, nlohmann::json{{"error", reason}});
                metrics_->increment("orders_failed_total");
                return;
            }

            case Kind::PRICE_UNAVAILABLE:
            case Kind::INSUFFICIENT_FUNDS_ON_SETTLEMENT:
            case Kind::LEDGER_UNAVAILABLE:
            default: {
                std::string reason = error.message;
                if (order && !order->isTerminal()) {
                    auto refundError = refundHold(task.payload);
                    if (refundError) {
                        reason += "; refund failed: " + *refundError;
                    }
                    order->fail(reason);
                    order->holdReleased = !refundError;
                    updateOrder(*order);
                }
                setTaskStatus(task.processingId, domain::OrderStatus::FAILED, nlohmann::json{{"error", reason}});
                metrics_->increment("orders_failed_total");
                return;
            }
        }
    }

    /**
     * @brief Вернуть удержанную при создании сумму (только покупка)
     * @return Текст ошибки, если возврат не удался
     */
    std::optional<std::string> refundHold(const domain::OrderExecutionRequest& request) {
        if (request.side != domain::OrderSide::BUY) {
            return std::nullopt;
        }

        try {
            if (!ledger_->adjust(request.userId, request.requestedAmount)) {
                return "account " + request.userId + " not found";
            }
            std::cout << "[ExecutionWorker] Refunded " << request.requestedAmount
                      << " to " << request.userId << std::endl;
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[ExecutionWorker] Refund error for " << request.userId << ": " << e.what() << std::endl;
            return std::string(e.what());
        }
    }

    void updateOrder(const domain::Order& order) {
        try {
            orders_->update(order);
        } catch (const std::exception& e) {
            std::cerr << "[ExecutionWorker] Failed to update order " << order.id << ": " << e.what() << std::endl;
        }
    }

    void setTaskStatus(const std::string& processingId, domain::OrderStatus status,
                       const std::optional<nlohmann::json>& result) {
        try {
            queue_->setStatus(processingId, status, result);
        } catch (const std::exception& e) {
            std::cerr << "[ExecutionWorker] Failed to set status of task " << processingId
                      << ": " << e.what() << std::endl;
        }
    }
};

} // namespace bullion::application
