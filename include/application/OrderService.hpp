// include/application/OrderService.hpp
#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILedger.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IWorkQueue.hpp"
#include "domain/QueueTask.hpp"
#include "domain/exceptions/OrderException.hpp"
#include "settings/AppSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bullion::application {

/**
 * @brief Сервис управления ордерами
 *
 * Единственный, кто создаёт ордера. Для покупки удерживает сумму сразу
 * при создании и возвращает её, если задачу не удалось поставить в очередь.
 * Исполнение происходит асинхронно в ExecutionWorker, клиент узнаёт
 * результат только опросом pollStatus().
 */
class OrderService : public ports::input::IOrderService {
public:
    OrderService(
        std::shared_ptr<ports::output::IPriceOracle> priceOracle,
        std::shared_ptr<ports::output::ILedger> ledger,
        std::shared_ptr<ports::output::IOrderRepository> orders,
        std::shared_ptr<ports::output::IWorkQueue> queue,
        std::shared_ptr<settings::AppSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : priceOracle_(std::move(priceOracle))
      , ledger_(std::move(ledger))
      , orders_(std::move(orders))
      , queue_(std::move(queue))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[OrderService] Created" << std::endl;
    }

    /**
     * @brief Создать ордер
     *
     * 1. котировка (PriceUnavailable, если цены нет)
     * 2. проверка суммы и баланса для покупки
     * 3. запись pending, затем processing
     * 4. удержание суммы для покупки
     * 5. постановка задачи в очередь (при ошибке ордер failed, удержание возвращается)
     */
    domain::Order placeOrder(const domain::OrderRequest& request) override {
        validateAmount(request.amount);
        if (request.userId.empty()) {
            reject(domain::OrderErrorCode::VALIDATION_ERROR, "User id is required");
        }

        auto quotedPrice = quote(request.symbol, request.side);

        if (request.side == domain::OrderSide::BUY) {
            auto balance = balanceOf(request.userId);
            if (!balance) {
                reject(domain::OrderErrorCode::NOT_FOUND, "Account not found: " + request.userId);
            }
            if (*balance < request.amount) {
                reject(domain::OrderErrorCode::INSUFFICIENT_FUNDS,
                    "Insufficient balance: " + balance->toString() + " < " + request.amount.toString());
            }
        }

        domain::Order order(utils::UuidGenerator::orderId(), request.userId,
                            request.symbol, request.side, request.amount, quotedPrice);
        order.processingId = utils::UuidGenerator::processingId();
        order.pollUrl = settings_->getPollUrlPrefix() + order.id;
        order.priority = request.priority;
        orders_->save(order);

        order.markProcessing();
        order.quantity = request.amount / quotedPrice;
        orders_->update(order);

        if (request.side == domain::OrderSide::BUY) {
            hold(order);
        }

        enqueue(order);

        metrics_->increment("orders_placed_total", {{"side", domain::toString(order.side)}});
        std::cout << "[OrderService] Order " << order.id << " placed: "
                  << domain::toString(order.side) << " " << order.requestedAmount
                  << " THB of " << domain::toString(order.symbol)
                  << " @ " << order.quotedPricePerUnit << std::endl;
        return order;
    }

    void cancel(const std::string& orderId, const std::string& userId) override {
        auto order = loadOwned(orderId, userId);
        if (order.isTerminal()) {
            throw domain::OrderException(domain::OrderErrorCode::INVALID_STATE,
                "Cannot cancel order in status " + domain::toString(order.status));
        }

        order.fail(CANCEL_REASON);
        orders_->update(order);

        metrics_->increment("orders_cancelled_total");
        std::cout << "[OrderService] Order " << orderId << " cancelled by " << userId << std::endl;
    }

    /**
     * @brief Статус ордера для клиента
     *
     * Живой статус задачи из очереди перекрывает нетерминальный статус строки,
     * если он не отстаёт от него. Терминальный статус строки всегда побеждает.
     * Строка ордера при опросе не меняется.
     */
    domain::PollingResult pollStatus(const std::string& orderId, const std::string& userId) override {
        auto order = loadOwned(orderId, userId);

        std::optional<domain::TaskStatus> live;
        if (!order.isTerminal() && !order.processingId.empty()) {
            try {
                auto taskStatus = queue_->getStatus(order.processingId);
                if (taskStatus && domain::lifecycleRank(taskStatus->status) >= domain::lifecycleRank(order.status)) {
                    live = taskStatus;
                }
            } catch (const std::exception& e) {
                std::cerr << "[OrderService] Task status unavailable for " << orderId
                          << ", using stored status: " << e.what() << std::endl;
            }
        }

        domain::PollingResult result;
        result.status = live ? live->status : order.status;

        switch (result.status) {
            case domain::OrderStatus::COMPLETED:
                result.message = "completed";
                result.data = live ? live->result : std::optional<nlohmann::json>(executionData(order));
                result.completedAt = live ? live->updatedAt : order.updatedAt;
                break;
            case domain::OrderStatus::FAILED:
                result.message = "failed: " + (live ? liveError(*live) : order.errorMessage);
                result.completedAt = live ? live->updatedAt : order.updatedAt;
                break;
            default:
                result.message = domain::toString(result.status);
                break;
        }
        return result;
    }

    domain::Order getOrder(const std::string& orderId, const std::string& userId) override {
        return loadOwned(orderId, userId);
    }

    std::vector<domain::Order> getHistory(const std::string& userId, size_t limit, size_t offset) override {
        if (limit == 0) {
            reject(domain::OrderErrorCode::VALIDATION_ERROR, "History limit must be positive");
        }
        return orders_->findByUserId(userId, limit, offset);
    }

    domain::Decimal getBalance(const std::string& userId) override {
        auto balance = balanceOf(userId);
        if (!balance) {
            throw domain::OrderException(domain::OrderErrorCode::NOT_FOUND, "Account not found: " + userId);
        }
        return *balance;
    }

    domain::Decimal deposit(const std::string& userId, const domain::Decimal& amount) override {
        validateAmount(amount);
        bool credited = false;
        try {
            credited = ledger_->adjust(userId, amount);
        } catch (const std::exception& e) {
            throw domain::OrderException(domain::OrderErrorCode::LEDGER_UNAVAILABLE,
                std::string("Failed to update balance: ") + e.what());
        }
        if (!credited) {
            throw domain::OrderException(domain::OrderErrorCode::NOT_FOUND, "Account not found: " + userId);
        }
        std::cout << "[OrderService] Deposited " << amount << " THB to " << userId << std::endl;
        return getBalance(userId);
    }

    domain::QueueHealth getQueueHealth() override {
        return queue_->health();
    }

private:
    static constexpr const char* CANCEL_REASON = "cancelled by user";

    std::shared_ptr<ports::output::IPriceOracle> priceOracle_;
    std::shared_ptr<ports::output::ILedger> ledger_;
    std::shared_ptr<ports::output::IOrderRepository> orders_;
    std::shared_ptr<ports::output::IWorkQueue> queue_;
    std::shared_ptr<settings::AppSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    [[noreturn]] void reject(domain::OrderErrorCode code, const std::string& message) {
        metrics_->increment("orders_rejected_total");
        std::cout << "[OrderService] REJECTED (" << domain::toString(code) << "): " << message << std::endl;
        throw domain::OrderException(code, message);
    }

    static void validateAmount(const domain::Decimal& amount) {
        if (!amount.isPositive()) {
            throw domain::OrderException(domain::OrderErrorCode::VALIDATION_ERROR,
                "Amount must be positive, got " + amount.toString());
        }
        if (amount.fractionDigits() > domain::CURRENCY_DIGITS) {
            throw domain::OrderException(domain::OrderErrorCode::VALIDATION_ERROR,
                "Amount must have at most 2 decimal places, got " + amount.toString());
        }
    }

    domain::Decimal quote(domain::Symbol symbol, domain::OrderSide side) {
        std::optional<domain::PriceSnapshot> snapshot;
        try {
            snapshot = priceOracle_->getCurrentPrice(symbol);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Price lookup error: " << e.what() << std::endl;
        }

        auto price = snapshot ? snapshot->priceFor(side) : std::nullopt;
        if (!price || !price->isPositive()) {
            reject(domain::OrderErrorCode::PRICE_UNAVAILABLE,
                "Current price not available for " + domain::toString(symbol));
        }
        return *price;
    }

    std::optional<domain::Decimal> balanceOf(const std::string& userId) {
        try {
            return ledger_->getBalance(userId);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Ledger error for " << userId << ": " << e.what() << std::endl;
            throw domain::OrderException(domain::OrderErrorCode::LEDGER_UNAVAILABLE,
                std::string("Balance not available: ") + e.what());
        }
    }

    domain::Order loadOwned(const std::string& orderId, const std::string& userId) {
        auto order = orders_->findById(orderId);
        if (!order) {
            throw domain::OrderException(domain::OrderErrorCode::NOT_FOUND, "Order not found: " + orderId);
        }
        if (order->userId != userId) {
            throw domain::OrderException(domain::OrderErrorCode::FORBIDDEN, "Order " + orderId + " belongs to another user");
        }
        return *order;
    }

    /**
     * @brief Удержать сумму покупки
     *
     * Если баланс успели потратить между проверкой и списанием,
     * ордер помечается failed и выбрасывается InsufficientFunds.
     */
    void hold(domain::Order& order) {
        bool debited = false;
        try {
            debited = ledger_->adjust(order.userId, -order.requestedAmount);
        } catch (const std::exception& e) {
            std::string reason = std::string("Failed to debit balance: ") + e.what();
            order.holdReleased = true;
            failOrder(order, reason);
            reject(domain::OrderErrorCode::LEDGER_UNAVAILABLE, reason);
        }

        if (!debited) {
            order.holdReleased = true;
            failOrder(order, "Failed to update user balance");
            reject(domain::OrderErrorCode::INSUFFICIENT_FUNDS,
                "Insufficient balance to hold " + order.requestedAmount.toString());
        }
    }

    void enqueue(domain::Order& order) {
        domain::QueueTask task;
        task.processingId = order.processingId;
        task.payload = domain::OrderExecutionRequest::fromOrder(order);
        task.priority = order.priority;

        try {
            queue_->enqueue(task);
            return;
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Enqueue failed for " << order.id << ": " << e.what() << std::endl;

            std::string reason = std::string("Failed to enqueue task: ") + e.what();
            order.holdReleased = true;
            if (order.side == domain::OrderSide::BUY) {
                if (auto refundError = refund(order)) {
                    reason += "; refund failed: " + *refundError;
                    order.holdReleased = false;
                }
            }
            failOrder(order, reason);
            metrics_->increment("orders_rejected_total");
            throw domain::OrderException(domain::OrderErrorCode::QUEUE_UNAVAILABLE, reason);
        }
    }

    std::optional<std::string> refund(const domain::Order& order) {
        try {
            if (!ledger_->adjust(order.userId, order.requestedAmount)) {
                return "account " + order.userId + " not found";
            }
            return std::nullopt;
        } catch (const std::exception& e) {
            return std::string(e.what());
        }
    }

    void failOrder(domain::Order& order, const std::string& reason) {
        order.fail(reason);
        try {
            orders_->update(order);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to mark order " << order.id << " failed: " << e.what() << std::endl;
        }
    }

    static nlohmann::json executionData(const domain::Order& order) {
        nlohmann::json data;
        data["transaction_id"] = order.id;
        data["symbol"] = domain::toString(order.symbol);
        data["side"] = domain::toString(order.side);
        data["requested_amount"] = order.requestedAmount.toString();
        data["original_price"] = order.quotedPricePerUnit.toString();
        data["executed_price"] = order.executedPricePerUnit ? order.executedPricePerUnit->toString() : "";
        data["executed_quantity"] = order.executedQuantity.toString();
        data["executed_amount"] = order.executedAmount ? order.executedAmount->toString() : "";
        data["executed_at"] = order.updatedAt.toString();
        data["reference_id"] = "TXN" + order.id;
        data["status"] = "executed";
        return data;
    }

    static std::string liveError(const domain::TaskStatus& status) {
        if (status.result && status.result->contains("error") && (*status.result)["error"].is_string()) {
            return (*status.result)["error"].get<std::string>();
        }
        return "unknown error";
    }
};

} // namespace bullion::application
