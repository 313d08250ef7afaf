/**
 * @file ExecutionWorkerTest.cpp
 * @brief Unit tests for ExecutionWorker: settlement, compensation, loop
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/ExecutionWorker.hpp"
#include "application/OrderService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/persistence/InMemoryLedger.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/queue/InMemoryWorkQueue.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/FakePriceOracle.hpp"
#include "../mocks/MockPorts.hpp"
#include "../mocks/TestSettings.hpp"
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace bullion;
using namespace bullion::application;
using namespace bullion::adapters::secondary;
using namespace bullion::tests;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Throw;
using domain::Decimal;
using domain::SettlementErrorKind;

class ExecutionWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        oracle_ = std::make_shared<FakePriceOracle>();
        oracle_->setSpot("2000");

        ledger_ = std::make_shared<InMemoryLedger>();
        ledger_->openAccount(USER, Decimal::fromString("1000"));

        orders_ = std::make_shared<InMemoryOrderRepository>();
        queue_ = std::make_shared<InMemoryWorkQueue>(std::make_shared<TestQueueSettings>());
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());

        service_ = std::make_shared<OrderService>(
            oracle_, ledger_, orders_, queue_, std::make_shared<settings::AppSettings>(), metrics_);
        worker_ = makeWorker(domain::SettlementPolicy::AMOUNT_PRESERVING);
    }

    void TearDown() override {
        worker_->stop();
    }

    std::shared_ptr<ExecutionWorker> makeWorker(domain::SettlementPolicy policy) {
        return std::make_shared<ExecutionWorker>(
            queue_, orders_, ledger_, oracle_, std::make_shared<TestWorkerSettings>(policy), metrics_);
    }

    domain::Order place(domain::OrderSide side, const char* amount, int priority = 0) {
        return service_->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, side, Decimal::fromString(amount), priority));
    }

    domain::QueueTask takeTask() {
        auto task = queue_->dequeue(domain::QueueLane::PRIORITY, std::chrono::milliseconds(0));
        if (!task) {
            task = queue_->dequeue(domain::QueueLane::NORMAL, std::chrono::milliseconds(10));
        }
        EXPECT_TRUE(task.has_value());
        return task ? *task : domain::QueueTask{};
    }

    Decimal balance() {
        return *ledger_->getBalance(USER);
    }

    domain::Order stored(const std::string& orderId) {
        return *orders_->findById(orderId);
    }

    const std::string USER = "user-1";

    std::shared_ptr<FakePriceOracle> oracle_;
    std::shared_ptr<InMemoryLedger> ledger_;
    std::shared_ptr<InMemoryOrderRepository> orders_;
    std::shared_ptr<InMemoryWorkQueue> queue_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<OrderService> service_;
    std::shared_ptr<ExecutionWorker> worker_;
};

// ============================================================================
// SETTLEMENT
// ============================================================================

TEST_F(ExecutionWorkerTest, Buy_UnchangedPrice_CompletesWithoutAdjustment) {
    auto order = place(domain::OrderSide::BUY, "500");

    auto result = worker_->processTask(takeTask());

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("500"));

    auto settled = stored(order.id);
    EXPECT_EQ(settled.status, domain::OrderStatus::COMPLETED);
    EXPECT_EQ(settled.executedQuantity, Decimal::fromString("0.25"));
    EXPECT_EQ(*settled.executedAmount, Decimal::fromString("500"));

    auto taskStatus = queue_->getStatus(order.processingId);
    ASSERT_TRUE(taskStatus.has_value());
    EXPECT_EQ(taskStatus->status, domain::OrderStatus::COMPLETED);
    ASSERT_TRUE(taskStatus->result.has_value());
    EXPECT_EQ((*taskStatus->result)["executed_amount"], "500.00");
    EXPECT_EQ((*taskStatus->result)["adjustment_type"], "none");
}

TEST_F(ExecutionWorkerTest, Buy_LowerPrice_AmountPreserving_BuysMoreGold) {
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->setSpot("1800");

    auto result = worker_->processTask(takeTask());

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("500"));

    auto settled = stored(order.id);
    EXPECT_EQ(settled.executedQuantity, Decimal::fromString("0.27777778"));
    EXPECT_EQ(*settled.executedPricePerUnit, Decimal::fromString("1800"));
    EXPECT_EQ(*settled.executedAmount, Decimal::fromString("500"));
}

TEST_F(ExecutionWorkerTest, Buy_LowerPrice_QuantityPreserving_RefundsDifference) {
    worker_ = makeWorker(domain::SettlementPolicy::QUANTITY_PRESERVING);
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->setSpot("1800");

    auto result = worker_->processTask(takeTask());

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("550"));
    EXPECT_EQ(stored(order.id).executedQuantity, Decimal::fromString("0.25"));
    EXPECT_EQ(*stored(order.id).executedAmount, Decimal::fromString("450"));
}

TEST_F(ExecutionWorkerTest, Buy_HigherPrice_QuantityPreserving_ChargesDifference) {
    worker_ = makeWorker(domain::SettlementPolicy::QUANTITY_PRESERVING);
    place(domain::OrderSide::BUY, "500");
    oracle_->setSpot("2200");

    auto result = worker_->processTask(takeTask());

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("450"));
}

TEST_F(ExecutionWorkerTest, Buy_HigherPrice_InsufficientFunds_FailsAndRefunds) {
    worker_ = makeWorker(domain::SettlementPolicy::QUANTITY_PRESERVING);
    auto order = place(domain::OrderSide::BUY, "1000");
    EXPECT_EQ(balance(), Decimal::fromString("0"));
    oracle_->setSpot("2200");

    auto result = worker_->processTask(takeTask());

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::INSUFFICIENT_FUNDS_ON_SETTLEMENT);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));

    auto failed = stored(order.id);
    EXPECT_EQ(failed.status, domain::OrderStatus::FAILED);
    EXPECT_EQ(failed.errorMessage, "Insufficient funds for additional charge of 100.00");
    EXPECT_EQ(queue_->getStatus(order.processingId)->status, domain::OrderStatus::FAILED);
}

TEST_F(ExecutionWorkerTest, Sell_CreditsExecutedAmount) {
    auto order = place(domain::OrderSide::SELL, "700");

    auto result = worker_->processTask(takeTask());

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("1700"));
    EXPECT_EQ(stored(order.id).executedQuantity, Decimal::fromString("0.35"));
}

// ============================================================================
// COMPENSATION
// ============================================================================

TEST_F(ExecutionWorkerTest, CancelledOrder_RefundsHoldAndFailsTask) {
    auto order = place(domain::OrderSide::BUY, "500");
    service_->cancel(order.id, USER);
    EXPECT_EQ(balance(), Decimal::fromString("500"));

    auto result = worker_->processTask(takeTask());

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::ORDER_CANCELLED);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));

    auto taskStatus = queue_->getStatus(order.processingId);
    ASSERT_TRUE(taskStatus.has_value());
    EXPECT_EQ(taskStatus->status, domain::OrderStatus::FAILED);
    EXPECT_EQ((*taskStatus->result)["error"], "cancelled by user");
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::FAILED);
    EXPECT_TRUE(stored(order.id).holdReleased);
}

TEST_F(ExecutionWorkerTest, CancelledOrder_RedeliveredTask_RefundsOnce) {
    auto order = place(domain::OrderSide::BUY, "500");
    service_->cancel(order.id, USER);
    auto task = takeTask();

    worker_->processTask(task);
    auto second = worker_->processTask(task);

    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error().kind, SettlementErrorKind::INVALID_PAYLOAD);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
}

TEST_F(ExecutionWorkerTest, UnknownOrder_FailsTask) {
    domain::QueueTask task;
    task.processingId = "proc-orphan";
    task.payload.orderId = "ord-missing";
    task.payload.userId = USER;
    task.payload.symbol = domain::Symbol::SPOT;
    task.payload.side = domain::OrderSide::SELL;
    task.payload.requestedAmount = Decimal::fromString("100");
    task.payload.quotedPricePerUnit = Decimal::fromString("2000");

    auto result = worker_->processTask(task);

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::ORDER_NOT_FOUND);
    EXPECT_EQ(result.error().message, "Order ord-missing not found");
    EXPECT_EQ(queue_->getStatus("proc-orphan")->status, domain::OrderStatus::FAILED);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
}

TEST_F(ExecutionWorkerTest, UnknownBuyOrder_LeavesBalanceAlone) {
    domain::QueueTask task;
    task.processingId = "proc-orphan-buy";
    task.payload.orderId = "ord-missing";
    task.payload.userId = USER;
    task.payload.symbol = domain::Symbol::SPOT;
    task.payload.side = domain::OrderSide::BUY;
    task.payload.requestedAmount = Decimal::fromString("700");
    task.payload.quotedPricePerUnit = Decimal::fromString("2000");

    auto result = worker_->processTask(task);

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::ORDER_NOT_FOUND);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));

    auto taskStatus = queue_->getStatus("proc-orphan-buy");
    ASSERT_TRUE(taskStatus.has_value());
    EXPECT_EQ(taskStatus->status, domain::OrderStatus::FAILED);
    EXPECT_EQ((*taskStatus->result)["error"], "Order ord-missing not found");
}

TEST_F(ExecutionWorkerTest, OrderStoreDown_FailsTaskWithoutLedgerChange) {
    auto order = place(domain::OrderSide::BUY, "500");
    auto task = takeTask();

    auto brokenOrders = std::make_shared<MockOrderRepository>();
    auto strictLedger = std::make_shared<MockLedger>();
    EXPECT_CALL(*brokenOrders, findById(order.id))
        .WillOnce(Throw(std::runtime_error("connection refused")));
    EXPECT_CALL(*brokenOrders, update(_)).Times(0);
    EXPECT_CALL(*strictLedger, adjust(_, _)).Times(0);

    ExecutionWorker worker(queue_, brokenOrders, strictLedger, oracle_,
                           std::make_shared<TestWorkerSettings>(), metrics_);
    auto result = worker.processTask(task);

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::ORDER_NOT_FOUND);
    EXPECT_EQ(queue_->getStatus(order.processingId)->status, domain::OrderStatus::FAILED);
}

TEST_F(ExecutionWorkerTest, PriceUnavailable_FailsAndRefunds) {
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->remove(domain::Symbol::SPOT);

    auto result = worker_->processTask(takeTask());

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::PRICE_UNAVAILABLE);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::FAILED);
    EXPECT_THAT(stored(order.id).errorMessage, HasSubstr("Current price not available"));
}

TEST_F(ExecutionWorkerTest, OracleThrows_FailsAndRefunds) {
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->setFailing(true);

    auto result = worker_->processTask(takeTask());

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::PRICE_UNAVAILABLE);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::FAILED);
}

TEST_F(ExecutionWorkerTest, ForeignProcessingId_LeavesOrderAndBalanceAlone) {
    auto order = place(domain::OrderSide::BUY, "500");
    auto task = takeTask();
    task.processingId = "proc-foreign";

    auto result = worker_->processTask(task);

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, SettlementErrorKind::INVALID_PAYLOAD);
    EXPECT_EQ(balance(), Decimal::fromString("500"));
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::PROCESSING);
}

TEST_F(ExecutionWorkerTest, RedeliveredTask_SettlesOnce) {
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->setSpot("1800");
    worker_ = makeWorker(domain::SettlementPolicy::QUANTITY_PRESERVING);
    auto task = takeTask();

    ASSERT_TRUE(worker_->processTask(task).isOk());
    auto second = worker_->processTask(task);

    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error().kind, SettlementErrorKind::INVALID_PAYLOAD);
    EXPECT_EQ(balance(), Decimal::fromString("550"));
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::COMPLETED);
}

TEST_F(ExecutionWorkerTest, RedeliveredFailedTask_RefundsOnce) {
    auto order = place(domain::OrderSide::BUY, "500");
    oracle_->remove(domain::Symbol::SPOT);
    auto task = takeTask();

    auto first = worker_->processTask(task);
    ASSERT_FALSE(first.isOk());
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
    EXPECT_TRUE(stored(order.id).holdReleased);

    auto second = worker_->processTask(task);

    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error().kind, SettlementErrorKind::INVALID_PAYLOAD);
    EXPECT_EQ(balance(), Decimal::fromString("1000"));
    EXPECT_EQ(stored(order.id).status, domain::OrderStatus::FAILED);
}

TEST_F(ExecutionWorkerTest, Poll_AfterCompletion_IsStable) {
    auto order = place(domain::OrderSide::BUY, "500");
    worker_->processTask(takeTask());

    auto first = service_->pollStatus(order.id, USER);
    auto second = service_->pollStatus(order.id, USER);

    EXPECT_EQ(first.status, domain::OrderStatus::COMPLETED);
    EXPECT_EQ(first.message, "completed");
    EXPECT_EQ(first, second);
}

TEST_F(ExecutionWorkerTest, Counters_TrackOutcomes) {
    place(domain::OrderSide::BUY, "100");
    worker_->processTask(takeTask());

    auto cancelled = place(domain::OrderSide::BUY, "100");
    service_->cancel(cancelled.id, USER);
    worker_->processTask(takeTask());

    auto status = worker_->status();
    EXPECT_EQ(status.processedCount, 2u);
    EXPECT_EQ(status.failedCount, 1u);
    EXPECT_EQ(metrics_->value("orders_completed_total"), 1);
    EXPECT_EQ(metrics_->value("orders_failed_total"), 1);
    EXPECT_EQ(metrics_->value("settlement_adjustments_total", {{"type", "none"}}), 1);
}

// ============================================================================
// WORKER LOOP
// ============================================================================

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace

TEST_F(ExecutionWorkerTest, Loop_PriorityLaneFirst) {
    std::mutex mutex;
    std::vector<std::string> seen;
    auto record = [&](const domain::QueueTask& task) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(task.payload.orderId);
    };
    worker_->registerHandler(domain::QueueLane::PRIORITY, record);
    worker_->registerHandler(domain::QueueLane::NORMAL, record);

    auto a = place(domain::OrderSide::BUY, "100");
    auto b = place(domain::OrderSide::BUY, "100", 1);
    auto c = place(domain::OrderSide::BUY, "100");

    worker_->start();
    EXPECT_TRUE(worker_->isRunning());
    bool done = waitFor([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 3;
    });
    worker_->stop();
    ASSERT_TRUE(done);
    EXPECT_FALSE(worker_->isRunning());

    EXPECT_EQ(seen, (std::vector<std::string>{b.id, a.id, c.id}));
}

TEST_F(ExecutionWorkerTest, Loop_SettlesPlacedOrder) {
    worker_->start();

    auto order = place(domain::OrderSide::BUY, "500");
    bool done = waitFor([&]() {
        return service_->pollStatus(order.id, USER).status == domain::OrderStatus::COMPLETED;
    });

    worker_->stop();
    ASSERT_TRUE(done);
    EXPECT_EQ(balance(), Decimal::fromString("500"));
    EXPECT_EQ(queue_->queueDepth().total(), 0u);
}

TEST_F(ExecutionWorkerTest, Loop_SurvivesQueueOutage) {
    queue_->setAvailable(false);
    worker_->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(worker_->isRunning());

    queue_->setAvailable(true);
    auto order = place(domain::OrderSide::BUY, "200");
    bool done = waitFor([&]() {
        return stored(order.id).status == domain::OrderStatus::COMPLETED;
    });

    worker_->stop();
    EXPECT_TRUE(done);
}

TEST_F(ExecutionWorkerTest, StopWithoutStart_IsNoop) {
    worker_->stop();
    EXPECT_FALSE(worker_->status().running);
}
