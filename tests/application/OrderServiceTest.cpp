/**
 * @file OrderServiceTest.cpp
 * @brief Unit tests for OrderService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/OrderService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/persistence/InMemoryLedger.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/queue/InMemoryWorkQueue.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "domain/exceptions/QueueException.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/FakePriceOracle.hpp"
#include "../mocks/MockPorts.hpp"
#include "../mocks/TestSettings.hpp"
#include <functional>

using namespace bullion;
using namespace bullion::application;
using namespace bullion::adapters::secondary;
using namespace bullion::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using domain::Decimal;
using domain::OrderErrorCode;

class OrderServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        oracle_ = std::make_shared<FakePriceOracle>();
        oracle_->setSpot("2000");
        oracle_->setGold96("1990", "2010");

        ledger_ = std::make_shared<InMemoryLedger>();
        ledger_->openAccount(USER, Decimal::fromString("1000"));

        orders_ = std::make_shared<InMemoryOrderRepository>();
        queue_ = std::make_shared<InMemoryWorkQueue>(std::make_shared<TestQueueSettings>());
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());

        service_ = makeService(ledger_, queue_);
    }

    std::shared_ptr<OrderService> makeService(
        std::shared_ptr<ports::output::ILedger> ledger,
        std::shared_ptr<ports::output::IWorkQueue> queue)
    {
        return std::make_shared<OrderService>(
            oracle_, ledger, orders_, queue, std::make_shared<settings::AppSettings>(), metrics_);
    }

    domain::Order placeBuy(const char* amount = "500", int priority = 0) {
        return service_->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString(amount), priority));
    }

    static void expectError(const std::function<void()>& action, OrderErrorCode expected) {
        try {
            action();
            FAIL() << "Expected OrderException " << domain::toString(expected);
        } catch (const domain::OrderException& e) {
            EXPECT_EQ(e.code(), expected) << e.what();
        }
    }

    const std::string USER = "user-1";

    std::shared_ptr<FakePriceOracle> oracle_;
    std::shared_ptr<InMemoryLedger> ledger_;
    std::shared_ptr<InMemoryOrderRepository> orders_;
    std::shared_ptr<InMemoryWorkQueue> queue_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<OrderService> service_;
};

// ============================================================================
// PLACE ORDER
// ============================================================================

TEST_F(OrderServiceTest, PlaceBuy_HoldsAmountAndEnqueues) {
    auto order = placeBuy();

    EXPECT_EQ(order.status, domain::OrderStatus::PROCESSING);
    EXPECT_EQ(order.quotedPricePerUnit, Decimal::fromString("2000"));
    EXPECT_EQ(order.quantity, Decimal::fromString("0.25"));
    EXPECT_EQ(order.pollUrl, "/trading/poll/" + order.id);
    EXPECT_FALSE(order.processingId.empty());

    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("500"));
    EXPECT_EQ(queue_->queueDepth(), (domain::QueueDepth{1, 0}));
    EXPECT_EQ(orders_->findById(order.id)->status, domain::OrderStatus::PROCESSING);
    EXPECT_EQ(metrics_->value("orders_placed_total", {{"side", "buy"}}), 1);

    auto task = queue_->dequeue(domain::QueueLane::NORMAL, std::chrono::milliseconds(10));
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->processingId, order.processingId);
    EXPECT_EQ(task->payload.orderId, order.id);
    EXPECT_EQ(task->payload.requestedAmount, Decimal::fromString("500"));
}

TEST_F(OrderServiceTest, PlaceSell_NoHold) {
    auto order = service_->placeOrder(domain::OrderRequest(
        USER, domain::Symbol::SPOT, domain::OrderSide::SELL, Decimal::fromString("700")));

    EXPECT_EQ(order.side, domain::OrderSide::SELL);
    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("1000"));
    EXPECT_EQ(metrics_->value("orders_placed_total", {{"side", "sell"}}), 1);
}

TEST_F(OrderServiceTest, PlaceGold96Buy_QuotesAsk) {
    auto order = service_->placeOrder(domain::OrderRequest(
        USER, domain::Symbol::GOLD96, domain::OrderSide::BUY, Decimal::fromString("201")));

    EXPECT_EQ(order.quotedPricePerUnit, Decimal::fromString("2010"));
    EXPECT_EQ(order.quantity, Decimal::fromString("0.1"));
}

TEST_F(OrderServiceTest, PlacePriority_GoesToPriorityLane) {
    placeBuy("100", 3);
    EXPECT_EQ(queue_->queueDepth(), (domain::QueueDepth{0, 1}));
}

TEST_F(OrderServiceTest, PlaceOrder_NoPrice_PriceUnavailableWithoutSideEffects) {
    oracle_->remove(domain::Symbol::SPOT);

    expectError([this]() { placeBuy(); }, OrderErrorCode::PRICE_UNAVAILABLE);

    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("1000"));
    EXPECT_TRUE(orders_->findByUserId(USER, 50, 0).empty());
    EXPECT_EQ(queue_->queueDepth().total(), 0u);
    EXPECT_EQ(metrics_->value("orders_rejected_total"), 1);
}

TEST_F(OrderServiceTest, PlaceOrder_OracleThrows_PriceUnavailable) {
    oracle_->setFailing(true);
    expectError([this]() { placeBuy(); }, OrderErrorCode::PRICE_UNAVAILABLE);
}

TEST_F(OrderServiceTest, PlaceBuy_InsufficientFunds_NoOrder) {
    expectError([this]() { placeBuy("1000.01"); }, OrderErrorCode::INSUFFICIENT_FUNDS);

    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("1000"));
    EXPECT_TRUE(orders_->findByUserId(USER, 50, 0).empty());
}

TEST_F(OrderServiceTest, PlaceBuy_UnknownAccount_NotFound) {
    expectError([this]() {
        service_->placeOrder(domain::OrderRequest(
            "stranger", domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("10")));
    }, OrderErrorCode::NOT_FOUND);
}

TEST_F(OrderServiceTest, PlaceOrder_InvalidAmount_ValidationError) {
    expectError([this]() { placeBuy("0"); }, OrderErrorCode::VALIDATION_ERROR);
    expectError([this]() { placeBuy("-5"); }, OrderErrorCode::VALIDATION_ERROR);
    expectError([this]() { placeBuy("10.555"); }, OrderErrorCode::VALIDATION_ERROR);
    expectError([this]() {
        service_->placeOrder(domain::OrderRequest(
            "", domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("10")));
    }, OrderErrorCode::VALIDATION_ERROR);
}

TEST_F(OrderServiceTest, PlaceBuy_QueueDown_OrderFailedAndHoldRefunded) {
    queue_->setAvailable(false);

    expectError([this]() { placeBuy(); }, OrderErrorCode::QUEUE_UNAVAILABLE);

    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("1000"));
    auto history = orders_->findByUserId(USER, 50, 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, domain::OrderStatus::FAILED);
    EXPECT_EQ(history[0].errorMessage.rfind("Failed to enqueue task", 0), 0u);
    EXPECT_TRUE(history[0].holdReleased);
    EXPECT_EQ(metrics_->value("orders_rejected_total"), 1);
}

TEST_F(OrderServiceTest, PlaceBuy_QueueDownAndRefundFails_RecordsSecondaryError) {
    auto ledger = std::make_shared<MockLedger>();
    auto queue = std::make_shared<MockWorkQueue>();
    auto service = makeService(ledger, queue);

    EXPECT_CALL(*ledger, getBalance(USER)).WillOnce(Return(Decimal::fromString("1000")));
    EXPECT_CALL(*ledger, adjust(USER, Decimal::fromString("-500"))).WillOnce(Return(true));
    EXPECT_CALL(*ledger, adjust(USER, Decimal::fromString("500")))
        .WillOnce(Throw(domain::LedgerException("connection reset")));
    EXPECT_CALL(*queue, enqueue(_)).WillOnce(Throw(domain::QueueException("queue down")));

    expectError([&]() {
        service->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("500")));
    }, OrderErrorCode::QUEUE_UNAVAILABLE);

    auto history = orders_->findByUserId(USER, 50, 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, domain::OrderStatus::FAILED);
    EXPECT_EQ(history[0].errorMessage,
              "Failed to enqueue task: queue down; refund failed: connection reset");
    EXPECT_FALSE(history[0].holdReleased);
}

TEST_F(OrderServiceTest, PlaceBuy_DebitRejected_OrderFailed) {
    auto ledger = std::make_shared<MockLedger>();
    auto queue = std::make_shared<MockWorkQueue>();
    auto service = makeService(ledger, queue);

    // Баланс потрачен между проверкой и списанием
    EXPECT_CALL(*ledger, getBalance(USER)).WillOnce(Return(Decimal::fromString("1000")));
    EXPECT_CALL(*ledger, adjust(USER, _)).WillOnce(Return(false));
    EXPECT_CALL(*queue, enqueue(_)).Times(0);

    expectError([&]() {
        service->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("500")));
    }, OrderErrorCode::INSUFFICIENT_FUNDS);

    auto history = orders_->findByUserId(USER, 50, 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, domain::OrderStatus::FAILED);
    EXPECT_EQ(history[0].errorMessage, "Failed to update user balance");
}

TEST_F(OrderServiceTest, PlaceBuy_LedgerDown_LedgerUnavailable) {
    auto ledger = std::make_shared<MockLedger>();
    auto queue = std::make_shared<MockWorkQueue>();
    auto service = makeService(ledger, queue);

    EXPECT_CALL(*ledger, getBalance(USER)).WillOnce(Return(Decimal::fromString("1000")));
    EXPECT_CALL(*ledger, adjust(USER, _)).WillOnce(Throw(domain::LedgerException("connection reset")));
    EXPECT_CALL(*queue, enqueue(_)).Times(0);

    expectError([&]() {
        service->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("500")));
    }, OrderErrorCode::LEDGER_UNAVAILABLE);

    auto history = orders_->findByUserId(USER, 50, 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, domain::OrderStatus::FAILED);
    EXPECT_EQ(history[0].errorMessage, "Failed to debit balance: connection reset");
}

TEST_F(OrderServiceTest, BalanceCalls_LedgerDown_LedgerUnavailable) {
    auto ledger = std::make_shared<MockLedger>();
    auto service = makeService(ledger, queue_);

    EXPECT_CALL(*ledger, getBalance(USER)).WillRepeatedly(Throw(domain::LedgerException("timeout")));
    EXPECT_CALL(*ledger, adjust(USER, _)).WillOnce(Throw(domain::LedgerException("timeout")));

    expectError([&]() { service->getBalance(USER); }, OrderErrorCode::LEDGER_UNAVAILABLE);
    expectError([&]() { service->deposit(USER, Decimal::fromString("10")); }, OrderErrorCode::LEDGER_UNAVAILABLE);
    expectError([&]() {
        service->placeOrder(domain::OrderRequest(
            USER, domain::Symbol::SPOT, domain::OrderSide::BUY, Decimal::fromString("10")));
    }, OrderErrorCode::LEDGER_UNAVAILABLE);
    EXPECT_TRUE(orders_->findByUserId(USER, 50, 0).empty());
}

// ============================================================================
// CANCEL
// ============================================================================

TEST_F(OrderServiceTest, Cancel_NonTerminal_MarksFailed) {
    auto order = placeBuy();

    service_->cancel(order.id, USER);

    auto stored = orders_->findById(order.id);
    EXPECT_EQ(stored->status, domain::OrderStatus::FAILED);
    EXPECT_EQ(stored->errorMessage, "cancelled by user");
    EXPECT_EQ(metrics_->value("orders_cancelled_total"), 1);
    // Удержание вернёт воркер, когда дойдёт до задачи
    EXPECT_EQ(*ledger_->getBalance(USER), Decimal::fromString("500"));
}

TEST_F(OrderServiceTest, Cancel_Guards) {
    auto order = placeBuy();

    expectError([&]() { service_->cancel("ord-missing", USER); }, OrderErrorCode::NOT_FOUND);
    expectError([&]() { service_->cancel(order.id, "user-2"); }, OrderErrorCode::FORBIDDEN);

    service_->cancel(order.id, USER);
    expectError([&]() { service_->cancel(order.id, USER); }, OrderErrorCode::INVALID_STATE);
}

// ============================================================================
// POLL STATUS
// ============================================================================

TEST_F(OrderServiceTest, Poll_NewOrder_Processing) {
    auto order = placeBuy();

    auto poll = service_->pollStatus(order.id, USER);
    EXPECT_EQ(poll.status, domain::OrderStatus::PROCESSING);
    EXPECT_EQ(poll.message, "processing");
    EXPECT_FALSE(poll.data.has_value());
    EXPECT_FALSE(poll.completedAt.has_value());
}

TEST_F(OrderServiceTest, Poll_LiveCompleted_OverridesStoredProcessing) {
    auto order = placeBuy();
    nlohmann::json result = {{"executed_amount", "500.00"}};
    queue_->setStatus(order.processingId, domain::OrderStatus::COMPLETED, result);

    auto poll = service_->pollStatus(order.id, USER);
    EXPECT_EQ(poll.status, domain::OrderStatus::COMPLETED);
    EXPECT_EQ(poll.message, "completed");
    ASSERT_TRUE(poll.data.has_value());
    EXPECT_EQ(*poll.data, result);
    EXPECT_TRUE(poll.completedAt.has_value());
}

TEST_F(OrderServiceTest, Poll_LiveFailed_ReportsReason) {
    auto order = placeBuy();
    queue_->setStatus(order.processingId, domain::OrderStatus::FAILED, nlohmann::json{{"error", "boom"}});

    auto poll = service_->pollStatus(order.id, USER);
    EXPECT_EQ(poll.status, domain::OrderStatus::FAILED);
    EXPECT_EQ(poll.message, "failed: boom");
}

TEST_F(OrderServiceTest, Poll_TerminalRowWinsOverLiveStatus) {
    auto order = placeBuy();
    service_->cancel(order.id, USER);
    queue_->setStatus(order.processingId, domain::OrderStatus::COMPLETED, nlohmann::json::object());

    auto poll = service_->pollStatus(order.id, USER);
    EXPECT_EQ(poll.status, domain::OrderStatus::FAILED);
    EXPECT_EQ(poll.message, "failed: cancelled by user");
}

TEST_F(OrderServiceTest, Poll_QueueDown_FallsBackToStoredStatus) {
    auto order = placeBuy();
    queue_->setAvailable(false);

    auto poll = service_->pollStatus(order.id, USER);
    EXPECT_EQ(poll.status, domain::OrderStatus::PROCESSING);
}

TEST_F(OrderServiceTest, Poll_OtherUser_Forbidden) {
    auto order = placeBuy();
    expectError([&]() { service_->pollStatus(order.id, "user-2"); }, OrderErrorCode::FORBIDDEN);
}

// ============================================================================
// HISTORY / BALANCE / HEALTH
// ============================================================================

TEST_F(OrderServiceTest, GetHistory_NewestFirst) {
    auto first = placeBuy("100");
    auto second = placeBuy("200");

    auto history = service_->getHistory(USER, 50, 0);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, second.id);
    EXPECT_EQ(history[1].id, first.id);

    EXPECT_EQ(service_->getHistory(USER, 1, 0).size(), 1u);
    expectError([&]() { service_->getHistory(USER, 0, 0); }, OrderErrorCode::VALIDATION_ERROR);
}

TEST_F(OrderServiceTest, GetOrder_ReturnsOwnedOrder) {
    auto order = placeBuy();
    EXPECT_EQ(service_->getOrder(order.id, USER).id, order.id);
    expectError([&]() { service_->getOrder(order.id, "user-2"); }, OrderErrorCode::FORBIDDEN);
}

TEST_F(OrderServiceTest, Deposit_IncreasesBalance) {
    EXPECT_EQ(service_->deposit(USER, Decimal::fromString("250.50")), Decimal::fromString("1250.50"));
    EXPECT_EQ(service_->getBalance(USER), Decimal::fromString("1250.50"));

    expectError([&]() { service_->deposit("stranger", Decimal::fromString("1")); }, OrderErrorCode::NOT_FOUND);
    expectError([&]() { service_->deposit(USER, Decimal::fromString("0")); }, OrderErrorCode::VALIDATION_ERROR);
    expectError([&]() { service_->getBalance("stranger"); }, OrderErrorCode::NOT_FOUND);
}

TEST_F(OrderServiceTest, GetQueueHealth) {
    placeBuy("100");
    placeBuy("100", 1);

    auto health = service_->getQueueHealth();
    EXPECT_EQ(health.normalQueueDepth, 1u);
    EXPECT_EQ(health.priorityQueueDepth, 1u);
    EXPECT_TRUE(health.backendConnected);
}
