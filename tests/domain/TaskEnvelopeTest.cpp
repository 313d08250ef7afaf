#include <gtest/gtest.h>
#include "domain/TaskEnvelope.hpp"
#include <nlohmann/json.hpp>

using namespace bullion::domain;
using json = nlohmann::json;

class TaskEnvelopeTest : public ::testing::Test {
protected:
    QueueTask makeTask() {
        Order order("ord-1", "user-1", Symbol::GOLD96, OrderSide::SELL,
                    Decimal::fromString("500"), Decimal::fromString("1990"));
        order.quantity = Decimal::fromString("500") / Decimal::fromString("1990");

        QueueTask task;
        task.processingId = "task-1";
        task.payload = OrderExecutionRequest::fromOrder(order);
        task.priority = 2;
        return task;
    }

    json encoded() {
        return json::parse(TaskEnvelope::encode(makeTask()));
    }
};

TEST_F(TaskEnvelopeTest, Encode_WritesVersionAndDecimalStrings) {
    auto j = encoded();
    EXPECT_EQ(j["version"], OrderExecutionRequest::CURRENT_VERSION);
    EXPECT_EQ(j["processing_id"], "task-1");
    EXPECT_EQ(j["priority"], 2);
    EXPECT_EQ(j["payload"]["symbol"], "gold96");
    EXPECT_EQ(j["payload"]["side"], "sell");
    EXPECT_EQ(j["payload"]["requested_amount"], "500.00");
    EXPECT_EQ(j["payload"]["quoted_price_per_unit"], "1990.00");
}

TEST_F(TaskEnvelopeTest, Decode_RestoresTask) {
    auto original = makeTask();
    auto decoded = TaskEnvelope::decode(TaskEnvelope::encode(original));

    ASSERT_TRUE(decoded.isOk());
    const auto& task = decoded.value();
    EXPECT_EQ(task.processingId, "task-1");
    EXPECT_EQ(task.priority, 2);
    EXPECT_EQ(task.lane(), QueueLane::PRIORITY);
    EXPECT_EQ(task.payload.orderId, "ord-1");
    EXPECT_EQ(task.payload.symbol, Symbol::GOLD96);
    EXPECT_EQ(task.payload.side, OrderSide::SELL);
    EXPECT_EQ(task.payload.quantity, original.payload.quantity);
    EXPECT_EQ(task.payload.createdAt, original.payload.createdAt);
}

TEST_F(TaskEnvelopeTest, Decode_Malformed_HasNoProcessingId) {
    auto decoded = TaskEnvelope::decode("{not json");
    ASSERT_FALSE(decoded.isOk());
    EXPECT_FALSE(decoded.error().processingId.has_value());
}

TEST_F(TaskEnvelopeTest, Decode_WrongVersion_Rejected) {
    auto j = encoded();
    j["version"] = 2;

    auto decoded = TaskEnvelope::decode(j.dump());
    ASSERT_FALSE(decoded.isOk());
    EXPECT_EQ(decoded.error().processingId, std::optional<std::string>("task-1"));
    EXPECT_NE(decoded.error().reason.find("version"), std::string::npos);
}

TEST_F(TaskEnvelopeTest, Decode_MissingVersion_Rejected) {
    auto j = encoded();
    j.erase("version");
    EXPECT_FALSE(TaskEnvelope::decode(j.dump()).isOk());
}

TEST_F(TaskEnvelopeTest, Decode_UnknownSymbol_Rejected) {
    auto j = encoded();
    j["payload"]["symbol"] = "silver";

    auto decoded = TaskEnvelope::decode(j.dump());
    ASSERT_FALSE(decoded.isOk());
    EXPECT_EQ(decoded.error().reason, "Unknown symbol: silver");
}

TEST_F(TaskEnvelopeTest, Decode_NonPositiveAmount_Rejected) {
    auto j = encoded();
    j["payload"]["requested_amount"] = "0";
    EXPECT_FALSE(TaskEnvelope::decode(j.dump()).isOk());
}

TEST_F(TaskEnvelopeTest, Decode_NumericAmount_Rejected) {
    auto j = encoded();
    j["payload"]["requested_amount"] = 500.0;

    auto decoded = TaskEnvelope::decode(j.dump());
    ASSERT_FALSE(decoded.isOk());
    EXPECT_EQ(decoded.error().reason.rfind("Invalid task payload", 0), 0u);
}

TEST_F(TaskEnvelopeTest, Decode_MissingPayload_Rejected) {
    auto j = encoded();
    j.erase("payload");
    EXPECT_FALSE(TaskEnvelope::decode(j.dump()).isOk());
}
