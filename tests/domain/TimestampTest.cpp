#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"

using namespace bullion::domain;

TEST(TimestampTest, ToString_IsoWithMillis) {
    auto ts = Timestamp::fromEpochMillis(1714557600250);
    EXPECT_EQ(ts.toString(), "2024-05-01T10:00:00.250Z");
}

TEST(TimestampTest, FromString_WithAndWithoutMillis) {
    EXPECT_EQ(Timestamp::fromString("2024-05-01T10:00:00Z").toEpochMillis(), 1714557600000);
    EXPECT_EQ(Timestamp::fromString("2024-05-01T10:00:00.250Z").toEpochMillis(), 1714557600250);
    EXPECT_EQ(Timestamp::fromString("2024-05-01T10:00:00.5Z").toEpochMillis(), 1714557600500);
}

TEST(TimestampTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Timestamp::fromString("yesterday"), std::invalid_argument);
}

TEST(TimestampTest, Now_SurvivesStringRoundTrip) {
    auto now = Timestamp::now();
    EXPECT_EQ(Timestamp::fromString(now.toString()), now);
}

TEST(TimestampTest, Ordering) {
    auto earlier = Timestamp::fromEpochMillis(1000);
    auto later = Timestamp::fromEpochMillis(2000);
    EXPECT_LT(earlier, later);
    EXPECT_GT(later, earlier);
    EXPECT_NE(earlier, later);
}
