#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "trend_engine/common/settled.h"

using trend_engine::common::settle;
using trend_engine::common::settleAsync;

TEST(SettledTest, KeepsValue) {
    auto result = settleAsync([]() { return 7; }).get();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.value, 7);
    EXPECT_TRUE(result.error.empty());
}

TEST(SettledTest, StandardExceptionBecomesMessage) {
    auto result = settle([]() -> double { throw std::runtime_error("feed down"); });
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, "feed down");
}

TEST(SettledTest, NonStandardThrowNeverEscapesJoin) {
    auto future = settleAsync([]() -> double { throw 42; });

    trend_engine::common::Settled<double> result;
    ASSERT_NO_THROW(result = future.get());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, "unknown error");

    auto plain = settle([]() -> std::string { throw "raw string"; });
    EXPECT_FALSE(plain.ok());
    EXPECT_EQ(plain.error, "unknown error");
}
