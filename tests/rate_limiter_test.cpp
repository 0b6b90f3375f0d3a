#include <chrono>
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "test_fakes.h"
#include "trend_engine/common/rate_limiter.h"

using namespace trend_engine;
using std::chrono::milliseconds;

TEST(RateLimiterTest, PacingLimiterSpacesCalls) {
    auto clock = std::make_shared<fakes::ManualClock>();
    fakes::RecordingSleeper sleeper(clock);
    auto limiter = common::createPacingLimiter(milliseconds(100), clock, sleeper.sleeper());

    limiter->acquire();
    EXPECT_EQ(sleeper.count(), 0u);

    limiter->acquire();
    limiter->acquire();
    EXPECT_EQ(sleeper.total(), milliseconds(200));
}

TEST(RateLimiterTest, BurstUpToCapacity) {
    auto clock = std::make_shared<fakes::ManualClock>();
    fakes::RecordingSleeper sleeper(clock);
    common::TokenBucketRateLimiter limiter(3, milliseconds(100), clock, sleeper.sleeper());

    limiter.acquire();
    limiter.acquire();
    limiter.acquire();
    EXPECT_EQ(sleeper.count(), 0u);
    EXPECT_EQ(limiter.availableTokens(), 0);

    limiter.acquire();
    EXPECT_EQ(sleeper.total(), milliseconds(100));
}

TEST(RateLimiterTest, RefillIsCappedAtCapacity) {
    auto clock = std::make_shared<fakes::ManualClock>();
    common::TokenBucketRateLimiter limiter(3, milliseconds(100), clock);

    limiter.acquire();
    limiter.acquire();
    limiter.acquire();

    clock->advance(milliseconds(250));
    EXPECT_EQ(limiter.availableTokens(), 2);

    clock->advance(milliseconds(10000));
    EXPECT_EQ(limiter.availableTokens(), 3);
}

TEST(RateLimiterTest, ZeroIntervalDisablesPacing) {
    auto clock = std::make_shared<fakes::ManualClock>();
    fakes::RecordingSleeper sleeper(clock);
    auto limiter = common::createPacingLimiter(milliseconds(0), clock, sleeper.sleeper());

    for (int i = 0; i < 10; ++i) {
        limiter->acquire();
    }
    EXPECT_EQ(sleeper.count(), 0u);
}

TEST(RateLimiterTest, RejectsInvalidParameters) {
    EXPECT_THROW(common::TokenBucketRateLimiter(0, milliseconds(100)), std::invalid_argument);
    EXPECT_THROW(common::TokenBucketRateLimiter(1, milliseconds(0)), std::invalid_argument);
}
