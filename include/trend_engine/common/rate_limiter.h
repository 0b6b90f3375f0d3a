/**
 * Pacing for batch calls against upstream providers
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "trend_engine/common/clock.h"

namespace trend_engine {
namespace common {

// Blocks the caller until it may issue the next upstream call
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual void acquire() = 0;
};

// Never waits
class NoopRateLimiter : public RateLimiter {
public:
    void acquire() override {}
};

/**
 * Token bucket: starts full with `capacity` tokens and regains one token per
 * `refill_interval`. The sleeper is called with the time left until the next
 * token; it defaults to std::this_thread::sleep_for.
 */
class TokenBucketRateLimiter : public RateLimiter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TokenBucketRateLimiter(int capacity,
                           std::chrono::milliseconds refill_interval,
                           std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                           Sleeper sleeper = Sleeper());

    void acquire() override;

    int availableTokens();

private:
    int capacity_;
    std::chrono::milliseconds refill_interval_;
    std::shared_ptr<const Clock> clock_;
    Sleeper sleeper_;

    int tokens_;
    TimePoint last_refill_;
    std::mutex mutex_;

    void refill();
};

// Limiter that lets one call through every `interval`; zero disables pacing
std::unique_ptr<RateLimiter> createPacingLimiter(std::chrono::milliseconds interval,
                                                 std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                                                 TokenBucketRateLimiter::Sleeper sleeper = TokenBucketRateLimiter::Sleeper());

} // namespace common
} // namespace trend_engine
