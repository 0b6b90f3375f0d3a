/**
 * Token bucket rate limiter implementation
 */

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include "trend_engine/common/rate_limiter.h"

namespace trend_engine {
namespace common {

TokenBucketRateLimiter::TokenBucketRateLimiter(int capacity,
                                               std::chrono::milliseconds refill_interval,
                                               std::shared_ptr<const Clock> clock,
                                               Sleeper sleeper)
    : capacity_(capacity),
      refill_interval_(refill_interval),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)),
      tokens_(capacity) {

    if (capacity_ <= 0) {
        throw std::invalid_argument("Rate limiter capacity must be positive");
    }
    if (refill_interval_.count() <= 0) {
        throw std::invalid_argument("Rate limiter refill interval must be positive");
    }
    if (!clock_) {
        throw std::invalid_argument("Rate limiter requires a clock");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }

    last_refill_ = clock_->now();
}

void TokenBucketRateLimiter::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    refill();
    while (tokens_ < 1) {
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            last_refill_ + refill_interval_ - clock_->now());
        sleeper_(std::max(wait, std::chrono::milliseconds(1)));
        refill();
    }

    --tokens_;
}

int TokenBucketRateLimiter::availableTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    return tokens_;
}

void TokenBucketRateLimiter::refill() {
    auto now = clock_->now();
    auto intervals = (now - last_refill_) / refill_interval_;
    if (intervals <= 0) {
        return;
    }

    tokens_ = static_cast<int>(std::min<long long>(capacity_, tokens_ + intervals));
    last_refill_ += intervals * refill_interval_;
}

std::unique_ptr<RateLimiter> createPacingLimiter(std::chrono::milliseconds interval,
                                                 std::shared_ptr<const Clock> clock,
                                                 TokenBucketRateLimiter::Sleeper sleeper) {
    if (interval.count() <= 0) {
        return std::make_unique<NoopRateLimiter>();
    }
    return std::make_unique<TokenBucketRateLimiter>(1, interval, std::move(clock), std::move(sleeper));
}

} // namespace common
} // namespace trend_engine
