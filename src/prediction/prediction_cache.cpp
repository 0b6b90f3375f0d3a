/**
 * Prediction cache implementation
 */

#include <utility>

#include "trend_engine/prediction/prediction_cache.h"

namespace trend_engine {
namespace prediction {

InMemoryPredictionCache::InMemoryPredictionCache(std::shared_ptr<const common::Clock> clock)
    : clock_(std::move(clock)) {
}

std::shared_ptr<const TrendPrediction> InMemoryPredictionCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return nullptr;
    }

    if (clock_->now() >= it->second.expires_at) {
        entries_.erase(it);
        misses_++;
        return nullptr;
    }

    hits_++;
    return it->second.value;
}

void InMemoryPredictionCache::set(const std::string& key,
                                  std::shared_ptr<const TrendPrediction> value,
                                  std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    purgeExpired(now);
    entries_[key] = Entry{std::move(value), now + ttl};
}

size_t InMemoryPredictionCache::clearByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        it = entries_.erase(it);
        removed++;
    }
    return removed;
}

CacheStats InMemoryPredictionCache::getStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    purgeExpired(clock_->now());

    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.entries = entries_.size();
    return stats;
}

void InMemoryPredictionCache::purgeExpired(common::TimePoint now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace prediction
} // namespace trend_engine
