/**
 * Short-lived cache of computed predictions
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "trend_engine/common/clock.h"
#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t entries = 0;
};

class PredictionCache {
public:
    virtual ~PredictionCache() = default;

    // Null when absent or expired
    virtual std::shared_ptr<const TrendPrediction> get(const std::string& key) = 0;

    virtual void set(const std::string& key,
                     std::shared_ptr<const TrendPrediction> value,
                     std::chrono::milliseconds ttl) = 0;

    // Remove every key starting with `prefix`; returns the number removed
    virtual size_t clearByPrefix(const std::string& prefix) = 0;

    virtual CacheStats getStats() = 0;
};

// Mutex-protected map with per-entry expiry; expired entries are dropped on access
class InMemoryPredictionCache : public PredictionCache {
public:
    explicit InMemoryPredictionCache(std::shared_ptr<const common::Clock> clock = std::make_shared<common::SystemClock>());
    ~InMemoryPredictionCache() override = default;

    std::shared_ptr<const TrendPrediction> get(const std::string& key) override;
    void set(const std::string& key,
             std::shared_ptr<const TrendPrediction> value,
             std::chrono::milliseconds ttl) override;
    size_t clearByPrefix(const std::string& prefix) override;
    CacheStats getStats() override;

private:
    struct Entry {
        std::shared_ptr<const TrendPrediction> value;
        common::TimePoint expires_at;
    };

    std::shared_ptr<const common::Clock> clock_;
    std::map<std::string, Entry> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    std::mutex mutex_;

    void purgeExpired(common::TimePoint now);
};

} // namespace prediction
} // namespace trend_engine
