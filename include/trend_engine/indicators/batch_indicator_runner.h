/**
 * Batch indicator calculation over the watchlist
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "trend_engine/common/clock.h"
#include "trend_engine/common/config.h"
#include "trend_engine/common/rate_limiter.h"
#include "trend_engine/data/market_data.h"
#include "trend_engine/indicators/indicator_calculator.h"
#include "trend_engine/indicators/indicator_repository.h"

namespace trend_engine {
namespace indicators {

// Runner state for monitoring
struct RunnerStatus {
    bool running = false;
    std::optional<common::TimePoint> last_run;
    int success_count = 0;      // completed runAll() passes
    int error_count = 0;        // runAll() passes that could not list instruments
    int last_processed = 0;
};

class BatchIndicatorRunner {
public:
    /**
     * A null limiter is replaced by one pacing calls every
     * `indicators.pacing_interval_ms`.
     */
    BatchIndicatorRunner(const common::Config& config,
                         std::shared_ptr<data::PriceHistoryProvider> price_provider,
                         std::shared_ptr<data::InstrumentProvider> instrument_provider,
                         std::shared_ptr<IndicatorRepository> repository,
                         std::shared_ptr<common::RateLimiter> limiter = nullptr,
                         std::shared_ptr<const common::Clock> clock = std::make_shared<common::SystemClock>());
    ~BatchIndicatorRunner() = default;

    // Fetch history and compute the full set; nullopt on insufficient data.
    // Provider errors propagate.
    std::optional<CalculatedIndicatorSet> calculateIndicators(const std::string& symbol);

    // Persist one set stamped with the current time; returns records written
    size_t saveIndicators(const CalculatedIndicatorSet& set);

    // Calculate and save every active instrument; returns the number processed.
    // Returns 0 without doing anything while another run is in progress.
    int runAll();

    // Manual run for one symbol; false when there was not enough data
    bool runSymbol(const std::string& symbol);

    // Drop records older than the retention window
    size_t cleanupOldIndicators();
    size_t cleanupOldIndicators(int days);

    std::vector<IndicatorResult> getActiveSignals();
    std::vector<IndicatorResult> getLatestIndicators(const std::string& symbol);
    IndicatorStats getStats();

    RunnerStatus status() const;

private:
    IndicatorCalculator calculator_;
    int fetch_days_;
    int retention_days_;

    std::shared_ptr<data::PriceHistoryProvider> price_provider_;
    std::shared_ptr<data::InstrumentProvider> instrument_provider_;
    std::shared_ptr<IndicatorRepository> repository_;
    std::shared_ptr<common::RateLimiter> limiter_;
    std::shared_ptr<const common::Clock> clock_;

    std::atomic<bool> running_{false};
    mutable std::mutex status_mutex_;
    RunnerStatus status_;
};

} // namespace indicators
} // namespace trend_engine
