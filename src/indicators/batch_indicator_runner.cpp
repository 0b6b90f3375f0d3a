/**
 * Batch indicator runner implementation
 */

#include <algorithm>
#include <chrono>
#include <utility>

#include "trend_engine/common/logging.h"
#include "trend_engine/indicators/batch_indicator_runner.h"

namespace trend_engine {
namespace indicators {

namespace {

// Clears the running flag on every exit path
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // namespace

BatchIndicatorRunner::BatchIndicatorRunner(const common::Config& config,
                                           std::shared_ptr<data::PriceHistoryProvider> price_provider,
                                           std::shared_ptr<data::InstrumentProvider> instrument_provider,
                                           std::shared_ptr<IndicatorRepository> repository,
                                           std::shared_ptr<common::RateLimiter> limiter,
                                           std::shared_ptr<const common::Clock> clock)
    : calculator_(config),
      fetch_days_(std::max(config.getIndicatorConfig().history_days,
                           config.getIndicatorConfig().extremes_window_days)),
      retention_days_(config.getIndicatorConfig().retention_days),
      price_provider_(std::move(price_provider)),
      instrument_provider_(std::move(instrument_provider)),
      repository_(std::move(repository)),
      limiter_(std::move(limiter)),
      clock_(std::move(clock)) {

    if (!limiter_) {
        limiter_ = common::createPacingLimiter(
            std::chrono::milliseconds(config.getIndicatorConfig().pacing_interval_ms), clock_);
    }
}

std::optional<CalculatedIndicatorSet> BatchIndicatorRunner::calculateIndicators(const std::string& symbol) {
    auto prices = price_provider_->getPriceHistory(symbol, fetch_days_);
    return calculator_.calculate(symbol, prices);
}

size_t BatchIndicatorRunner::saveIndicators(const CalculatedIndicatorSet& set) {
    size_t written = repository_->upsert(toIndicatorResults(set, clock_->now()));
    LOG_DEBUG("Saved " + std::to_string(written) + " indicators for " + set.symbol);
    return written;
}

int BatchIndicatorRunner::runAll() {
    if (running_.exchange(true)) {
        LOG_WARNING("Indicator batch already running, skipping");
        return 0;
    }
    RunningGuard guard(running_);

    auto started = std::chrono::steady_clock::now();
    LOG_INFO("Starting indicator batch");

    std::vector<std::string> symbols;
    try {
        symbols = instrument_provider_->getActiveSymbols();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot list active instruments: " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.error_count++;
        return 0;
    }

    int processed = 0;
    for (const auto& symbol : symbols) {
        limiter_->acquire();

        try {
            auto set = calculateIndicators(symbol);
            if (!set) {
                continue;
            }
            saveIndicators(*set);
            processed++;
        } catch (const std::exception& e) {
            LOG_ERROR("Indicator calculation failed for " + symbol + ": " + e.what());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO("Indicator batch completed: " + std::to_string(processed) + "/" +
             std::to_string(symbols.size()) + " instruments in " +
             std::to_string(elapsed.count()) + "ms");

    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.last_run = clock_->now();
    status_.success_count++;
    status_.last_processed = processed;
    return processed;
}

bool BatchIndicatorRunner::runSymbol(const std::string& symbol) {
    auto set = calculateIndicators(symbol);
    if (!set) {
        LOG_INFO("No indicators calculated for " + symbol);
        return false;
    }

    saveIndicators(*set);
    LOG_INFO("Manual indicator calculation completed for " + symbol);
    return true;
}

size_t BatchIndicatorRunner::cleanupOldIndicators() {
    return cleanupOldIndicators(retention_days_);
}

size_t BatchIndicatorRunner::cleanupOldIndicators(int days) {
    size_t removed = repository_->deleteOlderThan(days, clock_->now());
    LOG_INFO("Removed " + std::to_string(removed) + " indicators older than " +
             std::to_string(days) + " days");
    return removed;
}

std::vector<IndicatorResult> BatchIndicatorRunner::getActiveSignals() {
    return repository_->getActiveSignals({TradeSignal::BUY, TradeSignal::SELL});
}

std::vector<IndicatorResult> BatchIndicatorRunner::getLatestIndicators(const std::string& symbol) {
    return repository_->getLatestIndicators(symbol);
}

IndicatorStats BatchIndicatorRunner::getStats() {
    return repository_->getStats();
}

RunnerStatus BatchIndicatorRunner::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    RunnerStatus status = status_;
    status.running = running_.load();
    return status;
}

} // namespace indicators
} // namespace trend_engine
