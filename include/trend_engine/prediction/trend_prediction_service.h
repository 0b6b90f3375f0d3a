/**
 * Trend prediction entry point
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "trend_engine/analysis/external_analyzers.h"
#include "trend_engine/common/clock.h"
#include "trend_engine/common/config.h"
#include "trend_engine/data/market_data.h"
#include "trend_engine/indicators/indicator_repository.h"
#include "trend_engine/prediction/deep_analysis.h"
#include "trend_engine/prediction/prediction_cache.h"
#include "trend_engine/prediction/score_aggregator.h"
#include "trend_engine/prediction/trend_predictor.h"

namespace trend_engine {
namespace prediction {

// Injected collaborators; a null analyzer or deep analysis client counts as unavailable
struct PredictionCollaborators {
    std::shared_ptr<indicators::IndicatorRepository> indicators;
    std::shared_ptr<data::PriceHistoryProvider> prices;
    std::shared_ptr<analysis::NewsAnalyzer> news;
    std::shared_ptr<analysis::MarketSentimentAnalyzer> sentiment;
    std::shared_ptr<analysis::EarningsAnalyzer> earnings;
    std::shared_ptr<PredictionCache> cache;
    std::shared_ptr<DeepAnalysisClient> deep_analysis;
    std::shared_ptr<const common::Clock> clock;
};

struct ServiceStats {
    CacheStats cache;
    size_t predictions_computed = 0;
};

class TrendPredictionService {
public:
    // Missing cache and clock are replaced with in-memory and system defaults
    TrendPredictionService(const common::Config& config, PredictionCollaborators collaborators);
    ~TrendPredictionService() = default;

    /**
     * Predict the trend of `symbol` over `timeframe` (1W, 1M, 3M, 6M, 1Y).
     * Inputs are collected concurrently; a failed input is logged and left
     * out. A cache hit returns the stored object. Throws std::invalid_argument
     * for an unknown timeframe and common::AggregationError when scoring or
     * prediction fails.
     */
    std::shared_ptr<const TrendPrediction> predictTrend(const std::string& symbol,
                                                        const std::string& timeframe,
                                                        const PredictionOptions& options = PredictionOptions());

    // Gather every enabled input; never throws
    CollectedInputs collectInputs(const std::string& symbol,
                                  const std::string& timeframe,
                                  const PredictionOptions& options);

    ServiceStats getStats();

    // Drop cached predictions; returns the number removed
    size_t clearCache();

    static std::string cacheKey(const std::string& symbol,
                                const std::string& timeframe,
                                const PredictionOptions& options);

    static constexpr const char* CACHE_PREFIX = "trend_prediction";

private:
    ScoreAggregator aggregator_;
    TrendPredictor predictor_;
    PredictionCollaborators collaborators_;
    std::atomic<size_t> predictions_computed_{0};
};

} // namespace prediction
} // namespace trend_engine
