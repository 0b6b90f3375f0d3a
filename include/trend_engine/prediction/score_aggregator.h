/**
 * Multi-factor score aggregation
 */

#pragma once

#include <optional>
#include <vector>

#include "trend_engine/analysis/external_analyzers.h"
#include "trend_engine/common/config.h"
#include "trend_engine/data/market_data.h"
#include "trend_engine/indicators/indicator.h"
#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

// Raw inputs gathered for one prediction; empty members failed or were excluded
struct CollectedInputs {
    std::optional<std::vector<indicators::IndicatorResult>> technical;
    std::optional<analysis::NewsSentiment> news;
    std::optional<analysis::MarketSentiment> sentiment;
    std::optional<analysis::EarningsAnalysis> earnings;
    std::optional<std::vector<data::PriceBar>> prices;
};

/**
 * Turns collected inputs into four factor scores in [-100, 100] and combines
 * them with the configured weights. A factor without usable input stays empty
 * and contributes 0 to the overall score.
 */
class ScoreAggregator {
public:
    explicit ScoreAggregator(const common::PredictionConfig::Weights& weights = common::PredictionConfig::Weights());

    FactorScores score(const CollectedInputs& inputs) const;

    // Weighted sum; throws std::domain_error on a non-finite factor score
    double overallScore(const FactorScores& scores) const;

    // RSI, MACD and SMA terms from the latest indicator records, averaged
    static std::optional<double> technicalScore(const std::vector<indicators::IndicatorResult>& records);

    // Earnings assessment, earnings streak and price momentum terms, averaged
    static std::optional<double> fundamentalScore(const std::optional<analysis::EarningsAnalysis>& earnings,
                                                  const std::optional<std::vector<data::PriceBar>>& prices);

    static double newsScore(const analysis::NewsSentiment& news);

    // Fixed delta per earnings outcome
    static double assessmentDelta(analysis::EarningsAssessment assessment);

private:
    common::PredictionConfig::Weights weights_;
};

} // namespace prediction
} // namespace trend_engine
