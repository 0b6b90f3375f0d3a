/**
 * Direction, confidence and narrative derivation from factor scores
 */

#pragma once

#include <string>
#include <vector>

#include "trend_engine/common/config.h"
#include "trend_engine/prediction/score_aggregator.h"
#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

class TrendPredictor {
public:
    explicit TrendPredictor(const common::PredictionConfig& config = common::PredictionConfig());
    ~TrendPredictor() = default;

    /**
     * Direction from the overall score against the threshold, confidence from
     * the score magnitude and the agreement between available factors,
     * strength class and probability split.
     */
    PredictionSummary predict(double overall_score, const FactorScores& scores) const;

    Direction direction(double overall_score) const;

    // round(min(95, 50 + |overall| * 0.5 + consensus * 0.3)) where consensus is
    // max(0, 100 - variance) over the available factors, 0 when none are available
    static int confidence(double overall_score, const FactorScores& scores);

    static Strength strengthClass(double overall_score);

    // Bullish and bearish rounded independently; sideways takes the residual
    static Probability probabilities(double overall_score);

    // At most five factors, in technical, earnings, sentiment, news order
    static std::vector<KeyFactor> identifyKeyFactors(const CollectedInputs& inputs, const FactorScores& scores);

    // Base, bull and bear cases
    static std::vector<Scenario> generateScenarios(Direction direction);

    static std::vector<std::string> identifyRisks(const std::vector<KeyFactor>& factors,
                                                  const std::vector<Scenario>& scenarios);

    static std::vector<std::string> identifyCatalysts(const std::vector<KeyFactor>& factors,
                                                      const std::vector<Scenario>& scenarios);

    static constexpr size_t MAX_KEY_FACTORS = 5;
    static constexpr size_t MAX_RISKS = 5;
    static constexpr size_t MAX_CATALYSTS = 5;

private:
    double direction_threshold_;
};

} // namespace prediction
} // namespace trend_engine
