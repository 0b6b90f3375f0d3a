/**
 * Trend predictor implementation
 */

#include <algorithm>
#include <cmath>
#include <set>

#include "trend_engine/prediction/trend_predictor.h"

namespace trend_engine {
namespace prediction {

namespace {

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

// Keep first occurrences, in order, up to `limit`
std::vector<std::string> uniqueFirst(const std::vector<std::string>& items, size_t limit) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (result.size() >= limit) {
            break;
        }
        if (seen.insert(item).second) {
            result.push_back(item);
        }
    }
    return result;
}

} // namespace

TrendPredictor::TrendPredictor(const common::PredictionConfig& config)
    : direction_threshold_(config.direction_threshold) {
}

PredictionSummary TrendPredictor::predict(double overall_score, const FactorScores& scores) const {
    PredictionSummary summary;
    summary.direction = direction(overall_score);
    summary.confidence = confidence(overall_score, scores);
    summary.strength = strengthClass(overall_score);
    summary.probability = probabilities(overall_score);
    return summary;
}

Direction TrendPredictor::direction(double overall_score) const {
    if (overall_score > direction_threshold_) {
        return Direction::BULLISH;
    } else if (overall_score < -direction_threshold_) {
        return Direction::BEARISH;
    }
    return Direction::SIDEWAYS;
}

int TrendPredictor::confidence(double overall_score, const FactorScores& scores) {
    const std::optional<double> factors[] = {scores.technical, scores.fundamental, scores.sentiment, scores.news};

    // Absent factors count as 0; with none present there is no consensus
    double consensus = 0.0;
    bool any_present = false;
    double mean = 0.0;
    for (const auto& factor : factors) {
        any_present = any_present || factor.has_value();
        mean += factor.value_or(0.0);
    }
    mean /= 4.0;

    if (any_present) {
        double variance = 0.0;
        for (const auto& factor : factors) {
            double deviation = factor.value_or(0.0) - mean;
            variance += deviation * deviation;
        }
        variance /= 4.0;

        consensus = std::max(0.0, 100.0 - variance);
    }

    double raw = 50.0 + std::fabs(overall_score) * 0.5 + consensus * 0.3;
    return static_cast<int>(std::lround(std::min(95.0, raw)));
}

Strength TrendPredictor::strengthClass(double overall_score) {
    double magnitude = std::fabs(overall_score);
    if (magnitude < 25.0) {
        return Strength::WEAK;
    } else if (magnitude < 50.0) {
        return Strength::MODERATE;
    }
    return Strength::STRONG;
}

Probability TrendPredictor::probabilities(double overall_score) {
    Probability probability;
    probability.bullish = static_cast<int>(std::lround(clamp(50.0 + overall_score * 0.8, 0.0, 100.0)));

    // Half-up rounding of both sides can reach 101
    int bearish = static_cast<int>(std::lround(clamp(50.0 - overall_score * 0.8, 0.0, 100.0)));
    probability.bearish = std::min(bearish, 100 - probability.bullish);
    probability.sideways = 100 - probability.bullish - probability.bearish;
    return probability;
}

std::vector<KeyFactor> TrendPredictor::identifyKeyFactors(const CollectedInputs& inputs, const FactorScores& scores) {
    std::vector<KeyFactor> factors;

    if (inputs.technical && scores.technical) {
        if (*scores.technical > 20.0) {
            factors.push_back({"Technical Analysis", FactorImpact::POSITIVE, 0.3,
                               "Technical indicators show positive momentum"});
        } else if (*scores.technical < -20.0) {
            factors.push_back({"Technical Analysis", FactorImpact::NEGATIVE, 0.3,
                               "Technical indicators show bearish pressure"});
        }
    }

    if (inputs.earnings) {
        switch (inputs.earnings->assessment) {
            case analysis::EarningsAssessment::STRONG_BEAT:
            case analysis::EarningsAssessment::BEAT:
                factors.push_back({"Earnings Performance", FactorImpact::POSITIVE, 0.25,
                                   "Earnings results beat expectations"});
                break;
            case analysis::EarningsAssessment::MISS:
            case analysis::EarningsAssessment::STRONG_MISS:
                factors.push_back({"Earnings Performance", FactorImpact::NEGATIVE, 0.25,
                                   "Earnings results disappointed"});
                break;
            case analysis::EarningsAssessment::MIXED:
                break;
        }
    }

    if (inputs.sentiment) {
        if (inputs.sentiment->sentiment_score > 25.0) {
            factors.push_back({"Market Sentiment", FactorImpact::POSITIVE, 0.2,
                               "Market sentiment is optimistic"});
        } else if (inputs.sentiment->sentiment_score < -25.0) {
            factors.push_back({"Market Sentiment", FactorImpact::NEGATIVE, 0.2,
                               "Market sentiment is pessimistic"});
        }
    }

    if (inputs.news && scores.news) {
        if (*scores.news > 25.0) {
            factors.push_back({"News Coverage", FactorImpact::POSITIVE, 0.15,
                               "Recent news is favorable"});
        } else if (*scores.news < -25.0) {
            factors.push_back({"News Coverage", FactorImpact::NEGATIVE, 0.15,
                               "Recent news is unfavorable"});
        }
    }

    if (factors.size() > MAX_KEY_FACTORS) {
        factors.resize(MAX_KEY_FACTORS);
    }
    return factors;
}

std::vector<Scenario> TrendPredictor::generateScenarios(Direction direction) {
    double base_impact = 0.0;
    if (direction == Direction::BULLISH) {
        base_impact = 8.0;
    } else if (direction == Direction::BEARISH) {
        base_impact = -8.0;
    }

    return {
        {"Base Case", 60, "Most likely path given current trends", base_impact, "1-3 months"},
        {"Bull Case", 25, "Optimistic path driven by positive catalysts", 20.0, "3-6 months"},
        {"Bear Case", 15, "Pessimistic path driven by risk factors", -15.0, "1-2 months"}
    };
}

std::vector<std::string> TrendPredictor::identifyRisks(const std::vector<KeyFactor>& factors,
                                                       const std::vector<Scenario>& scenarios) {
    std::vector<std::string> risks = {
        "General market volatility",
        "Monetary policy changes",
        "Geopolitical uncertainty"
    };

    for (const auto& factor : factors) {
        if (factor.impact == FactorImpact::NEGATIVE) {
            risks.push_back("Risk in: " + factor.factor);
        }
    }

    for (const auto& scenario : scenarios) {
        if (scenario.price_impact < 0.0) {
            risks.push_back("Risk scenario: " + scenario.name);
        }
    }

    return uniqueFirst(risks, MAX_RISKS);
}

std::vector<std::string> TrendPredictor::identifyCatalysts(const std::vector<KeyFactor>& factors,
                                                           const std::vector<Scenario>& scenarios) {
    std::vector<std::string> catalysts = {
        "Improving economic indicators",
        "Positive sector results",
        "Technological innovation"
    };

    for (const auto& factor : factors) {
        if (factor.impact == FactorImpact::POSITIVE) {
            catalysts.push_back("Catalyst: " + factor.factor);
        }
    }

    for (const auto& scenario : scenarios) {
        if (scenario.price_impact > 0.0) {
            catalysts.push_back("Opportunity: " + scenario.name);
        }
    }

    return uniqueFirst(catalysts, MAX_CATALYSTS);
}

} // namespace prediction
} // namespace trend_engine
