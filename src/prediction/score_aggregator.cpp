/**
 * Multi-factor score aggregation implementation
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "trend_engine/prediction/score_aggregator.h"

namespace trend_engine {
namespace prediction {

namespace {

// NaN passes through so overallScore() can reject it
double clamp(double value, double low, double high) {
    if (std::isnan(value)) {
        return value;
    }
    return std::max(low, std::min(high, value));
}

double weighted(const std::optional<double>& score, double weight, const char* name) {
    if (!score) {
        return 0.0;
    }
    if (!std::isfinite(*score)) {
        throw std::domain_error(std::string("Non-finite ") + name + " score");
    }
    return *score * weight;
}

} // namespace

ScoreAggregator::ScoreAggregator(const common::PredictionConfig::Weights& weights)
    : weights_(weights) {
}

FactorScores ScoreAggregator::score(const CollectedInputs& inputs) const {
    FactorScores scores;

    if (inputs.technical) {
        scores.technical = technicalScore(*inputs.technical);
    }

    scores.fundamental = fundamentalScore(inputs.earnings, inputs.prices);

    // Market sentiment is already on the factor scale
    if (inputs.sentiment) {
        scores.sentiment = inputs.sentiment->sentiment_score;
    }

    if (inputs.news) {
        scores.news = newsScore(*inputs.news);
    }

    return scores;
}

double ScoreAggregator::overallScore(const FactorScores& scores) const {
    return weighted(scores.technical, weights_.technical, "technical") +
           weighted(scores.fundamental, weights_.fundamental, "fundamental") +
           weighted(scores.sentiment, weights_.sentiment, "sentiment") +
           weighted(scores.news, weights_.news, "news");
}

std::optional<double> ScoreAggregator::technicalScore(const std::vector<indicators::IndicatorResult>& records) {
    double score = 0.0;
    int factors = 0;

    for (const auto& record : records) {
        switch (record.kind) {
            case indicators::IndicatorKind::RSI: {
                double rsi = record.meta("rsiValue", record.primary_value);
                if (rsi < 30.0) {
                    score += 40.0;
                } else if (rsi > 70.0) {
                    score -= 40.0;
                } else {
                    score += (50.0 - rsi) * 0.8;
                }
                factors++;
                break;
            }
            case indicators::IndicatorKind::MACD: {
                auto line = record.metadata.find("macdLine");
                auto signal = record.metadata.find("macdSignal");
                if (line != record.metadata.end() && signal != record.metadata.end()) {
                    score += clamp((line->second - signal->second) * 100.0, -30.0, 30.0);
                    factors++;
                }
                break;
            }
            case indicators::IndicatorKind::SMA: {
                auto sma20 = record.metadata.find("sma20");
                auto sma50 = record.metadata.find("sma50");
                if (sma20 != record.metadata.end() && sma50 != record.metadata.end() && sma50->second != 0.0) {
                    double spread = (sma20->second - sma50->second) / sma50->second * 100.0;
                    score += clamp(spread * 10.0, -25.0, 25.0);
                    factors++;
                }
                break;
            }
            default:
                break;
        }
    }

    if (factors == 0) {
        return std::nullopt;
    }
    return clamp(score / factors, -100.0, 100.0);
}

std::optional<double> ScoreAggregator::fundamentalScore(const std::optional<analysis::EarningsAnalysis>& earnings,
                                                        const std::optional<std::vector<data::PriceBar>>& prices) {
    double score = 0.0;
    int factors = 0;

    if (earnings) {
        score += assessmentDelta(earnings->assessment);
        factors++;

        // Streak term counts toward the divisor even when neutral
        if (earnings->consecutive_beats > 2) {
            score += 20.0;
        } else if (earnings->consecutive_misses > 2) {
            score -= 20.0;
        }
        factors++;
    }

    if (prices && !prices->empty()) {
        double first = prices->front().close;
        double last = prices->back().close;
        if (first > 0.0 && std::isfinite(first) && std::isfinite(last)) {
            double momentum = (last - first) / first * 100.0;
            score += clamp(momentum * 2.0, -30.0, 30.0);
            factors++;
        }
    }

    if (factors == 0) {
        return std::nullopt;
    }
    return clamp(score / factors, -100.0, 100.0);
}

double ScoreAggregator::newsScore(const analysis::NewsSentiment& news) {
    return clamp(news.sentiment_score * 0.8, -100.0, 100.0);
}

double ScoreAggregator::assessmentDelta(analysis::EarningsAssessment assessment) {
    switch (assessment) {
        case analysis::EarningsAssessment::STRONG_BEAT: return 50.0;
        case analysis::EarningsAssessment::BEAT: return 30.0;
        case analysis::EarningsAssessment::MIXED: return 0.0;
        case analysis::EarningsAssessment::MISS: return -30.0;
        case analysis::EarningsAssessment::STRONG_MISS: return -50.0;
    }
    return 0.0;
}

} // namespace prediction
} // namespace trend_engine
