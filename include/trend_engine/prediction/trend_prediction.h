/**
 * Trend prediction structures
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "trend_engine/common/clock.h"

namespace trend_engine {
namespace prediction {

enum class Direction {
    BULLISH,
    BEARISH,
    SIDEWAYS
};

enum class Strength {
    WEAK,
    MODERATE,
    STRONG
};

enum class FactorImpact {
    POSITIVE,
    NEGATIVE,
    NEUTRAL
};

// Progress of one prediction request
enum class PredictionStage {
    COLLECTING,
    SCORING,
    PREDICTING,
    CACHING,
    DONE,
    ERROR
};

// Request options; every field is optional on the wire
struct PredictionOptions {
    bool use_cache = true;
    int cache_ttl_minutes = 30;
    bool include_scenarios = true;
    bool deep_analysis = true;
    bool include_news = true;
    bool include_sentiment = true;
    bool include_earnings = true;
};

// Factor scores in [-100, 100]; empty when the input was unavailable
struct FactorScores {
    std::optional<double> technical;
    std::optional<double> fundamental;
    std::optional<double> sentiment;
    std::optional<double> news;
};

// Percentages summing to 100
struct Probability {
    int bullish = 0;
    int bearish = 0;
    int sideways = 0;
};

struct PredictionSummary {
    Direction direction = Direction::SIDEWAYS;
    int confidence = 50;            // [0, 95]
    Strength strength = Strength::WEAK;
    Probability probability;
};

struct KeyFactor {
    std::string factor;
    FactorImpact impact = FactorImpact::NEUTRAL;
    double weight = 0.0;
    std::string description;
};

struct Scenario {
    std::string name;
    int probability = 0;            // percent
    std::string description;
    double price_impact = 0.0;      // percent
    std::string time_to_impact;
};

// Narrative review of a prediction by an external model
struct DeepAnalysis {
    std::string reasoning;
    std::vector<std::string> key_insights;
    std::vector<std::string> monitoring_points;
    double confidence = 50.0;
};

struct PredictionAnalysis {
    FactorScores factor_scores;
    double overall_score = 0.0;
    std::vector<KeyFactor> key_factors;
    std::vector<std::string> risks;
    std::vector<std::string> catalysts;
};

struct TrendPrediction {
    std::string symbol;
    std::string timeframe;
    PredictionSummary prediction;
    PredictionAnalysis analysis;
    std::vector<Scenario> scenarios;
    common::TimePoint last_updated;
    std::optional<DeepAnalysis> deep_analysis;
};

std::string directionToString(Direction direction);
std::string strengthToString(Strength strength);
std::string factorImpactToString(FactorImpact impact);
std::string predictionStageToString(PredictionStage stage);

} // namespace prediction
} // namespace trend_engine
