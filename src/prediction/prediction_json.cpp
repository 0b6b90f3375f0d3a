/**
 * JSON views of prediction structures
 */

#include "trend_engine/prediction/prediction_json.h"

namespace trend_engine {
namespace prediction {

namespace {

json optionalScore(const std::optional<double>& score) {
    if (score) {
        return *score;
    }
    return nullptr;
}

} // namespace

json predictionOptionsToJson(const PredictionOptions& options) {
    json j;
    j["useCache"] = options.use_cache;
    j["cacheTTLMinutes"] = options.cache_ttl_minutes;
    j["includeScenarios"] = options.include_scenarios;
    j["deepAnalysis"] = options.deep_analysis;
    j["includeNews"] = options.include_news;
    j["includeSentiment"] = options.include_sentiment;
    j["includeEarnings"] = options.include_earnings;
    return j;
}

json factorScoresToJson(const FactorScores& scores) {
    json j;
    j["technicalScore"] = optionalScore(scores.technical);
    j["fundamentalScore"] = optionalScore(scores.fundamental);
    j["sentimentScore"] = optionalScore(scores.sentiment);
    j["newsScore"] = optionalScore(scores.news);
    return j;
}

json trendPredictionToJson(const TrendPrediction& prediction) {
    json j;
    j["symbol"] = prediction.symbol;
    j["timeframe"] = prediction.timeframe;

    const auto& summary = prediction.prediction;
    j["prediction"] = {
        {"direction", directionToString(summary.direction)},
        {"confidence", summary.confidence},
        {"strength", strengthToString(summary.strength)},
        {"probability", {
            {"bullish", summary.probability.bullish},
            {"bearish", summary.probability.bearish},
            {"sideways", summary.probability.sideways}
        }}
    };

    json analysis = factorScoresToJson(prediction.analysis.factor_scores);
    analysis["overallScore"] = prediction.analysis.overall_score;
    analysis["keyFactors"] = json::array();
    for (const auto& factor : prediction.analysis.key_factors) {
        analysis["keyFactors"].push_back({
            {"factor", factor.factor},
            {"impact", factorImpactToString(factor.impact)},
            {"weight", factor.weight},
            {"description", factor.description}
        });
    }
    analysis["risks"] = prediction.analysis.risks;
    analysis["catalysts"] = prediction.analysis.catalysts;
    j["analysis"] = analysis;

    j["scenarios"] = json::array();
    for (const auto& scenario : prediction.scenarios) {
        j["scenarios"].push_back({
            {"name", scenario.name},
            {"probability", scenario.probability},
            {"description", scenario.description},
            {"priceImpact", scenario.price_impact},
            {"timeToImpact", scenario.time_to_impact}
        });
    }

    j["lastUpdated"] = common::formatTimestamp(prediction.last_updated);

    if (prediction.deep_analysis) {
        j["deepAnalysis"] = {
            {"reasoning", prediction.deep_analysis->reasoning},
            {"keyInsights", prediction.deep_analysis->key_insights},
            {"monitoringPoints", prediction.deep_analysis->monitoring_points},
            {"confidence", prediction.deep_analysis->confidence}
        };
    }

    return j;
}

json cacheStatsToJson(const CacheStats& stats) {
    return {
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"entries", stats.entries}
    };
}

} // namespace prediction
} // namespace trend_engine
