/**
 * JSON views of prediction structures
 */

#pragma once

#include <nlohmann/json.hpp>

#include "trend_engine/prediction/prediction_cache.h"
#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

using json = nlohmann::json;

json predictionOptionsToJson(const PredictionOptions& options);

// Unavailable factors serialize as null
json factorScoresToJson(const FactorScores& scores);

json trendPredictionToJson(const TrendPrediction& prediction);

json cacheStatsToJson(const CacheStats& stats);

} // namespace prediction
} // namespace trend_engine
