/**
 * Optional narrative review of a prediction by an external text model
 */

#pragma once

#include <string>
#include <vector>

#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

// Sends a prompt to a text model and returns its raw reply; may throw
class DeepAnalysisClient {
public:
    virtual ~DeepAnalysisClient() = default;

    virtual std::string complete(const std::string& prompt) = 0;
};

// Everything the prompt describes
struct DeepAnalysisRequest {
    std::string symbol;
    std::string timeframe;
    PredictionSummary prediction;
    FactorScores scores;
    double overall_score = 0.0;
    std::vector<KeyFactor> key_factors;
    std::vector<Scenario> scenarios;
};

std::string buildDeepAnalysisPrompt(const DeepAnalysisRequest& request);

/**
 * Parse a JSON reply {reasoning, keyInsights, monitoringPoints, confidence}.
 * Missing fields take defaults (confidence 70); a reply that is not a JSON
 * object yields the unavailable result (confidence 50).
 */
DeepAnalysis parseDeepAnalysisResponse(const std::string& response);

// Prompt, call and parse; a throwing client yields the failure result (confidence 30)
DeepAnalysis runDeepAnalysis(DeepAnalysisClient& client, const DeepAnalysisRequest& request);

} // namespace prediction
} // namespace trend_engine
