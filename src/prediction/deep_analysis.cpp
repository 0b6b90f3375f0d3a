/**
 * Deep analysis prompt and reply handling
 */

#include <sstream>

#include <nlohmann/json.hpp>

#include "trend_engine/common/logging.h"
#include "trend_engine/prediction/deep_analysis.h"

namespace trend_engine {
namespace prediction {

using json = nlohmann::json;

namespace {

std::string scoreText(const std::optional<double>& score) {
    if (!score) {
        return "n/a";
    }
    std::stringstream ss;
    ss << *score;
    return ss.str();
}

std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> items;
    if (!j.contains(key) || !j[key].is_array()) {
        return items;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

DeepAnalysis unavailable() {
    DeepAnalysis result;
    result.reasoning = "Deep analysis not available";
    result.confidence = 50.0;
    return result;
}

} // namespace

std::string buildDeepAnalysisPrompt(const DeepAnalysisRequest& request) {
    std::stringstream prompt;

    prompt << "Analyze the trend prediction for " << request.symbol
           << " over timeframe " << request.timeframe << ":\n\n";

    prompt << "CURRENT PREDICTION:\n"
           << "- Direction: " << directionToString(request.prediction.direction) << "\n"
           << "- Confidence: " << request.prediction.confidence << "%\n"
           << "- Strength: " << strengthToString(request.prediction.strength) << "\n\n";

    prompt << "COMPONENT SCORES:\n"
           << "- Technical: " << scoreText(request.scores.technical) << "\n"
           << "- Fundamental: " << scoreText(request.scores.fundamental) << "\n"
           << "- Sentiment: " << scoreText(request.scores.sentiment) << "\n"
           << "- News: " << scoreText(request.scores.news) << "\n"
           << "- Overall: " << request.overall_score << "\n\n";

    prompt << "KEY FACTORS:\n";
    for (const auto& factor : request.key_factors) {
        prompt << "- " << factor.factor << ": " << factorImpactToString(factor.impact)
               << " (" << factor.description << ")\n";
    }
    prompt << "\n";

    prompt << "SCENARIOS:\n";
    for (const auto& scenario : request.scenarios) {
        prompt << "- " << scenario.name << " (" << scenario.probability << "%): "
               << scenario.description << "\n";
    }
    prompt << "\n";

    prompt << "Please provide:\n"
           << "1. REASONING: detailed analysis of the prediction (2-3 sentences)\n"
           << "2. KEY_INSIGHTS: the 3-5 most important insights\n"
           << "3. MONITORING_POINTS: metrics and events to watch closely\n"
           << "4. CONFIDENCE: your confidence in this prediction (0-100)\n\n"
           << "Consider macro context, seasonality and upcoming events.\n\n"
           << "Reply in JSON format:\n"
           << "{\n"
           << "  \"reasoning\": \"Detailed analysis...\",\n"
           << "  \"keyInsights\": [\"insight1\", \"insight2\", \"insight3\"],\n"
           << "  \"monitoringPoints\": [\"point1\", \"point2\", \"point3\"],\n"
           << "  \"confidence\": 85\n"
           << "}\n";

    return prompt.str();
}

DeepAnalysis parseDeepAnalysisResponse(const std::string& response) {
    json reply = json::parse(response, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        LOG_WARNING("Deep analysis reply is not a JSON object");
        return unavailable();
    }

    DeepAnalysis result;
    result.reasoning = "Analysis not available";
    if (reply.contains("reasoning") && reply["reasoning"].is_string() &&
        !reply["reasoning"].get<std::string>().empty()) {
        result.reasoning = reply["reasoning"].get<std::string>();
    }

    result.key_insights = stringList(reply, "keyInsights");
    result.monitoring_points = stringList(reply, "monitoringPoints");

    result.confidence = 70.0;
    if (reply.contains("confidence") && reply["confidence"].is_number() &&
        reply["confidence"].get<double>() != 0.0) {
        result.confidence = reply["confidence"].get<double>();
    }

    return result;
}

DeepAnalysis runDeepAnalysis(DeepAnalysisClient& client, const DeepAnalysisRequest& request) {
    std::string response;
    try {
        response = client.complete(buildDeepAnalysisPrompt(request));
    } catch (const std::exception& e) {
        LOG_WARNING("Deep analysis failed for " + request.symbol + ": " + e.what());

        DeepAnalysis failed;
        failed.reasoning = "Deep analysis failed";
        failed.confidence = 30.0;
        return failed;
    }

    return parseDeepAnalysisResponse(response);
}

} // namespace prediction
} // namespace trend_engine
