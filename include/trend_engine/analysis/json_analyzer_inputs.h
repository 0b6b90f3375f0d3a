/**
 * Analyzer inputs read from a JSON document
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "trend_engine/analysis/external_analyzers.h"

namespace trend_engine {
namespace analysis {

using json = nlohmann::json;

/**
 * Serves all three analyzers from one document:
 *
 *   {
 *     "market_sentiment": 12,
 *     "symbols": {
 *       "AAPL": {
 *         "news_sentiment": 35,
 *         "earnings": {"assessment": "BEAT", "consecutive_beats": 3, "consecutive_misses": 0}
 *       }
 *     }
 *   }
 *
 * A missing value throws DataError, which the predictor treats as an
 * unavailable input.
 */
class JsonAnalyzerInputs : public NewsAnalyzer,
                           public MarketSentimentAnalyzer,
                           public EarningsAnalyzer {
public:
    explicit JsonAnalyzerInputs(const json& document);
    ~JsonAnalyzerInputs() override = default;

    // Load from file; throws DataError when unreadable
    static JsonAnalyzerInputs fromFile(const std::string& path);

    NewsSentiment getNewsSentiment(const std::string& symbol) override;
    MarketSentiment getMarketSentiment(const MarketSentimentOptions& options) override;
    EarningsAnalysis analyzeEarnings(const std::string& symbol, const EarningsOptions& options) override;

private:
    std::optional<double> market_sentiment_;
    std::map<std::string, double> news_;
    std::map<std::string, EarningsAnalysis> earnings_;
};

} // namespace analysis
} // namespace trend_engine
