/**
 * Multi-symbol and portfolio trend analysis
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "trend_engine/common/config.h"
#include "trend_engine/common/rate_limiter.h"
#include "trend_engine/prediction/trend_prediction_service.h"

namespace trend_engine {
namespace portfolio {

using json = nlohmann::json;

enum class PortfolioTrend {
    BULLISH,
    BEARISH,
    MIXED
};

enum class ActionType {
    BUY,
    SELL,
    HOLD,
    REDUCE,
    ADD
};

enum class Urgency {
    HIGH,
    MEDIUM,
    LOW
};

struct RecommendedAction {
    ActionType action = ActionType::HOLD;
    std::string symbol;
    std::string reason;
    Urgency urgency = Urgency::LOW;
};

// Successful predictions by symbol plus the error of every symbol that failed
struct MultiSymbolTrendAnalysis {
    std::map<std::string, std::shared_ptr<const prediction::TrendPrediction>> predictions;
    std::map<std::string, std::string> failures;
};

struct PortfolioTrendAnalysis {
    PortfolioTrend overall_trend = PortfolioTrend::MIXED;
    int confidence = 0;
    std::vector<std::string> bullish_symbols;
    std::vector<std::string> bearish_symbols;
    std::vector<std::string> neutral_symbols;
    std::vector<std::string> key_themes;
    std::vector<std::string> risks;
    std::vector<std::string> opportunities;
    std::vector<RecommendedAction> recommended_actions;
};

class PortfolioAnalyzer {
public:
    /**
     * A null limiter is replaced by one releasing a batch every
     * `portfolio.batch_pause_ms`.
     */
    PortfolioAnalyzer(const common::Config& config,
                      std::shared_ptr<prediction::TrendPredictionService> service,
                      std::shared_ptr<common::RateLimiter> limiter = nullptr);
    ~PortfolioAnalyzer() = default;

    /**
     * Predict every symbol in batches of `batch_size`, concurrently within a
     * batch, pacing batches through the limiter. Deep analysis is always off.
     * A failing symbol is recorded in `failures` and does not stop the run.
     */
    MultiSymbolTrendAnalysis analyzeMultipleSymbols(const std::vector<std::string>& symbols,
                                                    const std::string& timeframe = "1M",
                                                    const prediction::PredictionOptions& options = prediction::PredictionOptions());

    // Portfolio view over the configured timeframe; throws NoPredictionsError
    // when no symbol could be predicted
    PortfolioTrendAnalysis analyzePortfolioTrends(const std::vector<std::string>& symbols,
                                                  const prediction::PredictionOptions& options = prediction::PredictionOptions());

    // Aggregate predictions given in portfolio order; throws NoPredictionsError when empty
    static PortfolioTrendAnalysis summarize(const std::vector<std::shared_ptr<const prediction::TrendPrediction>>& predictions);

    // Key-factor names by frequency, ties in first-seen order, top five
    static std::vector<std::string> extractKeyThemes(const std::vector<std::shared_ptr<const prediction::TrendPrediction>>& predictions);

    // At most eight actions
    static std::vector<RecommendedAction> generateRecommendations(const std::vector<std::shared_ptr<const prediction::TrendPrediction>>& predictions);

private:
    int batch_size_;
    std::string portfolio_timeframe_;
    std::shared_ptr<prediction::TrendPredictionService> service_;
    std::shared_ptr<common::RateLimiter> limiter_;
};

std::string portfolioTrendToString(PortfolioTrend trend);
std::string actionTypeToString(ActionType action);
std::string urgencyToString(Urgency urgency);

json multiSymbolAnalysisToJson(const MultiSymbolTrendAnalysis& analysis);
json portfolioAnalysisToJson(const PortfolioTrendAnalysis& analysis);

} // namespace portfolio
} // namespace trend_engine
