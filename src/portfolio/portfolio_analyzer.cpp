/**
 * Multi-symbol and portfolio trend analysis implementation
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <set>
#include <utility>

#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/common/settled.h"
#include "trend_engine/portfolio/portfolio_analyzer.h"
#include "trend_engine/prediction/prediction_json.h"

namespace trend_engine {
namespace portfolio {

using prediction::Direction;
using prediction::Strength;
using prediction::TrendPrediction;

namespace {

constexpr size_t MAX_THEMES = 5;
constexpr size_t MAX_PORTFOLIO_RISKS = 5;
constexpr size_t MAX_OPPORTUNITIES = 5;
constexpr size_t MAX_ACTIONS = 8;

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

PortfolioAnalyzer::PortfolioAnalyzer(const common::Config& config,
                                     std::shared_ptr<prediction::TrendPredictionService> service,
                                     std::shared_ptr<common::RateLimiter> limiter)
    : batch_size_(config.getPortfolioConfig().batch_size),
      portfolio_timeframe_(config.getPortfolioConfig().timeframe),
      service_(std::move(service)),
      limiter_(std::move(limiter)) {

    if (!limiter_) {
        limiter_ = common::createPacingLimiter(
            std::chrono::milliseconds(config.getPortfolioConfig().batch_pause_ms));
    }
}

MultiSymbolTrendAnalysis PortfolioAnalyzer::analyzeMultipleSymbols(const std::vector<std::string>& symbols,
                                                                   const std::string& timeframe,
                                                                   const prediction::PredictionOptions& options) {
    MultiSymbolTrendAnalysis result;

    prediction::PredictionOptions batch_options = options;
    batch_options.deep_analysis = false;

    auto service = service_;
    size_t batch_size = static_cast<size_t>(std::max(1, batch_size_));

    for (size_t start = 0; start < symbols.size(); start += batch_size) {
        size_t end = std::min(symbols.size(), start + batch_size);

        limiter_->acquire();

        std::vector<std::pair<std::string, std::future<common::Settled<std::shared_ptr<const TrendPrediction>>>>> pending;
        for (size_t i = start; i < end; ++i) {
            const std::string symbol = symbols[i];
            pending.emplace_back(symbol, common::settleAsync([service, symbol, timeframe, batch_options]() {
                return service->predictTrend(symbol, timeframe, batch_options);
            }));
        }

        for (auto& entry : pending) {
            auto settled = entry.second.get();
            if (settled.ok()) {
                result.predictions[entry.first] = *settled.value;
            } else {
                LOG_WARNING("Failed to predict trend for " + entry.first + ": " + settled.error);
                result.failures[entry.first] = settled.error;
            }
        }
    }

    LOG_INFO("Multi-symbol analysis completed: " + std::to_string(result.predictions.size()) + "/" +
             std::to_string(symbols.size()) + " symbols predicted (" + timeframe + ")");
    return result;
}

PortfolioTrendAnalysis PortfolioAnalyzer::analyzePortfolioTrends(const std::vector<std::string>& symbols,
                                                                 const prediction::PredictionOptions& options) {
    auto analysis = analyzeMultipleSymbols(symbols, portfolio_timeframe_, options);

    // Portfolio order, each symbol once
    std::vector<std::shared_ptr<const TrendPrediction>> predictions;
    std::set<std::string> seen;
    for (const auto& symbol : symbols) {
        auto it = analysis.predictions.find(symbol);
        if (it != analysis.predictions.end() && seen.insert(symbol).second) {
            predictions.push_back(it->second);
        }
    }

    try {
        return summarize(predictions);
    } catch (const common::NoPredictionsError& e) {
        LOG_ERROR("Portfolio trend analysis failed: " + std::string(e.what()));
        throw;
    }
}

PortfolioTrendAnalysis PortfolioAnalyzer::summarize(const std::vector<std::shared_ptr<const TrendPrediction>>& predictions) {
    if (predictions.empty()) {
        throw common::NoPredictionsError("No valid predictions available for portfolio analysis");
    }

    PortfolioTrendAnalysis summary;
    double total_confidence = 0.0;
    std::vector<std::string> all_risks;
    std::vector<std::string> all_catalysts;

    for (const auto& prediction : predictions) {
        switch (prediction->prediction.direction) {
            case Direction::BULLISH:
                summary.bullish_symbols.push_back(prediction->symbol);
                break;
            case Direction::BEARISH:
                summary.bearish_symbols.push_back(prediction->symbol);
                break;
            case Direction::SIDEWAYS:
                summary.neutral_symbols.push_back(prediction->symbol);
                break;
        }

        total_confidence += prediction->prediction.confidence;
        all_risks.insert(all_risks.end(), prediction->analysis.risks.begin(), prediction->analysis.risks.end());
        all_catalysts.insert(all_catalysts.end(), prediction->analysis.catalysts.begin(), prediction->analysis.catalysts.end());
    }

    double total = static_cast<double>(predictions.size());
    double bullish_ratio = summary.bullish_symbols.size() / total;
    double bearish_ratio = summary.bearish_symbols.size() / total;

    if (bullish_ratio > 0.6) {
        summary.overall_trend = PortfolioTrend::BULLISH;
    } else if (bearish_ratio > 0.6) {
        summary.overall_trend = PortfolioTrend::BEARISH;
    } else {
        summary.overall_trend = PortfolioTrend::MIXED;
    }

    summary.confidence = static_cast<int>(std::lround(total_confidence / total));
    summary.key_themes = extractKeyThemes(predictions);
    summary.risks = uniqueFirst(all_risks, MAX_PORTFOLIO_RISKS);
    summary.opportunities = uniqueFirst(all_catalysts, MAX_OPPORTUNITIES);
    summary.recommended_actions = generateRecommendations(predictions);

    return summary;
}

std::vector<std::string> PortfolioAnalyzer::extractKeyThemes(const std::vector<std::shared_ptr<const TrendPrediction>>& predictions) {
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& prediction : predictions) {
        for (const auto& factor : prediction->analysis.key_factors) {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&factor](const std::pair<std::string, int>& entry) {
                                       return entry.first == factor.factor;
                                   });
            if (it != counts.end()) {
                it->second++;
            } else {
                counts.emplace_back(factor.factor, 1);
            }
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const std::pair<std::string, int>& a, const std::pair<std::string, int>& b) {
                         return a.second > b.second;
                     });

    std::vector<std::string> themes;
    for (const auto& entry : counts) {
        if (themes.size() >= MAX_THEMES) {
            break;
        }
        themes.push_back(entry.first);
    }
    return themes;
}

std::vector<RecommendedAction> PortfolioAnalyzer::generateRecommendations(const std::vector<std::shared_ptr<const TrendPrediction>>& predictions) {
    std::vector<RecommendedAction> actions;

    for (const auto& prediction : predictions) {
        const auto& summary = prediction->prediction;
        std::string confidence = std::to_string(summary.confidence);
        Urgency trend_urgency = summary.strength == Strength::STRONG ? Urgency::HIGH : Urgency::MEDIUM;

        if (summary.direction == Direction::BULLISH && summary.confidence > 70) {
            actions.push_back({ActionType::ADD, prediction->symbol,
                               "Strong bullish trend with " + confidence + "% confidence", trend_urgency});
        } else if (summary.direction == Direction::BEARISH && summary.confidence > 70) {
            actions.push_back({ActionType::REDUCE, prediction->symbol,
                               "Bearish trend with " + confidence + "% confidence", trend_urgency});
        } else if (summary.confidence < 50) {
            actions.push_back({ActionType::HOLD, prediction->symbol,
                               "Low confidence in prediction (" + confidence + "%)", Urgency::LOW});
        }

        if (actions.size() >= MAX_ACTIONS) {
            break;
        }
    }

    return actions;
}

std::string portfolioTrendToString(PortfolioTrend trend) {
    switch (trend) {
        case PortfolioTrend::BULLISH: return "BULLISH";
        case PortfolioTrend::BEARISH: return "BEARISH";
        case PortfolioTrend::MIXED: return "MIXED";
    }
    return "MIXED";
}

std::string actionTypeToString(ActionType action) {
    switch (action) {
        case ActionType::BUY: return "BUY";
        case ActionType::SELL: return "SELL";
        case ActionType::HOLD: return "HOLD";
        case ActionType::REDUCE: return "REDUCE";
        case ActionType::ADD: return "ADD";
    }
    return "HOLD";
}

std::string urgencyToString(Urgency urgency) {
    switch (urgency) {
        case Urgency::HIGH: return "HIGH";
        case Urgency::MEDIUM: return "MEDIUM";
        case Urgency::LOW: return "LOW";
    }
    return "LOW";
}

json multiSymbolAnalysisToJson(const MultiSymbolTrendAnalysis& analysis) {
    json j;
    j["predictions"] = json::object();
    for (const auto& entry : analysis.predictions) {
        j["predictions"][entry.first] = prediction::trendPredictionToJson(*entry.second);
    }
    j["failures"] = analysis.failures;
    return j;
}

json portfolioAnalysisToJson(const PortfolioTrendAnalysis& analysis) {
    json j;
    j["overallTrend"] = portfolioTrendToString(analysis.overall_trend);
    j["confidence"] = analysis.confidence;
    j["bullishSymbols"] = analysis.bullish_symbols;
    j["bearishSymbols"] = analysis.bearish_symbols;
    j["neutralSymbols"] = analysis.neutral_symbols;
    j["keyThemes"] = analysis.key_themes;
    j["risks"] = analysis.risks;
    j["opportunities"] = analysis.opportunities;
    j["recommendedActions"] = json::array();
    for (const auto& action : analysis.recommended_actions) {
        j["recommendedActions"].push_back({
            {"action", actionTypeToString(action.action)},
            {"symbol", action.symbol},
            {"reason", action.reason},
            {"urgency", urgencyToString(action.urgency)}
        });
    }
    return j;
}

} // namespace portfolio
} // namespace trend_engine
