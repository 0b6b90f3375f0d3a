/**
 * Trend prediction service implementation
 */

#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>

#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/common/settled.h"
#include "trend_engine/prediction/prediction_json.h"
#include "trend_engine/prediction/trend_prediction_service.h"

namespace trend_engine {
namespace prediction {

namespace {

// Value of a settled input, or empty after logging why it is missing
template <typename T>
std::optional<T> harvest(std::future<common::Settled<T>>& pending,
                         const std::string& input,
                         const std::string& symbol) {
    if (!pending.valid()) {
        return std::nullopt;
    }

    auto settled = pending.get();
    if (!settled.ok()) {
        LOG_WARNING("Failed to get " + input + " for " + symbol + ": " + settled.error);
        return std::nullopt;
    }
    return std::move(settled.value);
}

} // namespace

TrendPredictionService::TrendPredictionService(const common::Config& config,
                                               PredictionCollaborators collaborators)
    : aggregator_(config.getPredictionConfig().weights),
      predictor_(config.getPredictionConfig()),
      collaborators_(std::move(collaborators)) {

    if (!collaborators_.clock) {
        collaborators_.clock = std::make_shared<common::SystemClock>();
    }
    if (!collaborators_.cache) {
        collaborators_.cache = std::make_shared<InMemoryPredictionCache>(collaborators_.clock);
    }

    LOG_INFO("Trend prediction service initialized");
}

std::shared_ptr<const TrendPrediction> TrendPredictionService::predictTrend(const std::string& symbol,
                                                                            const std::string& timeframe,
                                                                            const PredictionOptions& options) {
    if (data::timeframeDays(timeframe) <= 0) {
        throw std::invalid_argument("Unknown timeframe: " + timeframe);
    }

    auto started = std::chrono::steady_clock::now();
    std::string key = cacheKey(symbol, timeframe, options);

    if (options.use_cache) {
        try {
            auto cached = collaborators_.cache->get(key);
            if (cached) {
                LOG_INFO("Trend prediction served from cache for " + symbol + " (" + timeframe + ")");
                return cached;
            }
        } catch (const std::exception& e) {
            LOG_WARNING("Prediction cache read failed for " + key + ": " + e.what());
        }
    }

    PredictionStage stage = PredictionStage::COLLECTING;
    CollectedInputs inputs = collectInputs(symbol, timeframe, options);

    auto result = std::make_shared<TrendPrediction>();
    result->symbol = symbol;
    result->timeframe = timeframe;

    try {
        stage = PredictionStage::SCORING;
        result->analysis.factor_scores = aggregator_.score(inputs);
        result->analysis.overall_score = aggregator_.overallScore(result->analysis.factor_scores);

        stage = PredictionStage::PREDICTING;
        result->prediction = predictor_.predict(result->analysis.overall_score, result->analysis.factor_scores);
        result->analysis.key_factors = TrendPredictor::identifyKeyFactors(inputs, result->analysis.factor_scores);
        if (options.include_scenarios) {
            result->scenarios = TrendPredictor::generateScenarios(result->prediction.direction);
        }
        result->analysis.risks = TrendPredictor::identifyRisks(result->analysis.key_factors, result->scenarios);
        result->analysis.catalysts = TrendPredictor::identifyCatalysts(result->analysis.key_factors, result->scenarios);
    } catch (const std::exception& e) {
        LOG_ERROR("Trend prediction failed for " + symbol + " (" + timeframe + ") during " +
                  predictionStageToString(stage) + ": " + e.what());
        throw common::AggregationError(symbol, timeframe, predictionStageToString(stage), e.what());
    }

    if (options.deep_analysis && collaborators_.deep_analysis) {
        DeepAnalysisRequest request;
        request.symbol = symbol;
        request.timeframe = timeframe;
        request.prediction = result->prediction;
        request.scores = result->analysis.factor_scores;
        request.overall_score = result->analysis.overall_score;
        request.key_factors = result->analysis.key_factors;
        request.scenarios = result->scenarios;
        result->deep_analysis = runDeepAnalysis(*collaborators_.deep_analysis, request);
    }

    result->last_updated = collaborators_.clock->now();

    stage = PredictionStage::CACHING;
    if (options.use_cache) {
        try {
            collaborators_.cache->set(key, result, std::chrono::minutes(options.cache_ttl_minutes));
        } catch (const std::exception& e) {
            LOG_WARNING("Prediction cache write failed for " + key + ": " + e.what());
        }
    }

    predictions_computed_++;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO("Trend prediction completed for " + symbol + " (" + timeframe + "): " +
             directionToString(result->prediction.direction) + ", confidence " +
             std::to_string(result->prediction.confidence) + ", overall " +
             std::to_string(result->analysis.overall_score) + " in " +
             std::to_string(elapsed.count()) + "ms");

    return result;
}

CollectedInputs TrendPredictionService::collectInputs(const std::string& symbol,
                                                      const std::string& timeframe,
                                                      const PredictionOptions& options) {
    using IndicatorList = std::vector<indicators::IndicatorResult>;
    using PriceList = std::vector<data::PriceBar>;

    std::future<common::Settled<IndicatorList>> technical;
    std::future<common::Settled<analysis::NewsSentiment>> news;
    std::future<common::Settled<analysis::MarketSentiment>> sentiment;
    std::future<common::Settled<analysis::EarningsAnalysis>> earnings;
    std::future<common::Settled<PriceList>> prices;

    auto indicator_repository = collaborators_.indicators;
    if (indicator_repository) {
        technical = common::settleAsync([indicator_repository, symbol]() {
            return indicator_repository->getLatestIndicators(symbol);
        });
    }

    auto news_analyzer = collaborators_.news;
    if (options.include_news && news_analyzer) {
        news = common::settleAsync([news_analyzer, symbol]() {
            return news_analyzer->getNewsSentiment(symbol);
        });
    }

    auto sentiment_analyzer = collaborators_.sentiment;
    if (options.include_sentiment && sentiment_analyzer) {
        sentiment = common::settleAsync([sentiment_analyzer]() {
            analysis::MarketSentimentOptions sentiment_options;
            sentiment_options.use_cache = true;
            sentiment_options.include_news = true;
            return sentiment_analyzer->getMarketSentiment(sentiment_options);
        });
    }

    auto earnings_analyzer = collaborators_.earnings;
    if (options.include_earnings && earnings_analyzer) {
        earnings = common::settleAsync([earnings_analyzer, symbol]() {
            analysis::EarningsOptions earnings_options;
            earnings_options.use_cache = true;
            earnings_options.deep_analysis = false;
            return earnings_analyzer->analyzeEarnings(symbol, earnings_options);
        });
    }

    auto price_provider = collaborators_.prices;
    if (price_provider) {
        int days = data::timeframeDays(timeframe);
        prices = common::settleAsync([price_provider, symbol, days]() {
            return data::sanitizePrices(price_provider->getPriceHistory(symbol, days));
        });
    }

    CollectedInputs inputs;
    inputs.technical = harvest(technical, "technical indicators", symbol);
    inputs.news = harvest(news, "news sentiment", symbol);
    inputs.sentiment = harvest(sentiment, "market sentiment", symbol);
    inputs.earnings = harvest(earnings, "earnings analysis", symbol);
    inputs.prices = harvest(prices, "price history", symbol);

    if (inputs.technical && inputs.technical->empty()) {
        LOG_DEBUG("No stored indicators for " + symbol);
    }

    return inputs;
}

ServiceStats TrendPredictionService::getStats() {
    ServiceStats stats;
    stats.cache = collaborators_.cache->getStats();
    stats.predictions_computed = predictions_computed_.load();
    return stats;
}

size_t TrendPredictionService::clearCache() {
    size_t removed = collaborators_.cache->clearByPrefix(std::string(CACHE_PREFIX) + ":");
    LOG_INFO("Trend prediction cache cleared, removed " + std::to_string(removed) + " entries");
    return removed;
}

std::string TrendPredictionService::cacheKey(const std::string& symbol,
                                             const std::string& timeframe,
                                             const PredictionOptions& options) {
    return std::string(CACHE_PREFIX) + ":" + symbol + ":" + timeframe + ":" +
           predictionOptionsToJson(options).dump();
}

} // namespace prediction
} // namespace trend_engine
