/**
 * News, market sentiment and earnings analyzers consumed as scored inputs
 */

#pragma once

#include <string>

namespace trend_engine {
namespace analysis {

// Categorical outcome of the latest earnings report
enum class EarningsAssessment {
    STRONG_BEAT,
    BEAT,
    MIXED,
    MISS,
    STRONG_MISS
};

struct NewsSentiment {
    double sentiment_score = 0.0;   // [-100, 100]
};

struct MarketSentiment {
    double sentiment_score = 0.0;   // [-100, 100]
};

struct MarketSentimentOptions {
    bool use_cache = true;
    bool include_news = true;
};

struct EarningsOptions {
    bool use_cache = true;
    bool deep_analysis = false;
};

struct EarningsAnalysis {
    EarningsAssessment assessment = EarningsAssessment::MIXED;
    int consecutive_beats = 0;
    int consecutive_misses = 0;
};

// Implementations may throw; callers treat any exception as a missing input
class NewsAnalyzer {
public:
    virtual ~NewsAnalyzer() = default;

    virtual NewsSentiment getNewsSentiment(const std::string& symbol) = 0;
};

class MarketSentimentAnalyzer {
public:
    virtual ~MarketSentimentAnalyzer() = default;

    virtual MarketSentiment getMarketSentiment(const MarketSentimentOptions& options) = 0;
};

class EarningsAnalyzer {
public:
    virtual ~EarningsAnalyzer() = default;

    virtual EarningsAnalysis analyzeEarnings(const std::string& symbol, const EarningsOptions& options) = 0;
};

// Convert assessment to string
std::string earningsAssessmentToString(EarningsAssessment assessment);

// Convert string to assessment, throws std::invalid_argument
EarningsAssessment stringToEarningsAssessment(const std::string& str);

} // namespace analysis
} // namespace trend_engine
