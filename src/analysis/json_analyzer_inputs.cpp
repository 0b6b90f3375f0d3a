/**
 * JSON analyzer inputs implementation
 */

#include <fstream>
#include <stdexcept>

#include "trend_engine/analysis/json_analyzer_inputs.h"
#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"

namespace trend_engine {
namespace analysis {

JsonAnalyzerInputs::JsonAnalyzerInputs(const json& document) {
    try {
        if (document.contains("market_sentiment") && document["market_sentiment"].is_number()) {
            market_sentiment_ = document["market_sentiment"].get<double>();
        }

        if (!document.contains("symbols")) {
            return;
        }

        for (const auto& item : document["symbols"].items()) {
            const auto& entry = item.value();

            if (entry.contains("news_sentiment") && entry["news_sentiment"].is_number()) {
                news_[item.key()] = entry["news_sentiment"].get<double>();
            }

            if (entry.contains("earnings") && entry["earnings"].is_object()) {
                const auto& earnings = entry["earnings"];
                EarningsAnalysis analysis;
                analysis.assessment = stringToEarningsAssessment(earnings.at("assessment").get<std::string>());
                analysis.consecutive_beats = earnings.value("consecutive_beats", 0);
                analysis.consecutive_misses = earnings.value("consecutive_misses", 0);
                earnings_[item.key()] = analysis;
            }
        }
    } catch (const json::exception& e) {
        throw common::DataError("Invalid analyzer inputs: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw common::DataError("Invalid analyzer inputs: " + std::string(e.what()));
    }
}

JsonAnalyzerInputs JsonAnalyzerInputs::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::DataError("Cannot open analyzer inputs " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw common::DataError("Cannot parse analyzer inputs " + path + ": " + e.what());
    }

    LOG_INFO("Loaded analyzer inputs from " + path);
    return JsonAnalyzerInputs(document);
}

NewsSentiment JsonAnalyzerInputs::getNewsSentiment(const std::string& symbol) {
    auto it = news_.find(symbol);
    if (it == news_.end()) {
        throw common::DataError("No news sentiment for " + symbol);
    }

    NewsSentiment sentiment;
    sentiment.sentiment_score = it->second;
    return sentiment;
}

MarketSentiment JsonAnalyzerInputs::getMarketSentiment(const MarketSentimentOptions& /*options*/) {
    if (!market_sentiment_) {
        throw common::DataError("No market sentiment available");
    }

    MarketSentiment sentiment;
    sentiment.sentiment_score = *market_sentiment_;
    return sentiment;
}

EarningsAnalysis JsonAnalyzerInputs::analyzeEarnings(const std::string& symbol,
                                                     const EarningsOptions& /*options*/) {
    auto it = earnings_.find(symbol);
    if (it == earnings_.end()) {
        throw common::DataError("No earnings analysis for " + symbol);
    }
    return it->second;
}

std::string earningsAssessmentToString(EarningsAssessment assessment) {
    switch (assessment) {
        case EarningsAssessment::STRONG_BEAT: return "STRONG_BEAT";
        case EarningsAssessment::BEAT: return "BEAT";
        case EarningsAssessment::MIXED: return "MIXED";
        case EarningsAssessment::MISS: return "MISS";
        case EarningsAssessment::STRONG_MISS: return "STRONG_MISS";
    }
    return "MIXED";
}

EarningsAssessment stringToEarningsAssessment(const std::string& str) {
    if (str == "STRONG_BEAT") {
        return EarningsAssessment::STRONG_BEAT;
    } else if (str == "BEAT") {
        return EarningsAssessment::BEAT;
    } else if (str == "MIXED") {
        return EarningsAssessment::MIXED;
    } else if (str == "MISS") {
        return EarningsAssessment::MISS;
    } else if (str == "STRONG_MISS") {
        return EarningsAssessment::STRONG_MISS;
    }
    throw std::invalid_argument("Unknown earnings assessment: " + str);
}

} // namespace analysis
} // namespace trend_engine
