#include <limits>
#include <memory>

#include <gtest/gtest.h>

#include "test_fakes.h"
#include "trend_engine/common/errors.h"
#include "trend_engine/portfolio/portfolio_analyzer.h"

using namespace trend_engine;
using namespace trend_engine::portfolio;
using prediction::Direction;
using prediction::Strength;
using prediction::TrendPrediction;

namespace {

class PortfolioAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        news_ = std::make_shared<fakes::FakeNewsAnalyzer>();
        deep_ = std::make_shared<fakes::FakeDeepAnalysisClient>();
        limiter_ = std::make_shared<fakes::CountingRateLimiter>();

        // News is the only input: +-100 crosses the direction threshold
        news_->scores["AAPL"] = 100.0;
        news_->scores["KO"] = -100.0;
        news_->scores["MSFT"] = 0.0;
        news_->scores["NVDA"] = std::numeric_limits<double>::quiet_NaN();

        prediction::PredictionCollaborators collaborators;
        collaborators.news = news_;
        collaborators.deep_analysis = deep_;
        collaborators.clock = std::make_shared<fakes::ManualClock>();
        service_ = std::make_shared<prediction::TrendPredictionService>(config_, collaborators);
    }

    // Full weight on news so a lone factor can cross the action thresholds
    common::Config config_ = common::Config::fromYamlString(R"(
prediction:
  weights:
    technical: 0
    fundamental: 0
    sentiment: 0
    news: 1
)");
    std::shared_ptr<fakes::FakeNewsAnalyzer> news_;
    std::shared_ptr<fakes::FakeDeepAnalysisClient> deep_;
    std::shared_ptr<fakes::CountingRateLimiter> limiter_;
    std::shared_ptr<prediction::TrendPredictionService> service_;
};

std::shared_ptr<const TrendPrediction> makePrediction(const std::string& symbol,
                                                      Direction direction,
                                                      int confidence,
                                                      Strength strength = Strength::MODERATE) {
    auto p = std::make_shared<TrendPrediction>();
    p->symbol = symbol;
    p->timeframe = "3M";
    p->prediction.direction = direction;
    p->prediction.confidence = confidence;
    p->prediction.strength = strength;
    return p;
}

std::shared_ptr<const TrendPrediction> withFactors(const std::string& symbol, std::vector<std::string> names) {
    auto p = std::make_shared<TrendPrediction>();
    p->symbol = symbol;
    p->prediction.confidence = 60;
    for (const auto& name : names) {
        p->analysis.key_factors.push_back({name, prediction::FactorImpact::POSITIVE, 0.1, ""});
    }
    return p;
}

} // namespace

TEST_F(PortfolioAnalyzerTest, MultiSymbolRecordsFailuresAndContinues) {
    PortfolioAnalyzer analyzer(config_, service_, limiter_);

    auto result = analyzer.analyzeMultipleSymbols({"AAPL", "KO", "MSFT", "NVDA"});

    ASSERT_EQ(result.predictions.size(), 3u);
    EXPECT_EQ(result.predictions["AAPL"]->prediction.direction, Direction::BULLISH);
    EXPECT_EQ(result.predictions["AAPL"]->timeframe, "1M");
    EXPECT_EQ(result.predictions["KO"]->prediction.direction, Direction::BEARISH);
    EXPECT_EQ(result.predictions["MSFT"]->prediction.direction, Direction::SIDEWAYS);

    ASSERT_EQ(result.failures.count("NVDA"), 1u);
    EXPECT_NE(result.failures["NVDA"].find("SCORING"), std::string::npos);

    // Batches of three
    EXPECT_EQ(limiter_->calls.load(), 2);
    // Never requested for batches
    EXPECT_EQ(deep_->calls.load(), 0);
    for (const auto& entry : result.predictions) {
        EXPECT_FALSE(entry.second->deep_analysis.has_value());
    }
}

TEST_F(PortfolioAnalyzerTest, EmptySymbolListDoesNothing) {
    PortfolioAnalyzer analyzer(config_, service_, limiter_);

    auto result = analyzer.analyzeMultipleSymbols({});
    EXPECT_TRUE(result.predictions.empty());
    EXPECT_TRUE(result.failures.empty());
    EXPECT_EQ(limiter_->calls.load(), 0);
}

TEST_F(PortfolioAnalyzerTest, UnknownTimeframeFailsEverySymbol) {
    PortfolioAnalyzer analyzer(config_, service_, limiter_);

    auto result = analyzer.analyzeMultipleSymbols({"AAPL", "KO"}, "2W");
    EXPECT_TRUE(result.predictions.empty());
    EXPECT_EQ(result.failures.size(), 2u);
}

TEST_F(PortfolioAnalyzerTest, PortfolioSummaryKeepsInputOrder) {
    PortfolioAnalyzer analyzer(config_, service_, limiter_);

    auto summary = analyzer.analyzePortfolioTrends({"MSFT", "AAPL", "AAPL", "KO", "NVDA"});

    EXPECT_EQ(summary.overall_trend, PortfolioTrend::MIXED);
    EXPECT_EQ(summary.bullish_symbols, std::vector<std::string>({"AAPL"}));
    EXPECT_EQ(summary.bearish_symbols, std::vector<std::string>({"KO"}));
    EXPECT_EQ(summary.neutral_symbols, std::vector<std::string>({"MSFT"}));
    // (80 + 90 + 90) / 3
    EXPECT_EQ(summary.confidence, 87);
    EXPECT_EQ(summary.key_themes, std::vector<std::string>({"News Coverage"}));
    EXPECT_LE(summary.risks.size(), 5u);
    EXPECT_LE(summary.opportunities.size(), 5u);

    ASSERT_EQ(summary.recommended_actions.size(), 2u);
    EXPECT_EQ(summary.recommended_actions[0].action, ActionType::ADD);
    EXPECT_EQ(summary.recommended_actions[0].symbol, "AAPL");
    EXPECT_EQ(summary.recommended_actions[0].urgency, Urgency::HIGH);
    EXPECT_EQ(summary.recommended_actions[0].reason, "Strong bullish trend with 90% confidence");
    EXPECT_EQ(summary.recommended_actions[1].action, ActionType::REDUCE);
    EXPECT_EQ(summary.recommended_actions[1].reason, "Bearish trend with 90% confidence");
}

TEST_F(PortfolioAnalyzerTest, PortfolioWithoutPredictionsThrows) {
    PortfolioAnalyzer analyzer(config_, service_, limiter_);
    EXPECT_THROW(analyzer.analyzePortfolioTrends({"NVDA"}), common::NoPredictionsError);
}

TEST(PortfolioSummaryTest, MajorityAboveSixtyPercentSetsTrend) {
    auto bullish = PortfolioAnalyzer::summarize({
        makePrediction("A", Direction::BULLISH, 60),
        makePrediction("B", Direction::BULLISH, 60),
        makePrediction("C", Direction::SIDEWAYS, 60),
    });
    EXPECT_EQ(bullish.overall_trend, PortfolioTrend::BULLISH);

    // Exactly 60% is not a majority
    auto mixed = PortfolioAnalyzer::summarize({
        makePrediction("A", Direction::BEARISH, 60),
        makePrediction("B", Direction::BEARISH, 60),
        makePrediction("C", Direction::BEARISH, 60),
        makePrediction("D", Direction::BULLISH, 60),
        makePrediction("E", Direction::SIDEWAYS, 60),
    });
    EXPECT_EQ(mixed.overall_trend, PortfolioTrend::MIXED);

    EXPECT_THROW(PortfolioAnalyzer::summarize({}), common::NoPredictionsError);
}

TEST(PortfolioSummaryTest, RecommendationRules) {
    auto actions = PortfolioAnalyzer::generateRecommendations({
        makePrediction("STRONG", Direction::BULLISH, 90, Strength::STRONG),
        makePrediction("EDGE", Direction::BULLISH, 70),
        makePrediction("UNSURE", Direction::BEARISH, 45),
        makePrediction("FLAT", Direction::SIDEWAYS, 60),
    });

    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].action, ActionType::ADD);
    EXPECT_EQ(actions[0].urgency, Urgency::HIGH);
    EXPECT_EQ(actions[0].reason, "Strong bullish trend with 90% confidence");
    EXPECT_EQ(actions[1].action, ActionType::HOLD);
    EXPECT_EQ(actions[1].symbol, "UNSURE");
    EXPECT_EQ(actions[1].urgency, Urgency::LOW);
    EXPECT_EQ(actions[1].reason, "Low confidence in prediction (45%)");
}

TEST(PortfolioSummaryTest, RecommendationsAreCapped) {
    std::vector<std::shared_ptr<const TrendPrediction>> predictions;
    for (int i = 0; i < 12; ++i) {
        predictions.push_back(makePrediction("S" + std::to_string(i), Direction::BULLISH, 80));
    }

    auto actions = PortfolioAnalyzer::generateRecommendations(predictions);
    ASSERT_EQ(actions.size(), 8u);
    EXPECT_EQ(actions[7].symbol, "S7");
}

TEST(PortfolioSummaryTest, ThemesRankByFrequencyThenFirstSeen) {
    auto themes = PortfolioAnalyzer::extractKeyThemes({
        withFactors("A", {"News Coverage", "Market Sentiment"}),
        withFactors("B", {"Technical Analysis", "Market Sentiment"}),
        withFactors("C", {"Earnings Performance", "Technical Analysis"}),
    });

    ASSERT_EQ(themes.size(), 4u);
    EXPECT_EQ(themes[0], "Market Sentiment");
    EXPECT_EQ(themes[1], "Technical Analysis");
    EXPECT_EQ(themes[2], "News Coverage");
    EXPECT_EQ(themes[3], "Earnings Performance");
}

TEST(PortfolioSummaryTest, JsonUsesWireNames) {
    auto summary = PortfolioAnalyzer::summarize({makePrediction("KO", Direction::BEARISH, 75)});
    auto j = portfolioAnalysisToJson(summary);

    EXPECT_EQ(j["overallTrend"], "BEARISH");
    EXPECT_EQ(j["confidence"], 75);
    EXPECT_EQ(j["bearishSymbols"][0], "KO");
    EXPECT_EQ(j["recommendedActions"][0]["action"], "REDUCE");
    EXPECT_EQ(j["recommendedActions"][0]["urgency"], "MEDIUM");
}
