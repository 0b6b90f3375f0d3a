#include <numeric>

#include <gtest/gtest.h>

#include "trend_engine/prediction/trend_predictor.h"

using namespace trend_engine;
using namespace trend_engine::prediction;

namespace {

FactorScores allScores(double value) {
    FactorScores scores;
    scores.technical = value;
    scores.fundamental = value;
    scores.sentiment = value;
    scores.news = value;
    return scores;
}

} // namespace

TEST(TrendPredictorTest, NoFactorsGivesNeutralPrediction) {
    TrendPredictor predictor;
    auto summary = predictor.predict(0.0, FactorScores{});

    EXPECT_EQ(summary.direction, Direction::SIDEWAYS);
    EXPECT_EQ(summary.confidence, 50);
    EXPECT_EQ(summary.strength, Strength::WEAK);
    EXPECT_EQ(summary.probability.bullish, 50);
    EXPECT_EQ(summary.probability.bearish, 50);
    EXPECT_EQ(summary.probability.sideways, 0);
}

TEST(TrendPredictorTest, AgreeingFactorsGiveCappedConfidence) {
    TrendPredictor predictor;
    auto summary = predictor.predict(40.0, allScores(40.0));

    EXPECT_EQ(summary.direction, Direction::BULLISH);
    EXPECT_EQ(summary.confidence, 95);
    EXPECT_EQ(summary.strength, Strength::MODERATE);
    EXPECT_EQ(summary.probability.bullish, 82);
    EXPECT_EQ(summary.probability.bearish, 18);
    EXPECT_EQ(summary.probability.sideways, 0);
}

TEST(TrendPredictorTest, DisagreementRemovesConsensus) {
    FactorScores scores;
    scores.technical = 100.0;
    scores.news = -100.0;
    EXPECT_EQ(TrendPredictor::confidence(0.0, scores), 50);

    FactorScores single;
    single.sentiment = -30.0;
    // Absent factors count as 0: variance 168.75 leaves no consensus
    EXPECT_EQ(TrendPredictor::confidence(-7.5, single), 54);
}

TEST(TrendPredictorTest, MissingFactorsCountAsZero) {
    FactorScores technical_only;
    technical_only.technical = 40.0;

    FactorScores with_neutral_sentiment = technical_only;
    with_neutral_sentiment.sentiment = 0.0;

    // Overall 12: 50 + 6 with variance 300
    EXPECT_EQ(TrendPredictor::confidence(12.0, technical_only), 56);
    EXPECT_EQ(TrendPredictor::confidence(12.0, with_neutral_sentiment), 56);

    FactorScores all_neutral;
    all_neutral.news = 0.0;
    EXPECT_EQ(TrendPredictor::confidence(0.0, all_neutral), 80);
}

TEST(TrendPredictorTest, DirectionThresholdIsExclusive) {
    TrendPredictor predictor;
    EXPECT_EQ(predictor.direction(15.0), Direction::SIDEWAYS);
    EXPECT_EQ(predictor.direction(15.1), Direction::BULLISH);
    EXPECT_EQ(predictor.direction(-15.0), Direction::SIDEWAYS);
    EXPECT_EQ(predictor.direction(-15.1), Direction::BEARISH);

    common::PredictionConfig config;
    config.direction_threshold = 5.0;
    EXPECT_EQ(TrendPredictor(config).direction(6.0), Direction::BULLISH);
}

TEST(TrendPredictorTest, StrengthBands) {
    EXPECT_EQ(TrendPredictor::strengthClass(24.9), Strength::WEAK);
    EXPECT_EQ(TrendPredictor::strengthClass(-25.0), Strength::MODERATE);
    EXPECT_EQ(TrendPredictor::strengthClass(50.0), Strength::STRONG);
}

TEST(TrendPredictorTest, ProbabilitiesAlwaysSumToHundred) {
    for (double score = -120.0; score <= 120.0; score += 0.125) {
        auto p = TrendPredictor::probabilities(score);
        EXPECT_EQ(p.bullish + p.bearish + p.sideways, 100) << "score " << score;
        EXPECT_GE(p.sideways, 0) << "score " << score;
    }

    auto half = TrendPredictor::probabilities(0.625);
    EXPECT_EQ(half.bullish, 51);
    EXPECT_EQ(half.bearish, 49);
    EXPECT_EQ(half.sideways, 0);

    auto extreme = TrendPredictor::probabilities(-200.0);
    EXPECT_EQ(extreme.bullish, 0);
    EXPECT_EQ(extreme.bearish, 100);
}

TEST(TrendPredictorTest, KeyFactorsFollowFixedOrder) {
    CollectedInputs inputs;
    inputs.technical = std::vector<indicators::IndicatorResult>{};
    analysis::EarningsAnalysis earnings;
    earnings.assessment = analysis::EarningsAssessment::MISS;
    inputs.earnings = earnings;
    analysis::MarketSentiment sentiment;
    sentiment.sentiment_score = 10.0;
    inputs.sentiment = sentiment;
    inputs.news = analysis::NewsSentiment{};

    FactorScores scores;
    scores.technical = 30.0;
    scores.news = 40.0;

    auto factors = TrendPredictor::identifyKeyFactors(inputs, scores);
    ASSERT_EQ(factors.size(), 3u);
    EXPECT_EQ(factors[0].factor, "Technical Analysis");
    EXPECT_EQ(factors[0].impact, FactorImpact::POSITIVE);
    EXPECT_DOUBLE_EQ(factors[0].weight, 0.3);
    EXPECT_EQ(factors[1].factor, "Earnings Performance");
    EXPECT_EQ(factors[1].impact, FactorImpact::NEGATIVE);
    EXPECT_EQ(factors[2].factor, "News Coverage");
}

TEST(TrendPredictorTest, ScoreWithoutInputDoesNotMakeAFactor) {
    FactorScores scores;
    scores.technical = 90.0;
    EXPECT_TRUE(TrendPredictor::identifyKeyFactors(CollectedInputs{}, scores).empty());
}

TEST(TrendPredictorTest, ScenariosFollowDirection) {
    auto bullish = TrendPredictor::generateScenarios(Direction::BULLISH);
    ASSERT_EQ(bullish.size(), 3u);
    EXPECT_EQ(bullish[0].name, "Base Case");
    EXPECT_DOUBLE_EQ(bullish[0].price_impact, 8.0);
    EXPECT_EQ(bullish[1].name, "Bull Case");
    EXPECT_EQ(bullish[2].name, "Bear Case");

    int total = 0;
    for (const auto& scenario : bullish) {
        total += scenario.probability;
    }
    EXPECT_EQ(total, 100);

    EXPECT_DOUBLE_EQ(TrendPredictor::generateScenarios(Direction::BEARISH)[0].price_impact, -8.0);
    EXPECT_DOUBLE_EQ(TrendPredictor::generateScenarios(Direction::SIDEWAYS)[0].price_impact, 0.0);
}

TEST(TrendPredictorTest, RisksAreDeduplicatedAndCapped) {
    std::vector<KeyFactor> factors = {
        {"Technical Analysis", FactorImpact::NEGATIVE, 0.3, ""},
        {"Technical Analysis", FactorImpact::NEGATIVE, 0.3, ""},
        {"News Coverage", FactorImpact::POSITIVE, 0.15, ""},
    };
    auto scenarios = TrendPredictor::generateScenarios(Direction::SIDEWAYS);

    auto risks = TrendPredictor::identifyRisks(factors, scenarios);
    ASSERT_EQ(risks.size(), 5u);
    EXPECT_EQ(risks[0], "General market volatility");
    EXPECT_EQ(risks[3], "Risk in: Technical Analysis");
    EXPECT_EQ(risks[4], "Risk scenario: Bear Case");

    factors.push_back({"Market Sentiment", FactorImpact::NEGATIVE, 0.2, ""});
    risks = TrendPredictor::identifyRisks(factors, scenarios);
    ASSERT_EQ(risks.size(), TrendPredictor::MAX_RISKS);
    EXPECT_EQ(risks[4], "Risk in: Market Sentiment");
}

TEST(TrendPredictorTest, CatalystsIncludePositiveFactorsAndUpsideScenarios) {
    std::vector<KeyFactor> factors = {{"News Coverage", FactorImpact::POSITIVE, 0.15, ""}};
    auto catalysts = TrendPredictor::identifyCatalysts(factors, TrendPredictor::generateScenarios(Direction::BULLISH));

    ASSERT_EQ(catalysts.size(), 5u);
    EXPECT_EQ(catalysts[3], "Catalyst: News Coverage");
    EXPECT_EQ(catalysts[4], "Opportunity: Base Case");
}
