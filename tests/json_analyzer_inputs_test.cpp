#include <gtest/gtest.h>

#include "trend_engine/analysis/json_analyzer_inputs.h"
#include "trend_engine/common/errors.h"

using namespace trend_engine;
using analysis::EarningsAssessment;
using analysis::JsonAnalyzerInputs;
using json = nlohmann::json;

namespace {

json sampleDocument() {
    return json::parse(R"({
        "market_sentiment": 12,
        "symbols": {
            "AAPL": {
                "news_sentiment": 35,
                "earnings": {"assessment": "STRONG_BEAT", "consecutive_beats": 3}
            },
            "KO": {"news_sentiment": -20}
        }
    })");
}

} // namespace

TEST(JsonAnalyzerInputsTest, ServesAllThreeInputs) {
    JsonAnalyzerInputs inputs(sampleDocument());

    EXPECT_DOUBLE_EQ(inputs.getMarketSentiment({}).sentiment_score, 12.0);
    EXPECT_DOUBLE_EQ(inputs.getNewsSentiment("AAPL").sentiment_score, 35.0);
    EXPECT_DOUBLE_EQ(inputs.getNewsSentiment("KO").sentiment_score, -20.0);

    auto earnings = inputs.analyzeEarnings("AAPL", {});
    EXPECT_EQ(earnings.assessment, EarningsAssessment::STRONG_BEAT);
    EXPECT_EQ(earnings.consecutive_beats, 3);
    EXPECT_EQ(earnings.consecutive_misses, 0);
}

TEST(JsonAnalyzerInputsTest, MissingEntriesAreDataErrors) {
    JsonAnalyzerInputs inputs(sampleDocument());

    EXPECT_THROW(inputs.getNewsSentiment("MSFT"), common::DataError);
    EXPECT_THROW(inputs.analyzeEarnings("KO", {}), common::DataError);

    JsonAnalyzerInputs empty(json::object());
    EXPECT_THROW(empty.getMarketSentiment({}), common::DataError);
}

TEST(JsonAnalyzerInputsTest, UnknownAssessmentRejectsDocument) {
    auto document = json::parse(R"({"symbols": {"AAPL": {"earnings": {"assessment": "GREAT"}}}})");
    EXPECT_THROW(JsonAnalyzerInputs inputs(document), common::DataError);
}

TEST(JsonAnalyzerInputsTest, MissingFileIsDataError) {
    EXPECT_THROW(JsonAnalyzerInputs::fromFile("/nonexistent/analyzer_inputs.json"), common::DataError);
}

TEST(EarningsAssessmentTest, StringConversion) {
    EXPECT_EQ(analysis::earningsAssessmentToString(EarningsAssessment::MISS), "MISS");
    EXPECT_EQ(analysis::stringToEarningsAssessment("STRONG_MISS"), EarningsAssessment::STRONG_MISS);
    EXPECT_THROW(analysis::stringToEarningsAssessment("beat"), std::invalid_argument);
}
