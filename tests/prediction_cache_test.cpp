#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "test_fakes.h"
#include "trend_engine/prediction/prediction_cache.h"

using namespace trend_engine;
using namespace trend_engine::prediction;
using std::chrono::milliseconds;
using std::chrono::minutes;

namespace {

std::shared_ptr<const TrendPrediction> makePrediction(const std::string& symbol) {
    auto prediction = std::make_shared<TrendPrediction>();
    prediction->symbol = symbol;
    prediction->timeframe = "1M";
    return prediction;
}

class PredictionCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<fakes::ManualClock> clock_ = std::make_shared<fakes::ManualClock>();
    InMemoryPredictionCache cache_{clock_};
};

} // namespace

TEST_F(PredictionCacheTest, ReturnsStoredObjectUntilExpiry) {
    auto prediction = makePrediction("AAPL");
    cache_.set("trend_prediction:AAPL", prediction, minutes(30));

    EXPECT_EQ(cache_.get("trend_prediction:AAPL"), prediction);

    clock_->advance(minutes(29));
    EXPECT_EQ(cache_.get("trend_prediction:AAPL"), prediction);

    clock_->advance(minutes(1));
    EXPECT_EQ(cache_.get("trend_prediction:AAPL"), nullptr);
}

TEST_F(PredictionCacheTest, NonPositiveTtlSkipsWrite) {
    cache_.set("key", makePrediction("KO"), milliseconds(0));
    EXPECT_EQ(cache_.get("key"), nullptr);
    EXPECT_EQ(cache_.getStats().entries, 0u);
}

TEST_F(PredictionCacheTest, SetReplacesExistingEntry) {
    cache_.set("key", makePrediction("KO"), minutes(5));
    auto newer = makePrediction("KO");
    cache_.set("key", newer, minutes(5));

    EXPECT_EQ(cache_.get("key"), newer);
    EXPECT_EQ(cache_.getStats().entries, 1u);
}

TEST_F(PredictionCacheTest, ClearByPrefixLeavesOtherKeys) {
    cache_.set("trend_prediction:AAPL:1M", makePrediction("AAPL"), minutes(5));
    cache_.set("trend_prediction:KO:1M", makePrediction("KO"), minutes(5));
    cache_.set("sentiment:market", makePrediction("MARKET"), minutes(5));

    EXPECT_EQ(cache_.clearByPrefix("trend_prediction:"), 2u);
    EXPECT_EQ(cache_.get("trend_prediction:KO:1M"), nullptr);
    EXPECT_NE(cache_.get("sentiment:market"), nullptr);
}

TEST_F(PredictionCacheTest, StatsCountHitsMissesAndLiveEntries) {
    cache_.set("short", makePrediction("AAPL"), minutes(1));
    cache_.set("long", makePrediction("KO"), minutes(10));

    cache_.get("short");
    cache_.get("long");
    cache_.get("absent");

    auto stats = cache_.getStats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.entries, 2u);

    clock_->advance(minutes(2));
    EXPECT_EQ(cache_.getStats().entries, 1u);
}
