#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "test_fakes.h"
#include "trend_engine/indicators/batch_indicator_runner.h"

using namespace trend_engine;
using namespace trend_engine::indicators;
using std::chrono::hours;

namespace {

class BatchIndicatorRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        prices_ = std::make_shared<fakes::FakePriceProvider>();
        instruments_ = std::make_shared<fakes::FakeInstrumentProvider>();
        repository_ = std::make_shared<InMemoryIndicatorRepository>();
        limiter_ = std::make_shared<fakes::CountingRateLimiter>();
        clock_ = std::make_shared<fakes::ManualClock>();

        prices_->history["AAPL"] = fakes::makeBars(fakes::risingZigZag(200));
        prices_->history["KO"] = fakes::makeBars(fakes::risingZigZag(10));
        prices_->failing.insert("MSFT");
        instruments_->symbols = {"AAPL", "KO", "MSFT"};
    }

    std::unique_ptr<BatchIndicatorRunner> makeRunner() {
        return std::make_unique<BatchIndicatorRunner>(config_, prices_, instruments_, repository_, limiter_, clock_);
    }

    common::Config config_;
    std::shared_ptr<fakes::FakePriceProvider> prices_;
    std::shared_ptr<fakes::FakeInstrumentProvider> instruments_;
    std::shared_ptr<InMemoryIndicatorRepository> repository_;
    std::shared_ptr<fakes::CountingRateLimiter> limiter_;
    std::shared_ptr<fakes::ManualClock> clock_;
};

// Starts a second run from inside the first one
class ReentrantInstrumentProvider : public data::InstrumentProvider {
public:
    std::vector<std::string> getActiveSymbols() override {
        nested_result = runner->runAll();
        return {};
    }

    BatchIndicatorRunner* runner = nullptr;
    int nested_result = -1;
};

} // namespace

TEST_F(BatchIndicatorRunnerTest, RunAllSkipsShortAndFailingSymbols) {
    auto runner = makeRunner();

    EXPECT_EQ(runner->runAll(), 1);
    EXPECT_EQ(limiter_->calls.load(), 3);

    // Long enough for both the momentum and the yearly windows
    EXPECT_EQ(prices_->requested_days["AAPL"], 365);

    EXPECT_EQ(runner->getLatestIndicators("AAPL").size(), 5u);
    EXPECT_TRUE(runner->getLatestIndicators("KO").empty());

    auto status = runner->status();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.success_count, 1);
    EXPECT_EQ(status.error_count, 0);
    EXPECT_EQ(status.last_processed, 1);
    ASSERT_TRUE(status.last_run.has_value());
    EXPECT_EQ(*status.last_run, clock_->now());
}

TEST_F(BatchIndicatorRunnerTest, InstrumentListingFailureCountsAsError) {
    instruments_->fail = true;
    auto runner = makeRunner();

    EXPECT_EQ(runner->runAll(), 0);
    EXPECT_EQ(limiter_->calls.load(), 0);

    auto status = runner->status();
    EXPECT_EQ(status.error_count, 1);
    EXPECT_EQ(status.success_count, 0);
    EXPECT_FALSE(status.last_run.has_value());
}

TEST_F(BatchIndicatorRunnerTest, OverlappingRunIsSkipped) {
    auto reentrant = std::make_shared<ReentrantInstrumentProvider>();
    BatchIndicatorRunner runner(config_, prices_, reentrant, repository_, limiter_, clock_);
    reentrant->runner = &runner;

    EXPECT_EQ(runner.runAll(), 0);
    EXPECT_EQ(reentrant->nested_result, 0);
    EXPECT_EQ(runner.status().success_count, 1);
    EXPECT_FALSE(runner.status().running);
}

TEST_F(BatchIndicatorRunnerTest, RunSymbolReportsInsufficientData) {
    auto runner = makeRunner();

    EXPECT_TRUE(runner->runSymbol("AAPL"));
    EXPECT_FALSE(runner->runSymbol("KO"));
    EXPECT_THROW(runner->runSymbol("MSFT"), std::runtime_error);
}

TEST_F(BatchIndicatorRunnerTest, ActiveSignalsExcludeHold) {
    auto runner = makeRunner();
    runner->runSymbol("AAPL");

    auto signals = runner->getActiveSignals();
    ASSERT_FALSE(signals.empty());
    for (const auto& signal : signals) {
        EXPECT_NE(signal.signal, TradeSignal::HOLD);
    }
    for (size_t i = 1; i < signals.size(); ++i) {
        EXPECT_GE(signals[i - 1].strength, signals[i].strength);
    }
}

TEST_F(BatchIndicatorRunnerTest, CleanupHonorsRetentionWindow) {
    auto runner = makeRunner();
    runner->runSymbol("AAPL");

    clock_->advance(hours(24 * 30));
    EXPECT_EQ(runner->cleanupOldIndicators(), 0u);

    clock_->advance(hours(24 * 61));
    EXPECT_EQ(runner->cleanupOldIndicators(), 5u);
    EXPECT_EQ(runner->getStats().total, 0u);
}
