/**
 * Technical indicator calculation
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "trend_engine/common/config.h"
#include "trend_engine/data/market_data.h"
#include "trend_engine/indicators/indicator.h"

namespace trend_engine {
namespace indicators {

/**
 * Computes RSI, SMA(20/50/200), EMA(12/26), MACD and 52-week extremes from a
 * daily price series and classifies each into a BUY/SELL/HOLD signal with a
 * strength in [0, 100]. Stateless; safe to share between threads.
 */
class IndicatorCalculator {
public:
    explicit IndicatorCalculator(const common::Config& config = common::Config());
    ~IndicatorCalculator() = default;

    /**
     * Full indicator set for `symbol` from ascending bars. Non-finite bars are
     * dropped first; returns nullopt when fewer than `min_bars` remain.
     * Momentum indicators use the trailing `history_days` bars, extremes the
     * trailing `extremes_window_days` bars.
     */
    std::optional<CalculatedIndicatorSet> calculate(const std::string& symbol,
                                                    const std::vector<data::PriceBar>& prices) const;

    // Wilder RSI; neutral (50, HOLD, 0) with fewer than period + 1 closes
    RsiIndicator calculateRSI(const std::vector<double>& closes, int period = 14) const;

    SmaIndicator calculateSMA(const std::vector<double>& closes) const;

    EmaIndicator calculateEMA(const std::vector<double>& closes) const;

    MacdIndicator calculateMACD(const std::vector<double>& closes) const;

    ExtremesIndicator calculateExtremes(const std::vector<data::PriceBar>& window, double current_price) const;

    // Trailing mean, or the latest close when history is shorter than period
    static double singleSMA(const std::vector<double>& closes, int period);

    // EMA seeded with the first close, or the latest close when history is shorter than period
    static double singleEMA(const std::vector<double>& closes, int period);

    // Signal policies
    static RsiIndicator classifyRSI(double rsi);
    static SmaIndicator classifySMA(double price, double sma20, double sma50, double sma200);
    static EmaIndicator classifyEMA(double ema12, double ema26);
    static MacdIndicator classifyMACD(double line, double signal_line);
    static ExtremesIndicator classifyExtremes(double year_high, double year_low, double current);

    // MACD signal line: fixed 0.9 fraction of the MACD line
    static constexpr double MACD_SIGNAL_FACTOR = 0.9;

private:
    int rsi_period_;
    int history_days_;
    int extremes_window_days_;
    int min_bars_;
};

} // namespace indicators
} // namespace trend_engine
