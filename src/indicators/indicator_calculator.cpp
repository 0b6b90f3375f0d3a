/**
 * Technical indicator calculation implementation
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <ta-lib/ta_libc.h>

#include "trend_engine/common/logging.h"
#include "trend_engine/indicators/indicator_calculator.h"

namespace trend_engine {
namespace indicators {

namespace {

// TA-Lib global state, initialized once per process
class TaLibRuntime {
public:
    TaLibRuntime() {
        TA_RetCode retCode = TA_Initialize();
        if (retCode != TA_SUCCESS) {
            throw std::runtime_error("Failed to initialize TA-Lib, code " + std::to_string(retCode));
        }
    }

    ~TaLibRuntime() {
        TA_Shutdown();
    }
};

void ensureTaLib() {
    static TaLibRuntime runtime;
    (void)runtime;
}

double clamp(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

IndicatorCalculator::IndicatorCalculator(const common::Config& config)
    : rsi_period_(config.getIndicatorConfig().rsi_period),
      history_days_(config.getIndicatorConfig().history_days),
      extremes_window_days_(config.getIndicatorConfig().extremes_window_days),
      min_bars_(config.getIndicatorConfig().min_bars) {
}

std::optional<CalculatedIndicatorSet> IndicatorCalculator::calculate(
    const std::string& symbol,
    const std::vector<data::PriceBar>& prices) const {

    auto bars = data::sanitizePrices(prices);
    if (bars.size() < prices.size()) {
        LOG_WARNING("Dropped " + std::to_string(prices.size() - bars.size()) +
                    " non-finite price bars for " + symbol);
    }

    if (bars.size() < static_cast<size_t>(min_bars_)) {
        LOG_WARNING("Insufficient price data for " + symbol + ": " +
                    std::to_string(bars.size()) + " days");
        return std::nullopt;
    }

    // Trailing windows
    size_t history = std::min(bars.size(), static_cast<size_t>(history_days_));
    std::vector<double> closes;
    closes.reserve(history);
    for (size_t i = bars.size() - history; i < bars.size(); ++i) {
        closes.push_back(bars[i].close);
    }

    size_t extremes_window = std::min(bars.size(), static_cast<size_t>(extremes_window_days_));
    std::vector<data::PriceBar> year(bars.end() - extremes_window, bars.end());

    CalculatedIndicatorSet set;
    set.symbol = symbol;
    set.rsi_period = rsi_period_;
    set.rsi = calculateRSI(closes, rsi_period_);
    set.sma = calculateSMA(closes);
    set.ema = calculateEMA(closes);
    set.macd = calculateMACD(closes);
    set.extremes = calculateExtremes(year, closes.back());

    return set;
}

RsiIndicator IndicatorCalculator::calculateRSI(const std::vector<double>& closes, int period) const {
    if (period <= 0 || closes.size() < static_cast<size_t>(period) + 1) {
        return RsiIndicator{};
    }

    ensureTaLib();

    // Full history so the Wilder smoothing starts from the first delta
    int dataSize = static_cast<int>(closes.size());
    std::vector<double> outReal(closes.size());
    int outBegIdx = 0;
    int outNbElement = 0;

    TA_RetCode retCode = TA_RSI(0, dataSize - 1, closes.data(), period,
                                &outBegIdx, &outNbElement, outReal.data());

    if (retCode != TA_SUCCESS || outNbElement <= 0) {
        LOG_WARNING("TA_RSI failed with code " + std::to_string(retCode));
        return RsiIndicator{};
    }

    double rsi = clamp(outReal[outNbElement - 1], 0.0, 100.0);
    return classifyRSI(rsi);
}

SmaIndicator IndicatorCalculator::calculateSMA(const std::vector<double>& closes) const {
    double sma20 = singleSMA(closes, 20);
    double sma50 = singleSMA(closes, 50);
    double sma200 = singleSMA(closes, 200);

    return classifySMA(closes.back(), sma20, sma50, sma200);
}

EmaIndicator IndicatorCalculator::calculateEMA(const std::vector<double>& closes) const {
    return classifyEMA(singleEMA(closes, 12), singleEMA(closes, 26));
}

MacdIndicator IndicatorCalculator::calculateMACD(const std::vector<double>& closes) const {
    double line = singleEMA(closes, 12) - singleEMA(closes, 26);

    return classifyMACD(line, line * MACD_SIGNAL_FACTOR);
}

ExtremesIndicator IndicatorCalculator::calculateExtremes(const std::vector<data::PriceBar>& window,
                                                         double current_price) const {
    double year_high = current_price;
    double year_low = current_price;

    if (window.size() >= 2) {
        ensureTaLib();

        std::vector<double> highs;
        std::vector<double> lows;
        highs.reserve(window.size());
        lows.reserve(window.size());
        for (const auto& bar : window) {
            highs.push_back(bar.high);
            lows.push_back(bar.low);
        }

        // One output: the extreme over the whole window
        int last = static_cast<int>(window.size()) - 1;
        int period = static_cast<int>(window.size());
        double outMax = 0.0;
        double outMin = 0.0;
        int outBegIdx = 0;
        int outNbElement = 0;

        TA_RetCode retCode = TA_MAX(last, last, highs.data(), period,
                                    &outBegIdx, &outNbElement, &outMax);
        if (retCode == TA_SUCCESS && outNbElement == 1) {
            year_high = outMax;
        }

        retCode = TA_MIN(last, last, lows.data(), period,
                         &outBegIdx, &outNbElement, &outMin);
        if (retCode == TA_SUCCESS && outNbElement == 1) {
            year_low = outMin;
        }
    } else if (window.size() == 1) {
        year_high = window.front().high;
        year_low = window.front().low;
    }

    return classifyExtremes(year_high, year_low, current_price);
}

double IndicatorCalculator::singleSMA(const std::vector<double>& closes, int period) {
    if (closes.empty()) {
        return 0.0;
    }
    if (period <= 0 || closes.size() < static_cast<size_t>(period)) {
        return closes.back();
    }

    ensureTaLib();

    int last = static_cast<int>(closes.size()) - 1;
    double outReal = 0.0;
    int outBegIdx = 0;
    int outNbElement = 0;

    TA_RetCode retCode = TA_SMA(last, last, closes.data(), period,
                                &outBegIdx, &outNbElement, &outReal);
    if (retCode != TA_SUCCESS || outNbElement != 1) {
        LOG_WARNING("TA_SMA failed with code " + std::to_string(retCode));
        return closes.back();
    }

    return outReal;
}

double IndicatorCalculator::singleEMA(const std::vector<double>& closes, int period) {
    if (closes.empty()) {
        return 0.0;
    }
    if (period <= 0 || closes.size() < static_cast<size_t>(period)) {
        return closes.back();
    }

    double multiplier = 2.0 / (period + 1);
    double ema = closes.front();

    for (size_t i = 1; i < closes.size(); ++i) {
        ema = (closes[i] * multiplier) + (ema * (1.0 - multiplier));
    }

    return ema;
}

RsiIndicator IndicatorCalculator::classifyRSI(double rsi) {
    RsiIndicator result;
    result.value = rsi;

    double strength = 0.0;
    if (rsi <= 30.0) {
        result.signal = TradeSignal::BUY;
        strength = clamp((30.0 - rsi) * 3.0, 0.0, 100.0);
    } else if (rsi >= 70.0) {
        result.signal = TradeSignal::SELL;
        strength = clamp((rsi - 70.0) * 3.0, 0.0, 100.0);
    } else {
        result.signal = TradeSignal::HOLD;
        strength = std::fabs(50.0 - rsi) / 2.0;
    }

    result.strength = std::round(strength);
    return result;
}

SmaIndicator IndicatorCalculator::classifySMA(double price, double sma20, double sma50, double sma200) {
    SmaIndicator result;
    result.sma20 = sma20;
    result.sma50 = sma50;
    result.sma200 = sma200;

    if (price > sma20 && sma20 > sma50 && sma50 > sma200) {
        // Full bullish alignment
        result.signal = TradeSignal::BUY;
        result.strength = 85.0;
    } else if (price < sma20 && sma20 < sma50 && sma50 < sma200) {
        // Full bearish alignment
        result.signal = TradeSignal::SELL;
        result.strength = 85.0;
    } else if (price > sma20 && sma20 > sma50) {
        result.signal = TradeSignal::BUY;
        result.strength = 60.0;
    } else if (price < sma20 && sma20 < sma50) {
        result.signal = TradeSignal::SELL;
        result.strength = 60.0;
    } else if (price > sma20) {
        result.signal = TradeSignal::BUY;
        result.strength = 30.0;
    } else if (price < sma20) {
        result.signal = TradeSignal::SELL;
        result.strength = 30.0;
    } else {
        result.signal = TradeSignal::HOLD;
        result.strength = 0.0;
    }

    return result;
}

EmaIndicator IndicatorCalculator::classifyEMA(double ema12, double ema26) {
    EmaIndicator result;
    result.ema12 = ema12;
    result.ema26 = ema26;

    double spread = ema26 != 0.0 ? ((ema12 - ema26) / ema26) * 100.0 : 0.0;

    double strength = 0.0;
    if (spread > 0.5) {
        result.signal = TradeSignal::BUY;
        strength = std::min(100.0, std::fabs(spread) * 20.0);
    } else if (spread < -0.5) {
        result.signal = TradeSignal::SELL;
        strength = std::min(100.0, std::fabs(spread) * 20.0);
    } else {
        result.signal = TradeSignal::HOLD;
        strength = std::fabs(spread) * 10.0;
    }

    result.strength = std::round(strength);
    return result;
}

MacdIndicator IndicatorCalculator::classifyMACD(double line, double signal_line) {
    MacdIndicator result;
    result.line = line;
    result.signal_line = signal_line;
    result.histogram = line - signal_line;

    double strength = 0.0;
    if (result.histogram > 0.0 && line > 0.0) {
        result.signal = TradeSignal::BUY;
        strength = std::min(100.0, std::fabs(result.histogram) * 1000.0);
    } else if (result.histogram < 0.0 && line < 0.0) {
        result.signal = TradeSignal::SELL;
        strength = std::min(100.0, std::fabs(result.histogram) * 1000.0);
    } else {
        result.signal = TradeSignal::HOLD;
        strength = std::min(100.0, std::fabs(result.histogram) * 500.0);
    }

    result.strength = std::round(strength);
    return result;
}

ExtremesIndicator IndicatorCalculator::classifyExtremes(double year_high, double year_low, double current) {
    ExtremesIndicator result;
    result.current = current;

    // No usable range: report the current price as both extremes
    if (!std::isfinite(year_high) || !std::isfinite(year_low) || year_high <= 0.0 || year_low <= 0.0) {
        result.year_high = current;
        result.year_low = current;
        result.signal = TradeSignal::HOLD;
        result.strength = 0.0;
        return result;
    }

    result.year_high = year_high;
    result.year_low = year_low;

    double distance_from_high = ((year_high - current) / year_high) * 100.0;
    double distance_from_low = ((current - year_low) / year_low) * 100.0;

    double strength = 0.0;
    if (distance_from_low < 15.0) {
        // Near the yearly low
        result.signal = TradeSignal::BUY;
        strength = std::max(0.0, 100.0 - (distance_from_low * 5.0));
    } else if (distance_from_high < 5.0) {
        // Near the yearly high
        result.signal = TradeSignal::SELL;
        strength = std::max(0.0, 100.0 - (distance_from_high * 10.0));
    } else {
        result.signal = TradeSignal::HOLD;
        strength = std::min(distance_from_low, distance_from_high) / 2.0;
    }

    result.distance_from_high = roundTo2(distance_from_high);
    result.distance_from_low = roundTo2(distance_from_low);
    result.strength = std::round(clamp(strength, 0.0, 100.0));
    return result;
}

} // namespace indicators
} // namespace trend_engine
