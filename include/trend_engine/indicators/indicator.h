/**
 * Technical indicator records
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "trend_engine/common/clock.h"

namespace trend_engine {
namespace indicators {

// Trading signal emitted by an indicator
enum class TradeSignal {
    BUY,
    SELL,
    HOLD
};

// Indicator kind
enum class IndicatorKind {
    RSI,
    SMA,
    EMA,
    MACD,
    EXTREMES
};

// Persisted indicator value for one symbol at one point in time
struct IndicatorResult {
    std::string symbol;
    IndicatorKind kind = IndicatorKind::RSI;
    int period = 0;                      // 0 when the kind has no single period
    double primary_value = 0.0;
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;               // [0, 100]
    std::map<std::string, double> metadata;
    common::TimePoint timestamp;

    // Metadata value or fallback
    double meta(const std::string& key, double fallback = 0.0) const;
};

struct RsiIndicator {
    double value = 50.0;
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;
};

struct SmaIndicator {
    double sma20 = 0.0;
    double sma50 = 0.0;
    double sma200 = 0.0;
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;
};

struct EmaIndicator {
    double ema12 = 0.0;
    double ema26 = 0.0;
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;
};

struct MacdIndicator {
    double line = 0.0;
    double signal_line = 0.0;
    double histogram = 0.0;
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;
};

struct ExtremesIndicator {
    double year_high = 0.0;
    double year_low = 0.0;
    double current = 0.0;
    double distance_from_high = 0.0;     // percent, two decimals
    double distance_from_low = 0.0;      // percent, two decimals
    TradeSignal signal = TradeSignal::HOLD;
    double strength = 0.0;
};

// Everything computed for one symbol in one calculation
struct CalculatedIndicatorSet {
    std::string symbol;
    int rsi_period = 14;
    RsiIndicator rsi;
    SmaIndicator sma;
    EmaIndicator ema;
    MacdIndicator macd;
    ExtremesIndicator extremes;
};

// Split a calculated set into per-kind records stamped with `timestamp`,
// truncated to whole milliseconds
std::vector<IndicatorResult> toIndicatorResults(const CalculatedIndicatorSet& set,
                                                common::TimePoint timestamp);

// Convert signal to string
std::string tradeSignalToString(TradeSignal signal);

// Convert string to signal, throws std::invalid_argument
TradeSignal stringToTradeSignal(const std::string& str);

// Convert kind to string
std::string indicatorKindToString(IndicatorKind kind);

// Convert string to kind, throws std::invalid_argument
IndicatorKind stringToIndicatorKind(const std::string& str);

} // namespace indicators
} // namespace trend_engine
