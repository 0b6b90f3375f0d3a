/**
 * Technical indicator record helpers
 */

#include <chrono>
#include <stdexcept>

#include "trend_engine/indicators/indicator.h"

namespace trend_engine {
namespace indicators {

double IndicatorResult::meta(const std::string& key, double fallback) const {
    auto it = metadata.find(key);
    return it != metadata.end() ? it->second : fallback;
}

std::vector<IndicatorResult> toIndicatorResults(const CalculatedIndicatorSet& set,
                                                common::TimePoint timestamp) {
    // Millisecond resolution, matching the persisted form
    timestamp = std::chrono::floor<std::chrono::milliseconds>(timestamp);

    std::vector<IndicatorResult> results;

    IndicatorResult rsi;
    rsi.symbol = set.symbol;
    rsi.kind = IndicatorKind::RSI;
    rsi.period = set.rsi_period;
    rsi.primary_value = set.rsi.value;
    rsi.signal = set.rsi.signal;
    rsi.strength = set.rsi.strength;
    rsi.metadata = {{"rsiValue", set.rsi.value}};
    rsi.timestamp = timestamp;
    results.push_back(rsi);

    IndicatorResult sma;
    sma.symbol = set.symbol;
    sma.kind = IndicatorKind::SMA;
    sma.primary_value = set.sma.sma20;
    sma.signal = set.sma.signal;
    sma.strength = set.sma.strength;
    sma.metadata = {
        {"sma20", set.sma.sma20},
        {"sma50", set.sma.sma50},
        {"sma200", set.sma.sma200}
    };
    sma.timestamp = timestamp;
    results.push_back(sma);

    IndicatorResult ema;
    ema.symbol = set.symbol;
    ema.kind = IndicatorKind::EMA;
    ema.primary_value = set.ema.ema12;
    ema.signal = set.ema.signal;
    ema.strength = set.ema.strength;
    ema.metadata = {
        {"ema12", set.ema.ema12},
        {"ema26", set.ema.ema26}
    };
    ema.timestamp = timestamp;
    results.push_back(ema);

    IndicatorResult macd;
    macd.symbol = set.symbol;
    macd.kind = IndicatorKind::MACD;
    macd.primary_value = set.macd.line;
    macd.signal = set.macd.signal;
    macd.strength = set.macd.strength;
    macd.metadata = {
        {"macdLine", set.macd.line},
        {"macdSignal", set.macd.signal_line},
        {"macdHistogram", set.macd.histogram}
    };
    macd.timestamp = timestamp;
    results.push_back(macd);

    // Extremes only when a yearly range exists
    if (set.extremes.year_high > 0.0) {
        IndicatorResult extremes;
        extremes.symbol = set.symbol;
        extremes.kind = IndicatorKind::EXTREMES;
        extremes.primary_value = set.extremes.current;
        extremes.signal = set.extremes.signal;
        extremes.strength = set.extremes.strength;
        extremes.metadata = {
            {"yearHigh", set.extremes.year_high},
            {"yearLow", set.extremes.year_low},
            {"distanceFromHigh", set.extremes.distance_from_high},
            {"distanceFromLow", set.extremes.distance_from_low}
        };
        extremes.timestamp = timestamp;
        results.push_back(extremes);
    }

    return results;
}

std::string tradeSignalToString(TradeSignal signal) {
    switch (signal) {
        case TradeSignal::BUY: return "BUY";
        case TradeSignal::SELL: return "SELL";
        case TradeSignal::HOLD: return "HOLD";
    }
    return "HOLD";
}

TradeSignal stringToTradeSignal(const std::string& str) {
    if (str == "BUY") {
        return TradeSignal::BUY;
    } else if (str == "SELL") {
        return TradeSignal::SELL;
    } else if (str == "HOLD") {
        return TradeSignal::HOLD;
    }
    throw std::invalid_argument("Unknown trade signal: " + str);
}

std::string indicatorKindToString(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::RSI: return "RSI";
        case IndicatorKind::SMA: return "SMA";
        case IndicatorKind::EMA: return "EMA";
        case IndicatorKind::MACD: return "MACD";
        case IndicatorKind::EXTREMES: return "EXTREMES";
    }
    return "RSI";
}

IndicatorKind stringToIndicatorKind(const std::string& str) {
    if (str == "RSI") {
        return IndicatorKind::RSI;
    } else if (str == "SMA") {
        return IndicatorKind::SMA;
    } else if (str == "EMA") {
        return IndicatorKind::EMA;
    } else if (str == "MACD") {
        return IndicatorKind::MACD;
    } else if (str == "EXTREMES") {
        return IndicatorKind::EXTREMES;
    }
    throw std::invalid_argument("Unknown indicator kind: " + str);
}

} // namespace indicators
} // namespace trend_engine
