/**
 * Exception types raised by the trend engine
 */

#pragma once

#include <stdexcept>
#include <string>

namespace trend_engine {
namespace common {

// Root of all engine errors
class TrendEngineError : public std::runtime_error {
public:
    explicit TrendEngineError(const std::string& message)
        : std::runtime_error(message) {
    }
};

// Invalid or unreadable configuration
class ConfigError : public TrendEngineError {
public:
    explicit ConfigError(const std::string& message)
        : TrendEngineError(message) {
    }
};

// Unreadable price or analyzer input
class DataError : public TrendEngineError {
public:
    explicit DataError(const std::string& message)
        : TrendEngineError(message) {
    }
};

// Failure while combining factor scores into a prediction
class AggregationError : public TrendEngineError {
public:
    AggregationError(const std::string& symbol,
                     const std::string& timeframe,
                     const std::string& stage,
                     const std::string& message)
        : TrendEngineError("Trend prediction failed for " + symbol + " (" + timeframe +
                           ") during " + stage + ": " + message),
          symbol_(symbol),
          timeframe_(timeframe),
          stage_(stage) {
    }

    const std::string& symbol() const { return symbol_; }
    const std::string& timeframe() const { return timeframe_; }
    const std::string& stage() const { return stage_; }

private:
    std::string symbol_;
    std::string timeframe_;
    std::string stage_;
};

// Portfolio analysis with no usable prediction
class NoPredictionsError : public TrendEngineError {
public:
    explicit NoPredictionsError(const std::string& message)
        : TrendEngineError(message) {
    }
};

} // namespace common
} // namespace trend_engine
