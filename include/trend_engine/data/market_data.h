/**
 * Price history structures and providers
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace trend_engine {
namespace data {

// Daily bar
struct PriceBar {
    std::string date;   // YYYY-MM-DD
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;
};

// Supplies daily bars for a symbol, oldest first
class PriceHistoryProvider {
public:
    virtual ~PriceHistoryProvider() = default;

    // Trailing `days` bars in ascending date order
    virtual std::vector<PriceBar> getPriceHistory(const std::string& symbol, int days) = 0;
};

// Supplies the watchlist
class InstrumentProvider {
public:
    virtual ~InstrumentProvider() = default;

    virtual std::vector<std::string> getActiveSymbols() = 0;
};

// Fixed watchlist
class StaticInstrumentProvider : public InstrumentProvider {
public:
    explicit StaticInstrumentProvider(std::vector<std::string> symbols);

    std::vector<std::string> getActiveSymbols() override;

private:
    std::vector<std::string> symbols_;
};

// Drop bars carrying NaN or infinite prices
std::vector<PriceBar> sanitizePrices(const std::vector<PriceBar>& bars);

// Calendar days covered by a prediction timeframe (1W, 1M, 3M, 6M, 1Y); 0 if unknown
int timeframeDays(const std::string& timeframe);

} // namespace data
} // namespace trend_engine
