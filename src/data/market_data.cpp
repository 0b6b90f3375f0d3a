/**
 * Price history helpers
 */

#include <cmath>
#include <utility>

#include "trend_engine/data/market_data.h"

namespace trend_engine {
namespace data {

StaticInstrumentProvider::StaticInstrumentProvider(std::vector<std::string> symbols)
    : symbols_(std::move(symbols)) {
}

std::vector<std::string> StaticInstrumentProvider::getActiveSymbols() {
    return symbols_;
}

std::vector<PriceBar> sanitizePrices(const std::vector<PriceBar>& bars) {
    std::vector<PriceBar> clean;
    clean.reserve(bars.size());

    for (const auto& bar : bars) {
        if (std::isfinite(bar.open) && std::isfinite(bar.high) &&
            std::isfinite(bar.low) && std::isfinite(bar.close)) {
            clean.push_back(bar);
        }
    }

    return clean;
}

int timeframeDays(const std::string& timeframe) {
    if (timeframe == "1W") {
        return 7;
    } else if (timeframe == "1M") {
        return 30;
    } else if (timeframe == "3M") {
        return 90;
    } else if (timeframe == "6M") {
        return 180;
    } else if (timeframe == "1Y") {
        return 365;
    }
    return 0;
}

} // namespace data
} // namespace trend_engine
