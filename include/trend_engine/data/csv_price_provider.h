/**
 * Price history read from per-symbol CSV files
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "trend_engine/data/market_data.h"

namespace trend_engine {
namespace data {

/**
 * Reads <directory>/<SYMBOL>.csv with columns date,open,high,low,close,volume.
 * A header row is optional and malformed rows are skipped. Throws
 * common::DataError when the file cannot be opened.
 */
class CsvPriceHistoryProvider : public PriceHistoryProvider {
public:
    explicit CsvPriceHistoryProvider(std::string directory);

    std::vector<PriceBar> getPriceHistory(const std::string& symbol, int days) override;

    // Parse a whole CSV document
    static std::vector<PriceBar> parse(std::istream& input, const std::string& source);

private:
    std::string directory_;

    static bool parseRow(const std::string& line, PriceBar& bar);
};

} // namespace data
} // namespace trend_engine
