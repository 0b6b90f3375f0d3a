/**
 * CSV price history provider implementation
 */

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/data/csv_price_provider.h"

namespace trend_engine {
namespace data {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

CsvPriceHistoryProvider::CsvPriceHistoryProvider(std::string directory)
    : directory_(std::move(directory)) {
}

std::vector<PriceBar> CsvPriceHistoryProvider::getPriceHistory(const std::string& symbol, int days) {
    std::string path = directory_ + "/" + symbol + ".csv";
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::DataError("Cannot open price file " + path);
    }

    auto bars = parse(file, path);

    // Oldest first
    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });

    if (days > 0 && bars.size() > static_cast<size_t>(days)) {
        bars.erase(bars.begin(), bars.end() - days);
    }

    return bars;
}

std::vector<PriceBar> CsvPriceHistoryProvider::parse(std::istream& input, const std::string& source) {
    std::vector<PriceBar> bars;
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;

    while (std::getline(input, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        PriceBar bar;
        if (parseRow(line, bar)) {
            bars.push_back(bar);
        } else if (line_number > 1) {
            // First row may be a header
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARNING("Skipped " + std::to_string(skipped) + " malformed rows in " + source);
    }

    return bars;
}

bool CsvPriceHistoryProvider::parseRow(const std::string& line, PriceBar& bar) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }

    if (fields.size() < 5) {
        return false;
    }

    try {
        bar.date = fields[0];
        bar.open = std::stod(fields[1]);
        bar.high = std::stod(fields[2]);
        bar.low = std::stod(fields[3]);
        bar.close = std::stod(fields[4]);
        bar.volume = fields.size() > 5 && !fields[5].empty() ? std::stoll(fields[5]) : 0;
    } catch (const std::logic_error&) {
        return false;
    }

    return !bar.date.empty();
}

} // namespace data
} // namespace trend_engine
