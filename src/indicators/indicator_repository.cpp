/**
 * Indicator persistence implementation
 */

#include <algorithm>
#include <chrono>
#include <fstream>
#include <tuple>
#include <utility>

#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/indicators/indicator_repository.h"

namespace trend_engine {
namespace indicators {

namespace {

bool sameKey(const IndicatorResult& a, const IndicatorResult& b) {
    return a.symbol == b.symbol && a.kind == b.kind && a.timestamp == b.timestamp;
}

int64_t toEpochMillis(common::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

common::TimePoint fromEpochMillis(int64_t ms) {
    return common::TimePoint(std::chrono::duration_cast<common::TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

// Newest record per (symbol, kind)
std::map<std::pair<std::string, IndicatorKind>, IndicatorResult> latestPerKey(
    const std::vector<IndicatorResult>& records) {
    std::map<std::pair<std::string, IndicatorKind>, IndicatorResult> latest;
    for (const auto& record : records) {
        auto key = std::make_pair(record.symbol, record.kind);
        auto it = latest.find(key);
        if (it == latest.end() || record.timestamp > it->second.timestamp) {
            latest[key] = record;
        }
    }
    return latest;
}

} // namespace

size_t InMemoryIndicatorRepository::upsert(const std::vector<IndicatorResult>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& record : records) {
        auto it = std::find_if(records_.begin(), records_.end(),
                               [&record](const IndicatorResult& existing) {
                                   return sameKey(existing, record);
                               });
        if (it != records_.end()) {
            *it = record;
        } else {
            records_.push_back(record);
        }
    }

    return records.size();
}

std::vector<IndicatorResult> InMemoryIndicatorRepository::getLatestIndicators(const std::string& symbol) {
    std::vector<IndicatorResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : latestPerKey(records_)) {
            if (entry.first.first == symbol) {
                result.push_back(std::move(entry.second));
            }
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const IndicatorResult& a, const IndicatorResult& b) {
                         return a.timestamp > b.timestamp;
                     });
    return result;
}

std::vector<IndicatorResult> InMemoryIndicatorRepository::getActiveSignals(const std::set<TradeSignal>& signals) {
    std::vector<IndicatorResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : latestPerKey(records_)) {
            if (signals.count(entry.second.signal) > 0) {
                result.push_back(std::move(entry.second));
            }
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const IndicatorResult& a, const IndicatorResult& b) {
                         return std::tie(b.strength, b.timestamp) < std::tie(a.strength, a.timestamp);
                     });
    return result;
}

size_t InMemoryIndicatorRepository::deleteOlderThan(int days, common::TimePoint now) {
    auto cutoff = now - std::chrono::hours(24 * days);

    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [cutoff](const IndicatorResult& record) {
                                      return record.timestamp < cutoff;
                                  }),
                   records_.end());
    return before - records_.size();
}

IndicatorStats InMemoryIndicatorRepository::getStats() {
    std::lock_guard<std::mutex> lock(mutex_);

    IndicatorStats stats;
    stats.total = records_.size();
    for (const auto& record : records_) {
        stats.by_symbol[record.symbol]++;
        stats.by_kind[indicatorKindToString(record.kind)]++;
        stats.by_signal[tradeSignalToString(record.signal)]++;
        if (!stats.last_update || record.timestamp > *stats.last_update) {
            stats.last_update = record.timestamp;
        }
    }
    return stats;
}

std::vector<IndicatorResult> InMemoryIndicatorRepository::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void InMemoryIndicatorRepository::replaceAll(std::vector<IndicatorResult> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(records);
}

JsonFileIndicatorRepository::JsonFileIndicatorRepository(std::string path)
    : path_(std::move(path)) {
    load();
}

size_t JsonFileIndicatorRepository::upsert(const std::vector<IndicatorResult>& records) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    size_t written = InMemoryIndicatorRepository::upsert(records);
    save();
    return written;
}

size_t JsonFileIndicatorRepository::deleteOlderThan(int days, common::TimePoint now) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    size_t removed = InMemoryIndicatorRepository::deleteOlderThan(days, now);
    if (removed > 0) {
        save();
    }
    return removed;
}

void JsonFileIndicatorRepository::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        LOG_INFO("Indicator store " + path_ + " not found, starting empty");
        return;
    }

    std::vector<IndicatorResult> records;
    try {
        json document = json::parse(file);
        for (const auto& item : document.at("indicators")) {
            records.push_back(indicatorResultFromJson(item));
        }
    } catch (const json::exception& e) {
        throw common::DataError("Invalid indicator store " + path_ + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw common::DataError("Invalid indicator store " + path_ + ": " + e.what());
    }

    LOG_INFO("Loaded " + std::to_string(records.size()) + " indicator records from " + path_);
    replaceAll(std::move(records));
}

void JsonFileIndicatorRepository::save() {
    json document;
    document["indicators"] = json::array();
    for (const auto& record : snapshot()) {
        document["indicators"].push_back(indicatorResultToJson(record));
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        throw common::DataError("Cannot write indicator store " + path_);
    }
    file << document.dump(2);
}

json indicatorResultToJson(const IndicatorResult& record) {
    json j;
    j["symbol"] = record.symbol;
    j["indicator_type"] = indicatorKindToString(record.kind);
    j["period"] = record.period;
    j["value"] = record.primary_value;
    j["signal"] = tradeSignalToString(record.signal);
    j["strength"] = record.strength;
    j["metadata"] = record.metadata;
    j["timestamp"] = toEpochMillis(record.timestamp);
    return j;
}

IndicatorResult indicatorResultFromJson(const json& j) {
    IndicatorResult record;
    record.symbol = j.at("symbol").get<std::string>();
    record.kind = stringToIndicatorKind(j.at("indicator_type").get<std::string>());
    record.period = j.value("period", 0);
    record.primary_value = j.at("value").get<double>();
    record.signal = stringToTradeSignal(j.at("signal").get<std::string>());
    record.strength = j.at("strength").get<double>();
    if (j.contains("metadata")) {
        record.metadata = j.at("metadata").get<std::map<std::string, double>>();
    }
    record.timestamp = fromEpochMillis(j.at("timestamp").get<int64_t>());
    return record;
}

json indicatorStatsToJson(const IndicatorStats& stats) {
    json j;
    j["total_indicators"] = stats.total;
    j["by_symbol"] = stats.by_symbol;
    j["by_type"] = stats.by_kind;
    j["by_signal"] = stats.by_signal;
    if (stats.last_update) {
        j["last_update"] = toEpochMillis(*stats.last_update);
    } else {
        j["last_update"] = nullptr;
    }
    return j;
}

} // namespace indicators
} // namespace trend_engine
