/**
 * Indicator persistence
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "trend_engine/indicators/indicator.h"

namespace trend_engine {
namespace indicators {

using json = nlohmann::json;

// Repository totals
struct IndicatorStats {
    size_t total = 0;
    std::map<std::string, size_t> by_symbol;
    std::map<std::string, size_t> by_kind;
    std::map<std::string, size_t> by_signal;
    std::optional<common::TimePoint> last_update;
};

// Stores indicator records keyed by (symbol, kind, timestamp)
class IndicatorRepository {
public:
    virtual ~IndicatorRepository() = default;

    // Insert or replace; returns the number of records written
    virtual size_t upsert(const std::vector<IndicatorResult>& records) = 0;

    // Newest record per kind for a symbol, newest first
    virtual std::vector<IndicatorResult> getLatestIndicators(const std::string& symbol) = 0;

    // Latest record per (symbol, kind) whose signal is in `signals`,
    // strongest first, then newest first
    virtual std::vector<IndicatorResult> getActiveSignals(const std::set<TradeSignal>& signals) = 0;

    // Remove records older than `days` before `now`; returns the number removed
    virtual size_t deleteOlderThan(int days, common::TimePoint now) = 0;

    virtual IndicatorStats getStats() = 0;
};

// Process-local repository
class InMemoryIndicatorRepository : public IndicatorRepository {
public:
    InMemoryIndicatorRepository() = default;
    ~InMemoryIndicatorRepository() override = default;

    size_t upsert(const std::vector<IndicatorResult>& records) override;
    std::vector<IndicatorResult> getLatestIndicators(const std::string& symbol) override;
    std::vector<IndicatorResult> getActiveSignals(const std::set<TradeSignal>& signals) override;
    size_t deleteOlderThan(int days, common::TimePoint now) override;
    IndicatorStats getStats() override;

protected:
    // Copy of every stored record
    std::vector<IndicatorResult> snapshot();

    // Replace the whole content
    void replaceAll(std::vector<IndicatorResult> records);

private:
    std::vector<IndicatorResult> records_;
    std::mutex mutex_;
};

/**
 * Repository persisted as a JSON document. The file is loaded on construction
 * (a missing file starts empty) and rewritten after every mutation.
 */
class JsonFileIndicatorRepository : public InMemoryIndicatorRepository {
public:
    explicit JsonFileIndicatorRepository(std::string path);
    ~JsonFileIndicatorRepository() override = default;

    size_t upsert(const std::vector<IndicatorResult>& records) override;
    size_t deleteOlderThan(int days, common::TimePoint now) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex file_mutex_;

    void load();
    void save();
};

// JSON conversion; timestamps are epoch milliseconds
json indicatorResultToJson(const IndicatorResult& record);
IndicatorResult indicatorResultFromJson(const json& j);
json indicatorStatsToJson(const IndicatorStats& stats);

} // namespace indicators
} // namespace trend_engine
