/**
 * Configuration management for the trend engine
 */

#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace trend_engine {
namespace common {

// Logging configuration
struct LoggingConfig {
    std::string level = "INFO";
    std::string file;               // empty: log to stderr
    int flush_interval_ms = 1000;
};

// Input/output locations
struct DataConfig {
    std::string price_directory = "data/prices";
    std::string indicator_store = "data/indicators.json";
    std::string analyzer_inputs = "data/analyzer_inputs.json";
};

// Watchlist
struct InstrumentsConfig {
    std::vector<std::string> active;
};

// Indicator calculation and batch settings
struct IndicatorConfig {
    int rsi_period = 14;
    int history_days = 200;
    int extremes_window_days = 365;
    int min_bars = 26;
    int retention_days = 90;
    int pacing_interval_ms = 100;
};

// Trend prediction settings
struct PredictionConfig {
    int cache_ttl_minutes = 30;
    double direction_threshold = 15.0;

    struct Weights {
        double technical = 0.30;
        double fundamental = 0.25;
        double sentiment = 0.25;
        double news = 0.20;
    } weights;
};

// Multi-symbol and portfolio settings
struct PortfolioConfig {
    int batch_size = 3;
    int batch_pause_ms = 1000;
    std::string timeframe = "3M";
};

class Config {
public:
    // All defaults
    Config() = default;

    // Load from a YAML file
    explicit Config(const std::string& config_path);
    ~Config() = default;

    // Parse inline YAML
    static Config fromYamlString(const std::string& yaml);

    const LoggingConfig& getLoggingConfig() const { return logging_config_; }
    const DataConfig& getDataConfig() const { return data_config_; }
    const InstrumentsConfig& getInstrumentsConfig() const { return instruments_config_; }
    const IndicatorConfig& getIndicatorConfig() const { return indicator_config_; }
    const PredictionConfig& getPredictionConfig() const { return prediction_config_; }
    const PortfolioConfig& getPortfolioConfig() const { return portfolio_config_; }

    // Mutable access for programmatic setup
    LoggingConfig& loggingConfig() { return logging_config_; }
    DataConfig& dataConfig() { return data_config_; }
    InstrumentsConfig& instrumentsConfig() { return instruments_config_; }
    IndicatorConfig& indicatorConfig() { return indicator_config_; }
    PredictionConfig& predictionConfig() { return prediction_config_; }
    PortfolioConfig& portfolioConfig() { return portfolio_config_; }

    // Throws ConfigError when a value is out of range
    void validate() const;

private:
    void loadConfig(const YAML::Node& config);
    static std::string expandEnvVars(const std::string& value);

    LoggingConfig logging_config_;
    DataConfig data_config_;
    InstrumentsConfig instruments_config_;
    IndicatorConfig indicator_config_;
    PredictionConfig prediction_config_;
    PortfolioConfig portfolio_config_;
};

} // namespace common
} // namespace trend_engine
