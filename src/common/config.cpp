/**
 * Configuration management implementation
 */

#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>

#include <yaml-cpp/yaml.h>
#include "trend_engine/common/config.h"
#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/data/market_data.h"

namespace trend_engine {
namespace common {

Config::Config(const std::string& config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error reading config file " + config_path + ": " + std::string(e.what()));
    }

    loadConfig(config);
    validate();

    LOG_INFO("Configuration loaded from " + config_path);
}

Config Config::fromYamlString(const std::string& yaml) {
    Config result;
    YAML::Node config;
    try {
        config = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config: " + std::string(e.what()));
    }

    result.loadConfig(config);
    result.validate();
    return result;
}

void Config::loadConfig(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    try {
        // Parse logging configuration
        if (config["logging"]) {
            auto log = config["logging"];
            logging_config_.level = log["level"].as<std::string>(logging_config_.level);
            logging_config_.file = expandEnvVars(log["file"].as<std::string>(logging_config_.file));
            logging_config_.flush_interval_ms = log["flush_interval_ms"].as<int>(logging_config_.flush_interval_ms);
        }

        // Parse data locations
        if (config["data"]) {
            auto data = config["data"];
            data_config_.price_directory = expandEnvVars(
                data["price_directory"].as<std::string>(data_config_.price_directory));
            data_config_.indicator_store = expandEnvVars(
                data["indicator_store"].as<std::string>(data_config_.indicator_store));
            data_config_.analyzer_inputs = expandEnvVars(
                data["analyzer_inputs"].as<std::string>(data_config_.analyzer_inputs));
        }

        // Parse watchlist
        if (config["instruments"] && config["instruments"]["active"]) {
            instruments_config_.active.clear();
            for (const auto& symbol : config["instruments"]["active"]) {
                instruments_config_.active.push_back(symbol.as<std::string>());
            }
        }

        // Parse indicator settings
        if (config["indicators"]) {
            auto ind = config["indicators"];
            indicator_config_.rsi_period = ind["rsi_period"].as<int>(indicator_config_.rsi_period);
            indicator_config_.history_days = ind["history_days"].as<int>(indicator_config_.history_days);
            indicator_config_.extremes_window_days =
                ind["extremes_window_days"].as<int>(indicator_config_.extremes_window_days);
            indicator_config_.min_bars = ind["min_bars"].as<int>(indicator_config_.min_bars);
            indicator_config_.retention_days = ind["retention_days"].as<int>(indicator_config_.retention_days);
            indicator_config_.pacing_interval_ms =
                ind["pacing_interval_ms"].as<int>(indicator_config_.pacing_interval_ms);
        }

        // Parse prediction settings
        if (config["prediction"]) {
            auto pred = config["prediction"];
            prediction_config_.cache_ttl_minutes =
                pred["cache_ttl_minutes"].as<int>(prediction_config_.cache_ttl_minutes);
            prediction_config_.direction_threshold =
                pred["direction_threshold"].as<double>(prediction_config_.direction_threshold);

            if (pred["weights"]) {
                auto w = pred["weights"];
                auto& weights = prediction_config_.weights;
                weights.technical = w["technical"].as<double>(weights.technical);
                weights.fundamental = w["fundamental"].as<double>(weights.fundamental);
                weights.sentiment = w["sentiment"].as<double>(weights.sentiment);
                weights.news = w["news"].as<double>(weights.news);
            }
        }

        // Parse portfolio settings
        if (config["portfolio"]) {
            auto pf = config["portfolio"];
            portfolio_config_.batch_size = pf["batch_size"].as<int>(portfolio_config_.batch_size);
            portfolio_config_.batch_pause_ms = pf["batch_pause_ms"].as<int>(portfolio_config_.batch_pause_ms);
            portfolio_config_.timeframe = pf["timeframe"].as<std::string>(portfolio_config_.timeframe);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error loading config: " + std::string(e.what()));
    }
}

void Config::validate() const {
    const auto& ind = indicator_config_;
    if (ind.rsi_period <= 0) {
        throw ConfigError("RSI period must be positive");
    }
    if (ind.history_days <= 0 || ind.extremes_window_days <= 0) {
        throw ConfigError("Indicator history windows must be positive");
    }
    if (ind.min_bars <= ind.rsi_period) {
        throw ConfigError("Minimum bar count must exceed the RSI period");
    }
    if (ind.retention_days <= 0) {
        throw ConfigError("Indicator retention must be positive");
    }
    if (ind.pacing_interval_ms < 0) {
        throw ConfigError("Indicator pacing interval must not be negative");
    }

    const auto& pred = prediction_config_;
    if (pred.cache_ttl_minutes < 0) {
        throw ConfigError("Prediction cache TTL must not be negative");
    }
    if (pred.direction_threshold < 0.0) {
        throw ConfigError("Direction threshold must not be negative");
    }

    const auto& w = pred.weights;
    if (w.technical < 0.0 || w.fundamental < 0.0 || w.sentiment < 0.0 || w.news < 0.0) {
        throw ConfigError("Factor weights must not be negative");
    }
    double weight_sum = w.technical + w.fundamental + w.sentiment + w.news;
    if (std::fabs(weight_sum - 1.0) > 1e-6) {
        throw ConfigError("Factor weights must sum to 1, got " + std::to_string(weight_sum));
    }

    const auto& pf = portfolio_config_;
    if (pf.batch_size <= 0) {
        throw ConfigError("Portfolio batch size must be positive");
    }
    if (pf.batch_pause_ms < 0) {
        throw ConfigError("Portfolio batch pause must not be negative");
    }
    if (data::timeframeDays(pf.timeframe) <= 0) {
        throw ConfigError("Unknown portfolio timeframe: " + pf.timeframe);
    }
}

std::string Config::expandEnvVars(const std::string& value) {
    // If the value doesn't contain any environment variables, return it as is
    if (value.find("${") == std::string::npos) {
        return value;
    }

    std::string result = value;
    std::regex env_var_pattern("\\$\\{([^}]+)\\}");

    std::smatch match;
    while (std::regex_search(result, match, env_var_pattern)) {
        std::string env_var_name = match[1].str();
        const char* env_var_value = std::getenv(env_var_name.c_str());
        if (!env_var_value) {
            throw ConfigError("Environment variable not set: " + env_var_name);
        }

        result.replace(match.position(0), match.length(0), env_var_value);
    }

    return result;
}

} // namespace common
} // namespace trend_engine
