/**
 * Command line entry point for the CEDEAR trend engine
 */

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "trend_engine/analysis/json_analyzer_inputs.h"
#include "trend_engine/common/config.h"
#include "trend_engine/common/errors.h"
#include "trend_engine/common/logging.h"
#include "trend_engine/data/csv_price_provider.h"
#include "trend_engine/indicators/batch_indicator_runner.h"
#include "trend_engine/indicators/indicator_repository.h"
#include "trend_engine/portfolio/portfolio_analyzer.h"
#include "trend_engine/prediction/prediction_json.h"
#include "trend_engine/prediction/trend_prediction_service.h"

namespace po = boost::program_options;
using namespace trend_engine;
using json = nlohmann::json;
using namespace std;

namespace {

vector<string> splitSymbols(const string& list) {
    vector<string> symbols;
    stringstream ss(list);
    string symbol;
    while (getline(ss, symbol, ',')) {
        if (!symbol.empty()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

json runnerStatusToJson(const indicators::RunnerStatus& status) {
    json j;
    j["running"] = status.running;
    j["lastRun"] = status.last_run ? json(common::formatTimestamp(*status.last_run)) : json(nullptr);
    j["successCount"] = status.success_count;
    j["errorCount"] = status.error_count;
    j["lastProcessed"] = status.last_processed;
    return j;
}

json indicatorListToJson(const vector<indicators::IndicatorResult>& records) {
    json list = json::array();
    for (const auto& record : records) {
        list.push_back(indicators::indicatorResultToJson(record));
    }
    return list;
}

// Analyzer inputs are optional for the CLI; without them predictions use price data only
shared_ptr<analysis::JsonAnalyzerInputs> loadAnalyzerInputs(const string& path) {
    try {
        return make_shared<analysis::JsonAnalyzerInputs>(analysis::JsonAnalyzerInputs::fromFile(path));
    } catch (const common::DataError& e) {
        LOG_WARNING(string("Analyzer inputs unavailable: ") + e.what());
        return nullptr;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Parse command line options
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "produce help message")
            ("config", po::value<string>()->default_value("config/trend_engine.yaml"), "engine configuration file")
            ("command", po::value<string>()->default_value("predict"),
             "indicators | symbol | cleanup | signals | stats | predict | multi | portfolio")
            ("symbol", po::value<string>(), "symbol for symbol/predict")
            ("symbols", po::value<string>(), "comma-separated symbols for multi/portfolio (default: active instruments)")
            ("timeframe", po::value<string>()->default_value("1M"), "prediction timeframe (1W, 1M, 3M, 6M, 1Y)")
            ("log-level", po::value<string>(), "log level (DEBUG, INFO, WARNING, ERROR, CRITICAL)")
            ("no-cache", "bypass the prediction cache")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            cout << desc << "\n";
            return 0;
        }

        // Load configuration
        common::Config config(vm["config"].as<string>());

        // Initialize logging
        const auto& logging_config = config.getLoggingConfig();
        common::g_logger.setLevel(vm.count("log-level") ? vm["log-level"].as<string>() : logging_config.level);
        if (!logging_config.file.empty()) {
            common::g_logger.open(logging_config.file, logging_config.flush_interval_ms);
        }

        // Initialize components
        const auto& data_config = config.getDataConfig();
        auto price_provider = make_shared<data::CsvPriceHistoryProvider>(data_config.price_directory);
        auto instruments = make_shared<data::StaticInstrumentProvider>(config.getInstrumentsConfig().active);
        auto repository = make_shared<indicators::JsonFileIndicatorRepository>(data_config.indicator_store);

        indicators::BatchIndicatorRunner runner(config, price_provider, instruments, repository);

        prediction::PredictionCollaborators collaborators;
        collaborators.indicators = repository;
        collaborators.prices = price_provider;
        auto analyzer_inputs = loadAnalyzerInputs(data_config.analyzer_inputs);
        if (analyzer_inputs) {
            collaborators.news = analyzer_inputs;
            collaborators.sentiment = analyzer_inputs;
            collaborators.earnings = analyzer_inputs;
        }
        auto service = make_shared<prediction::TrendPredictionService>(config, collaborators);
        portfolio::PortfolioAnalyzer portfolio_analyzer(config, service);

        prediction::PredictionOptions options;
        options.use_cache = vm.count("no-cache") == 0;
        options.cache_ttl_minutes = config.getPredictionConfig().cache_ttl_minutes;
        // No deep analysis client is wired into the CLI
        options.deep_analysis = false;

        vector<string> symbols = vm.count("symbols") ? splitSymbols(vm["symbols"].as<string>())
                                                     : config.getInstrumentsConfig().active;
        string timeframe = vm["timeframe"].as<string>();
        string command = vm["command"].as<string>();

        auto requireSymbol = [&vm]() {
            if (!vm.count("symbol")) {
                throw common::ConfigError("--symbol is required for this command");
            }
            return vm["symbol"].as<string>();
        };

        json output;
        if (command == "indicators") {
            int processed = runner.runAll();
            output["processed"] = processed;
            output["status"] = runnerStatusToJson(runner.status());
        } else if (command == "symbol") {
            string symbol = requireSymbol();
            output["symbol"] = symbol;
            output["calculated"] = runner.runSymbol(symbol);
            output["indicators"] = indicatorListToJson(runner.getLatestIndicators(symbol));
        } else if (command == "cleanup") {
            output["removed"] = runner.cleanupOldIndicators();
        } else if (command == "signals") {
            output = indicatorListToJson(runner.getActiveSignals());
        } else if (command == "stats") {
            auto service_stats = service->getStats();
            output["indicators"] = indicators::indicatorStatsToJson(runner.getStats());
            output["runner"] = runnerStatusToJson(runner.status());
            output["predictions"] = {
                {"cache", prediction::cacheStatsToJson(service_stats.cache)},
                {"computed", service_stats.predictions_computed}
            };
        } else if (command == "predict") {
            output = prediction::trendPredictionToJson(*service->predictTrend(requireSymbol(), timeframe, options));
        } else if (command == "multi") {
            output = portfolio::multiSymbolAnalysisToJson(
                portfolio_analyzer.analyzeMultipleSymbols(symbols, timeframe, options));
        } else if (command == "portfolio") {
            output = portfolio::portfolioAnalysisToJson(portfolio_analyzer.analyzePortfolioTrends(symbols, options));
        } else {
            throw common::ConfigError("Unknown command: " + command);
        }

        cout << output.dump(2) << endl;

        common::g_logger.flush();
        return 0;
    } catch (const std::exception& e) {
        common::g_logger.flush();
        cerr << "Fatal error: " << e.what() << endl;
        return 1;
    }
}
