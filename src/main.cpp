#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestReport.h"
#include "backtest/BatchRunner.h"
#include "backtest/FileBarProvider.h"
#include "core/state/StrategyStoreJson.h"
#include "strategy/StrategyTemplates.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace tradelab;

namespace {

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    std::string config_path = "config/config.json";
    std::string strategies_file;
    std::string data_dir;
    std::string out_dir;
    std::string period;
    bool json_mode = false;
    bool export_report = false;
    bool overwrite = false;
};

void printUsage() {
    std::cout << "Usage:\n"
              << "  TradeLab --backtest <strategy> <symbol> [interval] [options]\n"
              << "  TradeLab --batch <strategy[,strategy...]> <symbol[,symbol...]> [interval] [options]\n"
              << "  TradeLab --list\n"
              << "  TradeLab --show <strategy>\n"
              << "  TradeLab --install-templates [--overwrite]\n"
              << "\nOptions:\n"
              << "  --config <file>            application config (default config/config.json)\n"
              << "  --strategies-file <file>   strategy store document\n"
              << "  --data-dir <dir>           directory holding bar files\n"
              << "  --period <p>               lookback window: 60d, 6mo, 1y, max\n"
              << "  --report                   write trades/equity/result files to report.output_dir\n"
              << "  --out <dir>                same, into <dir>\n"
              << "  --json                     print the result as JSON\n";
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);

        if (arg == "--backtest" || arg == "--batch" || arg == "--list" ||
            arg == "--show" || arg == "--install-templates") {
            if (!opts.command.empty()) {
                std::cerr << "Only one command may be given\n";
                return false;
            }
            opts.command = arg.substr(2);
        } else if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--strategies-file" && has_value) {
            opts.strategies_file = argv[++i];
        } else if (arg == "--data-dir" && has_value) {
            opts.data_dir = argv[++i];
        } else if (arg == "--period" && has_value) {
            opts.period = argv[++i];
        } else if (arg == "--out" && has_value) {
            opts.out_dir = argv[++i];
            opts.export_report = true;
        } else if (arg == "--report") {
            opts.export_report = true;
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--overwrite") {
            opts.overwrite = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.command = "help";
        } else if (arg.compare(0, 2, "--") == 0) {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

std::filesystem::path resolvePath(const std::string& path) {
    return utils::PathUtils::resolveRelativePath(path);
}

int runBacktest(const CliOptions& opts, core::IStrategyStore& store, core::IBarProvider& provider) {
    if (opts.positional.size() < 2) {
        std::cerr << "--backtest needs <strategy> <symbol> [interval]\n";
        return 2;
    }
    auto& config = Config::getInstance();
    const std::string& strategy_name = opts.positional[0];
    const std::string& symbol = opts.positional[1];
    const std::string interval = opts.positional.size() > 2 ? opts.positional[2] : config.getDefaultInterval();
    const std::string period = opts.period.empty() ? config.getDefaultPeriod() : opts.period;

    const strategy::StrategyConfig strategy_config = store.load(strategy_name);
    LOG_INFO("Running backtest for {} on {} ({}, period {})", strategy_name, symbol, interval, period);

    const auto bars = provider.fetch(symbol, period, interval);

    backtest::BacktestEngine engine(symbol, config.getStatisticsOptions());
    const auto result = engine.run(bars, strategy_config);

    if (opts.json_mode) {
        std::cout << backtest::BacktestReport::toJson(symbol, strategy_config, result).dump() << "\n";
    } else {
        backtest::BacktestReport::printSummary(std::cout, symbol, strategy_config, result);
    }

    if (opts.export_report) {
        const auto files = backtest::BacktestReport::exportAll(
            resolvePath(config.getReportOutputDir()), symbol, strategy_config, result,
            bars ? *bars : std::vector<Bar>());
        if (!files) {
            std::cerr << "Failed to write report files to " << config.getReportOutputDir() << "\n";
            return 1;
        }
        if (!opts.json_mode) {
            std::cout << "Trades:  " << files->trades_csv.string() << "\n"
                      << "Equity:  " << files->equity_csv.string() << "\n"
                      << "Result:  " << files->result_json.string() << "\n";
        }
    }
    return result.data_unavailable ? 1 : 0;
}

int runBatch(const CliOptions& opts, core::IStrategyStore& store, core::IBarProvider& provider) {
    if (opts.positional.size() < 2) {
        std::cerr << "--batch needs <strategies> <symbols> [interval]\n";
        return 2;
    }
    auto& config = Config::getInstance();
    const auto strategy_names = splitCsv(opts.positional[0]);
    const auto symbols = splitCsv(opts.positional[1]);
    const std::string interval = opts.positional.size() > 2 ? opts.positional[2] : config.getDefaultInterval();
    const std::string period = opts.period.empty() ? config.getDefaultPeriod() : opts.period;

    std::vector<strategy::StrategyConfig> strategies;
    for (const auto& name : strategy_names) {
        strategies.push_back(store.load(name));
    }

    // Each symbol is fetched once and shared by every strategy run on it.
    std::map<std::string, std::shared_ptr<const std::vector<Bar>>> bars_by_symbol;
    for (const auto& symbol : symbols) {
        auto bars = provider.fetch(symbol, period, interval);
        bars_by_symbol[symbol] = bars
            ? std::make_shared<const std::vector<Bar>>(std::move(*bars))
            : nullptr;
    }

    std::vector<backtest::BacktestJob> jobs;
    for (const auto& symbol : symbols) {
        for (const auto& s : strategies) {
            jobs.push_back({symbol, s, bars_by_symbol[symbol]});
        }
    }

    backtest::BatchRunner runner(config.getBatchMaxParallel(), config.getStatisticsOptions());
    const auto outcomes = runner.run(jobs);

    nlohmann::json summary = nlohmann::json::array();
    int failures = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& o = outcomes[i];
        if (!o.ok) {
            ++failures;
            std::cerr << o.symbol << " / " << o.strategy_name << ": " << o.error << "\n";
            continue;
        }
        if (opts.json_mode) {
            summary.push_back({
                {"symbol", o.symbol},
                {"strategy", o.strategy_name},
                {"data_unavailable", o.result.data_unavailable},
                {"metrics", backtest::BacktestReport::metricsToJson(o.result.metrics)}
            });
        } else {
            backtest::BacktestReport::printSummary(std::cout, o.symbol, jobs[i].config, o.result);
        }
        if (opts.export_report) {
            const auto& bars = jobs[i].bars;
            if (!backtest::BacktestReport::exportAll(resolvePath(Config::getInstance().getReportOutputDir()), o.symbol, jobs[i].config,
                                                     o.result, bars ? *bars : std::vector<Bar>())) {
                std::cerr << "Failed to write report for " << o.symbol << " / " << o.strategy_name << "\n";
                ++failures;
            }
        }
    }
    if (opts.json_mode) {
        std::cout << summary.dump() << "\n";
    }
    return failures > 0 ? 1 : 0;
}

int runList(core::IStrategyStore& store) {
    const auto names = store.list();
    if (names.empty()) {
        std::cout << "No saved strategies. Run TradeLab --install-templates to add the built-in ones.\n";
        return 0;
    }
    std::cout << "Saved strategies:\n";
    for (const auto& name : names) {
        std::cout << "  - " << name << "\n";
    }
    return 0;
}

int runShow(const CliOptions& opts, core::IStrategyStore& store) {
    if (opts.positional.empty()) {
        std::cerr << "--show needs <strategy>\n";
        return 2;
    }
    const auto config = store.load(opts.positional[0]);
    std::cout << strategy::strategyConfigToJson(config).dump(2) << "\n";
    return 0;
}

int runInstallTemplates(const CliOptions& opts, core::IStrategyStore& store) {
    const int written = strategy::StrategyTemplates::install(store, opts.overwrite);
    std::cout << "Installed " << written << " template(s)\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }
    if (opts.command.empty() || opts.command == "help") {
        printUsage();
        return opts.command.empty() ? 2 : 0;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);
        if (!opts.strategies_file.empty()) {
            config.setStrategiesFile(opts.strategies_file);
        }
        if (!opts.data_dir.empty()) {
            config.setDataDir(opts.data_dir);
        }
        if (!opts.out_dir.empty()) {
            config.setReportOutputDir(opts.out_dir);
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        core::StrategyStoreJson store(resolvePath(config.getStrategiesFile()));
        backtest::FileBarProvider provider(resolvePath(config.getDataDir()));

        if (opts.command == "backtest") return runBacktest(opts, store, provider);
        if (opts.command == "batch") return runBatch(opts, store, provider);
        if (opts.command == "list") return runList(store);
        if (opts.command == "show") return runShow(opts, store);
        if (opts.command == "install-templates") return runInstallTemplates(opts, store);

    } catch (const StrategyNotFoundError& e) {
        std::cerr << "Strategy '" << e.name() << "' not found. "
                  << "Use --list to see saved strategies or --install-templates to add the built-in ones.\n";
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    printUsage();
    return 2;
}
