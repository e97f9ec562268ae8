#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

int main() {
    using namespace tradelab;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // Defaults before anything is loaded
    assert(config.getDataDir() == "data");
    assert(config.getDefaultPeriod() == "1y");
    assert(config.getDefaultInterval() == "1d");
    assert(config.getBatchMaxParallel() == 4);
    assert(std::abs(config.getStatisticsOptions().risk_free_rate - 0.02) < 1e-12);
    assert(std::abs(config.getStatisticsOptions().periods_per_year - 252.0) < 1e-12);

    // Missing file keeps defaults
    config.load((std::filesystem::temp_directory_path() / "tradelab_no_such_config.json").string());
    assert(config.getStrategiesFile() == "config/strategies.json");

    // Full document
    const auto path = std::filesystem::temp_directory_path() / "tradelab_test_config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({
            "logging": {"level": "debug", "dir": "/tmp/tradelab_logs"},
            "data": {"dir": "/srv/bars", "default_period": "6mo", "default_interval": "1h"},
            "strategies": {"file": "/srv/strategies.json"},
            "statistics": {"risk_free_rate": 0.0, "periods_per_year": 365},
            "report": {"output_dir": "/srv/reports"},
            "batch": {"max_parallel": 8}
        })";
    }
    config.load(path.string());

    std::cout << "Data dir: " << config.getDataDir() << std::endl;
    std::cout << "Strategies: " << config.getStrategiesFile() << std::endl;

    assert(config.getLogLevel() == "debug");
    assert(config.getLogDir() == "/tmp/tradelab_logs");
    assert(config.getDataDir() == "/srv/bars");
    assert(config.getDefaultPeriod() == "6mo");
    assert(config.getDefaultInterval() == "1h");
    assert(config.getStrategiesFile() == "/srv/strategies.json");
    assert(config.getReportOutputDir() == "/srv/reports");
    assert(config.getBatchMaxParallel() == 8);
    assert(config.getStatisticsOptions().risk_free_rate == 0.0);
    assert(config.getStatisticsOptions().periods_per_year == 365.0);

    // Out-of-range values are clamped
    config.applyJson(nlohmann::json::parse(R"({"batch": {"max_parallel": 0},
                                               "statistics": {"periods_per_year": -1}})"));
    assert(config.getBatchMaxParallel() == 1);
    assert(config.getStatisticsOptions().periods_per_year == 252.0);

    // Partial documents leave other keys alone
    config.applyJson(nlohmann::json::parse(R"({"data": {"dir": "elsewhere"}})"));
    assert(config.getDataDir() == "elsewhere");
    assert(config.getDefaultPeriod() == "6mo");

    std::filesystem::remove(path);
    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
