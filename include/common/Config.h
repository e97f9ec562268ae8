#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analytics/PerformanceStatistics.h"

namespace tradelab {

// Application settings for the command-line front end. The backtest core never
// reads this; it receives StrategyConfig and StatisticsOptions by value.
class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // Applies every recognised key of an already-parsed document.
    void applyJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getDataDir() const { return data_dir_; }
    std::string getDefaultPeriod() const { return default_period_; }
    std::string getDefaultInterval() const { return default_interval_; }
    std::string getStrategiesFile() const { return strategies_file_; }
    std::string getReportOutputDir() const { return report_output_dir_; }
    int getBatchMaxParallel() const { return batch_max_parallel_; }
    analytics::StatisticsOptions getStatisticsOptions() const { return statistics_options_; }

    void setDataDir(const std::string& v) { data_dir_ = v; }
    void setStrategiesFile(const std::string& v) { strategies_file_ = v; }
    void setReportOutputDir(const std::string& v) { report_output_dir_ = v; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string data_dir_ = "data";
    std::string default_period_ = "1y";
    std::string default_interval_ = "1d";
    std::string strategies_file_ = "config/strategies.json";
    std::string report_output_dir_ = "reports";
    int batch_max_parallel_ = 4;
    analytics::StatisticsOptions statistics_options_;
};

} // namespace tradelab
