#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest/BacktestEngine.h"

namespace tradelab {
namespace backtest {

// Files written by BacktestReport::exportAll.
struct ReportFiles {
    std::filesystem::path trades_csv;
    std::filesystem::path equity_csv;
    std::filesystem::path result_json;
};

// Presentation of a finished run. Nothing here feeds back into the engine.
class BacktestReport {
public:
    static void printSummary(std::ostream& os,
                             const std::string& symbol,
                             const strategy::StrategyConfig& config,
                             const BacktestResult& result);

    // profit_factor is written as null with "profit_factor_infinite": true
    // when there were no losing trades.
    static nlohmann::json metricsToJson(const analytics::StatisticsReport& metrics);
    static nlohmann::json tradeToJson(const ClosedTrade& trade);

    static nlohmann::json toJson(const std::string& symbol,
                                 const strategy::StrategyConfig& config,
                                 const BacktestResult& result);

    static bool writeTradesCsv(const std::filesystem::path& path,
                               const std::vector<ClosedTrade>& trades);

    // index,timestamp,equity,drawdown_pct. `bars` supplies timestamps when it
    // has one entry per equity point; otherwise the column is left empty.
    static bool writeEquityCsv(const std::filesystem::path& path,
                               const std::vector<double>& equity_curve,
                               const std::vector<Bar>& bars);

    // <dir>/<symbol>_<strategy>_{trades.csv,equity.csv,result.json}.
    // Returns nullopt if any file could not be written.
    static std::optional<ReportFiles> exportAll(const std::filesystem::path& dir,
                                                const std::string& symbol,
                                                const strategy::StrategyConfig& config,
                                                const BacktestResult& result,
                                                const std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace tradelab
