#include "backtest/BacktestReport.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace tradelab;

namespace {
size_t countLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++n;
    }
    return n;
}
}

int main() {
    strategy::StrategyConfig config;
    config.name = "report_test";
    config.signal_type = strategy::SignalType::RSI_REVERSAL;
    config.initial_capital = 1000.0;
    config.max_risk_per_trade_pct = 2.0;
    config.stop_loss.value_pct = 5.0;
    config.take_profit.levels_pct = {10.0};

    std::vector<Bar> bars;
    for (int i = 0; i < 4; ++i) {
        bars.emplace_back(100 + i, 10.0, 11.0, 9.0, 10.0, 1.0);
    }

    backtest::BacktestResult result;
    result.bars_processed = bars.size();
    result.equity_curve = {1000.0, 1000.0, 1040.0, 1040.0};
    ClosedTrade trade;
    trade.entry_time = 101;
    trade.exit_time = 102;
    trade.entry_price = 10.0;
    trade.exit_price = 11.0;
    trade.shares = 40;
    trade.pnl = 40.0;
    trade.pnl_pct = 10.0;
    trade.exit_reason = ExitReason::TAKE_PROFIT;
    trade.exit_label = "take_profit_10%";
    result.trades.push_back(trade);
    result.metrics = analytics::PerformanceStatistics::calculate(result.trades, result.equity_curve);

    // JSON: infinite profit factor becomes null plus a flag
    const auto j = backtest::BacktestReport::toJson("ABC", config, result);
    assert(j["symbol"] == "ABC");
    assert(j["metrics"]["profit_factor"].is_null());
    assert(j["metrics"]["profit_factor_infinite"] == true);
    assert(j["metrics"]["total_trades"] == 1);
    assert(j["trades"].size() == 1);
    assert(j["trades"][0]["exit_label"] == "take_profit_10%");
    assert(j["trades"][0]["side"] == "long");
    assert(j["equity_curve"].size() == 4);
    assert(j["drawdown_series"].size() == 4);
    assert(j["strategy"]["signal_type"] == "rsi_reversal");

    // Console summary
    std::ostringstream summary;
    backtest::BacktestReport::printSummary(summary, "ABC", config, result);
    assert(summary.str().find("Profit factor:   inf") != std::string::npos);
    assert(summary.str().find("take_profit: 1") != std::string::npos);

    // Files
    const auto dir = std::filesystem::temp_directory_path() / "tradelab_test_report";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    const auto files = backtest::BacktestReport::exportAll(dir, "ABC", config, result, bars);
    if (!files) {
        std::cerr << "[TEST] exportAll failed\n";
        return 1;
    }
    assert(files->trades_csv.filename() == "ABC_report_test_trades.csv");
    assert(countLines(files->trades_csv) == 2);
    assert(countLines(files->equity_csv) == 5);

    std::ifstream equity(files->equity_csv);
    std::string header, first;
    std::getline(equity, header);
    std::getline(equity, first);
    assert(header == "index,timestamp,equity,drawdown_pct");
    assert(first.rfind("0,100,1000.00,", 0) == 0);

    std::ifstream result_in(files->result_json);
    nlohmann::json reread;
    result_in >> reread;
    assert(reread["metrics"]["final_equity"] == 1040.0);

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] BacktestReport PASSED\n";
    return 0;
}
