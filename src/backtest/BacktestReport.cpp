#include "backtest/BacktestReport.h"
#include "common/Logger.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <system_error>

namespace tradelab {
namespace backtest {

namespace {
std::string safeFileToken(std::string value) {
    for (auto& c : value) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
            c = '_';
        }
    }
    return value.empty() ? std::string("unnamed") : value;
}

bool ensureParent(const std::filesystem::path& path) {
    if (!path.has_parent_path()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    return !ec;
}
}

void BacktestReport::printSummary(std::ostream& os,
                                  const std::string& symbol,
                                  const strategy::StrategyConfig& config,
                                  const BacktestResult& result) {
    const auto& m = result.metrics;
    const auto old_flags = os.flags();
    const auto old_precision = os.precision();

    os << "\nBacktest Results: " << config.name << " on " << symbol << "\n";
    os << "---------------------------------------------\n";
    if (result.data_unavailable) {
        os << "No simulation: fewer than 2 bars available (" << result.bars_processed << ")\n";
        os << "---------------------------------------------\n";
        return;
    }
    os << std::fixed << std::setprecision(2);
    os << "Bars:            " << result.bars_processed
       << " (unusable " << result.unusable_bars << ")\n";
    os << "Initial equity:  " << m.initial_equity << "\n";
    os << "Final equity:    " << m.final_equity << "\n";
    os << "Total return:    " << m.total_return << "%\n";
    os << "Total trades:    " << m.total_trades << "\n";
    os << "Winning trades:  " << m.winning_trades << "\n";
    os << "Losing trades:   " << m.losing_trades << "\n";
    os << "Win rate:        " << m.win_rate << "%\n";
    os << "Average win:     " << m.avg_win << "\n";
    os << "Average loss:    " << m.avg_loss << "\n";
    os << "Largest win:     " << m.largest_win << "\n";
    os << "Largest loss:    " << m.largest_loss << "\n";
    if (m.hasInfiniteProfitFactor()) {
        os << "Profit factor:   inf\n";
    } else {
        os << "Profit factor:   " << std::setprecision(3) << m.profit_factor << std::setprecision(2) << "\n";
    }
    os << "Expectancy:      " << m.expectancy << " per trade\n";
    os << "Max drawdown:    " << m.max_drawdown << "%\n";
    os << "Sharpe ratio:    " << m.sharpe_ratio << "\n";
    if (!m.exit_reason_counts.empty()) {
        os << "Exits:\n";
        for (const auto& [reason, count] : m.exit_reason_counts) {
            os << "  - " << reason << ": " << count << "\n";
        }
    }
    if (result.entries_rejected > 0) {
        os << "Entries rejected by sizing: " << result.entries_rejected << "\n";
    }
    os << "---------------------------------------------\n";

    os.flags(old_flags);
    os.precision(old_precision);
}

nlohmann::json BacktestReport::metricsToJson(const analytics::StatisticsReport& m) {
    nlohmann::json j;
    j["total_trades"] = m.total_trades;
    j["winning_trades"] = m.winning_trades;
    j["losing_trades"] = m.losing_trades;
    j["breakeven_trades"] = m.breakeven_trades;
    j["win_rate"] = m.win_rate;
    j["avg_win"] = m.avg_win;
    j["avg_loss"] = m.avg_loss;
    j["largest_win"] = m.largest_win;
    j["largest_loss"] = m.largest_loss;
    if (m.hasInfiniteProfitFactor()) {
        j["profit_factor"] = nullptr;
        j["profit_factor_infinite"] = true;
    } else {
        j["profit_factor"] = m.profit_factor;
        j["profit_factor_infinite"] = false;
    }
    j["max_drawdown"] = m.max_drawdown;
    j["total_return"] = m.total_return;
    j["sharpe_ratio"] = m.sharpe_ratio;
    j["initial_equity"] = m.initial_equity;
    j["final_equity"] = m.final_equity;
    j["total_pnl"] = m.total_pnl;
    j["expectancy"] = m.expectancy;
    j["exit_reason_counts"] = m.exit_reason_counts;
    return j;
}

nlohmann::json BacktestReport::tradeToJson(const ClosedTrade& t) {
    return {
        {"entry_time", t.entry_time},
        {"exit_time", t.exit_time},
        {"side", toString(t.side)},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"shares", t.shares},
        {"pnl", t.pnl},
        {"pnl_pct", t.pnl_pct},
        {"exit_reason", toString(t.exit_reason)},
        {"exit_label", t.exit_label}
    };
}

nlohmann::json BacktestReport::toJson(const std::string& symbol,
                                      const strategy::StrategyConfig& config,
                                      const BacktestResult& result) {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["strategy"] = strategy::strategyConfigToJson(config);
    j["data_unavailable"] = result.data_unavailable;
    j["bars_processed"] = result.bars_processed;
    j["unusable_bars"] = result.unusable_bars;
    j["entries_rejected"] = result.entries_rejected;
    j["metrics"] = metricsToJson(result.metrics);

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(tradeToJson(trade));
    }
    j["equity_curve"] = result.equity_curve;
    j["drawdown_series"] = analytics::PerformanceStatistics::calculateDrawdownSeries(result.equity_curve);
    return j;
}

bool BacktestReport::writeTradesCsv(const std::filesystem::path& path,
                                    const std::vector<ClosedTrade>& trades) {
    if (!ensureParent(path)) {
        return false;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot write trades CSV: {}", path.string());
        return false;
    }

    out << "entry_time,exit_time,side,entry_price,exit_price,shares,pnl,pnl_pct,exit_reason,exit_label\n";
    out << std::fixed;
    for (const auto& t : trades) {
        out << t.entry_time << "," << t.exit_time << ","
            << toString(t.side) << ","
            << std::setprecision(4) << t.entry_price << ","
            << std::setprecision(4) << t.exit_price << ","
            << t.shares << ","
            << std::setprecision(2) << t.pnl << ","
            << std::setprecision(4) << t.pnl_pct << ","
            << toString(t.exit_reason) << ","
            << t.exit_label << "\n";
    }
    return out.good();
}

bool BacktestReport::writeEquityCsv(const std::filesystem::path& path,
                                    const std::vector<double>& equity_curve,
                                    const std::vector<Bar>& bars) {
    if (!ensureParent(path)) {
        return false;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot write equity CSV: {}", path.string());
        return false;
    }

    const auto drawdown = analytics::PerformanceStatistics::calculateDrawdownSeries(equity_curve);
    const bool has_times = bars.size() == equity_curve.size();

    out << "index,timestamp,equity,drawdown_pct\n";
    out << std::fixed;
    for (size_t i = 0; i < equity_curve.size(); ++i) {
        out << i << ",";
        if (has_times) {
            out << bars[i].timestamp;
        }
        out << "," << std::setprecision(2) << equity_curve[i]
            << "," << std::setprecision(4) << drawdown[i] << "\n";
    }
    return out.good();
}

std::optional<ReportFiles> BacktestReport::exportAll(const std::filesystem::path& dir,
                                                     const std::string& symbol,
                                                     const strategy::StrategyConfig& config,
                                                     const BacktestResult& result,
                                                     const std::vector<Bar>& bars) {
    const std::string base = safeFileToken(symbol) + "_" + safeFileToken(config.name);

    ReportFiles files;
    files.trades_csv = dir / (base + "_trades.csv");
    files.equity_csv = dir / (base + "_equity.csv");
    files.result_json = dir / (base + "_result.json");

    if (!writeTradesCsv(files.trades_csv, result.trades)) {
        return std::nullopt;
    }
    if (!writeEquityCsv(files.equity_csv, result.equity_curve, bars)) {
        return std::nullopt;
    }

    std::ofstream out(files.result_json, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot write result JSON: {}", files.result_json.string());
        return std::nullopt;
    }
    out << toJson(symbol, config, result).dump(2);
    if (!out.good()) {
        return std::nullopt;
    }

    LOG_INFO("Report written to {}", dir.string());
    return files;
}

} // namespace backtest
} // namespace tradelab
