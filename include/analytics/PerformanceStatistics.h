#pragma once

#include "common/Types.h"
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace tradelab {
namespace analytics {

struct StatisticsOptions {
    double risk_free_rate = 0.02;       // annual
    double periods_per_year = 252.0;    // bars per year for de-annualising and sqrt scaling
};

struct StatisticsReport {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int breakeven_trades = 0;
    double win_rate = 0.0;          // percent
    double avg_win = 0.0;
    double avg_loss = 0.0;          // negative or zero
    double largest_win = 0.0;       // max pnl over all trades
    double largest_loss = 0.0;      // min pnl over all trades
    double profit_factor = 0.0;     // +inf when there are winners but no losers
    double max_drawdown = 0.0;      // positive percent
    double total_return = 0.0;      // percent
    double sharpe_ratio = 0.0;

    double initial_equity = 0.0;
    double final_equity = 0.0;
    double total_pnl = 0.0;
    double expectancy = 0.0;        // mean pnl per trade
    std::map<std::string, int> exit_reason_counts;

    bool hasInfiniteProfitFactor() const {
        return profit_factor == std::numeric_limits<double>::infinity();
    }
};

// Pure reductions over a trade log and an equity curve. Every degenerate
// denominator maps to a defined value; no NaN leaves this class.
class PerformanceStatistics {
public:
    static StatisticsReport calculate(const std::vector<ClosedTrade>& trades,
                                      const std::vector<double>& equity_curve,
                                      const StatisticsOptions& options = StatisticsOptions());

    // Largest peak-to-trough decline as a positive percent of the running peak.
    static double calculateMaxDrawdown(const std::vector<double>& equity_curve);

    // Per-point drawdown (<= 0, percent of running peak), same length as the curve.
    static std::vector<double> calculateDrawdownSeries(const std::vector<double>& equity_curve);

    static double calculateTotalReturn(const std::vector<double>& equity_curve);

    static double calculateSharpeRatio(const std::vector<double>& equity_curve,
                                       const StatisticsOptions& options = StatisticsOptions());

    static std::vector<double> calculateReturns(const std::vector<double>& equity_curve);

private:
    static double calculateMean(const std::vector<double>& values);
    static double calculateSampleStdDev(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace tradelab
