#include "analytics/PerformanceStatistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tradelab {
namespace analytics {

namespace {
constexpr double MIN_STD_DEV = 1e-12;
}

StatisticsReport PerformanceStatistics::calculate(const std::vector<ClosedTrade>& trades,
                                                  const std::vector<double>& equity_curve,
                                                  const StatisticsOptions& options) {
    StatisticsReport report;
    if (!equity_curve.empty()) {
        report.initial_equity = equity_curve.front();
        report.final_equity = equity_curve.back();
    }
    report.total_return = calculateTotalReturn(equity_curve);

    if (trades.empty()) {
        return report;
    }

    double gross_profit = 0.0;
    double gross_loss = 0.0;    // sum of negative pnls
    double largest_win = trades.front().pnl;
    double largest_loss = trades.front().pnl;

    for (const auto& trade : trades) {
        report.total_pnl += trade.pnl;
        report.exit_reason_counts[toString(trade.exit_reason)]++;
        largest_win = std::max(largest_win, trade.pnl);
        largest_loss = std::min(largest_loss, trade.pnl);

        if (trade.pnl > 0.0) {
            ++report.winning_trades;
            gross_profit += trade.pnl;
        } else if (trade.pnl < 0.0) {
            ++report.losing_trades;
            gross_loss += trade.pnl;
        } else {
            ++report.breakeven_trades;
        }
    }

    report.total_trades = static_cast<int>(trades.size());
    report.win_rate = static_cast<double>(report.winning_trades) /
                      static_cast<double>(report.total_trades) * 100.0;
    report.avg_win = (report.winning_trades > 0)
        ? gross_profit / static_cast<double>(report.winning_trades)
        : 0.0;
    report.avg_loss = (report.losing_trades > 0)
        ? gross_loss / static_cast<double>(report.losing_trades)
        : 0.0;
    report.largest_win = largest_win;
    report.largest_loss = largest_loss;
    report.profit_factor = (report.losing_trades > 0)
        ? std::abs(gross_profit / gross_loss)
        : std::numeric_limits<double>::infinity();
    report.expectancy = report.total_pnl / static_cast<double>(report.total_trades);

    report.max_drawdown = calculateMaxDrawdown(equity_curve);
    report.sharpe_ratio = calculateSharpeRatio(equity_curve, options);
    return report;
}

double PerformanceStatistics::calculateMaxDrawdown(const std::vector<double>& equity_curve) {
    double max_dd = 0.0;
    for (double dd : calculateDrawdownSeries(equity_curve)) {
        max_dd = std::max(max_dd, -dd);
    }
    return max_dd;
}

std::vector<double> PerformanceStatistics::calculateDrawdownSeries(const std::vector<double>& equity_curve) {
    std::vector<double> series;
    series.reserve(equity_curve.size());
    if (equity_curve.empty()) {
        return series;
    }

    double peak = equity_curve.front();
    for (double equity : equity_curve) {
        peak = std::max(peak, equity);
        // A non-positive peak has no meaningful percentage decline.
        const double dd = (peak > 0.0) ? (equity - peak) / peak * 100.0 : 0.0;
        series.push_back(dd);
    }
    return series;
}

double PerformanceStatistics::calculateTotalReturn(const std::vector<double>& equity_curve) {
    if (equity_curve.empty()) {
        return 0.0;
    }
    const double initial = equity_curve.front();
    if (initial <= 0.0) {
        return 0.0;
    }
    return (equity_curve.back() - initial) / initial * 100.0;
}

std::vector<double> PerformanceStatistics::calculateReturns(const std::vector<double>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1];
        if (prev <= 0.0) {
            continue;
        }
        returns.push_back((equity_curve[i] - prev) / prev);
    }
    return returns;
}

double PerformanceStatistics::calculateSharpeRatio(const std::vector<double>& equity_curve,
                                                   const StatisticsOptions& options) {
    const auto returns = calculateReturns(equity_curve);
    if (returns.size() < 2 || options.periods_per_year <= 0.0) {
        return 0.0;
    }

    // Subtracting a constant shifts the mean only, so the deviation is taken
    // on the raw returns where a flat curve gives an exact zero.
    const double mean = calculateMean(returns);
    const double std_dev = calculateSampleStdDev(returns, mean);
    if (!std::isfinite(std_dev) || std_dev < MIN_STD_DEV) {
        return 0.0;
    }

    const double excess_mean = mean - (options.risk_free_rate / options.periods_per_year);
    const double sharpe = std::sqrt(options.periods_per_year) * (excess_mean / std_dev);
    return std::isfinite(sharpe) ? sharpe : 0.0;
}

double PerformanceStatistics::calculateMean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double PerformanceStatistics::calculateSampleStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

} // namespace analytics
} // namespace tradelab
