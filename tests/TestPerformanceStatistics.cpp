#include "analytics/PerformanceStatistics.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tradelab;
using analytics::PerformanceStatistics;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

ClosedTrade tradeWithPnl(double pnl, ExitReason reason = ExitReason::TAKE_PROFIT) {
    ClosedTrade t;
    t.entry_time = 1;
    t.exit_time = 2;
    t.shares = 1;
    t.pnl = pnl;
    t.exit_reason = reason;
    return t;
}
}

int main() {
    // No losing trades: profit factor is the infinity sentinel.
    {
        const std::vector<ClosedTrade> trades{tradeWithPnl(50.0), tradeWithPnl(30.0)};
        const std::vector<double> curve{1000.0, 1050.0, 1080.0};
        const auto r = PerformanceStatistics::calculate(trades, curve);
        assert(r.hasInfiniteProfitFactor());
        assert(std::isinf(r.profit_factor) && r.profit_factor > 0.0);
        assert(near(r.win_rate, 100.0));
        assert(r.total_trades == 2 && r.winning_trades == 2 && r.losing_trades == 0);
        assert(near(r.avg_win, 40.0));
        assert(near(r.avg_loss, 0.0));
        assert(near(r.largest_win, 50.0));
        assert(near(r.largest_loss, 30.0));
        assert(near(r.total_pnl, 80.0));
        assert(near(r.expectancy, 40.0));
        assert(near(r.total_return, 8.0));
        assert(near(r.max_drawdown, 0.0));
        assert(r.exit_reason_counts.at("take_profit") == 2);
        std::cout << "[TEST] Profit factor without losers PASSED\n";
    }

    // Flat equity: Sharpe is exactly zero, nothing is NaN.
    {
        const std::vector<double> curve(20, 5000.0);
        assert(PerformanceStatistics::calculateSharpeRatio(curve) == 0.0);
        const auto r = PerformanceStatistics::calculate({tradeWithPnl(0.0, ExitReason::END_OF_PERIOD)}, curve);
        assert(r.sharpe_ratio == 0.0);
        assert(r.breakeven_trades == 1);
        assert(near(r.win_rate, 0.0));
        assert(!std::isnan(r.avg_win) && !std::isnan(r.avg_loss));
        assert(!std::isnan(r.max_drawdown) && !std::isnan(r.total_return));
        std::cout << "[TEST] Flat equity Sharpe PASSED\n";
    }

    // Mixed trades
    {
        const std::vector<ClosedTrade> trades{
            tradeWithPnl(100.0), tradeWithPnl(-50.0, ExitReason::STOP_LOSS),
            tradeWithPnl(60.0), tradeWithPnl(-30.0, ExitReason::STOP_LOSS)};
        const std::vector<double> curve{1000.0, 1100.0, 1050.0, 1110.0, 1080.0};
        const auto r = PerformanceStatistics::calculate(trades, curve);
        assert(near(r.win_rate, 50.0));
        assert(near(r.avg_win, 80.0));
        assert(near(r.avg_loss, -40.0));
        assert(near(r.largest_win, 100.0));
        assert(near(r.largest_loss, -50.0));
        assert(near(r.profit_factor, 2.0));
        assert(near(r.total_return, 8.0));
        assert(r.exit_reason_counts.at("stop_loss") == 2);
        assert(std::isfinite(r.sharpe_ratio) && r.sharpe_ratio != 0.0);
        std::cout << "[TEST] Mixed trades PASSED\n";
    }

    // Drawdown
    {
        const std::vector<double> curve{100.0, 120.0, 90.0, 130.0};
        assert(near(PerformanceStatistics::calculateMaxDrawdown(curve), 25.0));
        const auto series = PerformanceStatistics::calculateDrawdownSeries(curve);
        assert(series.size() == 4);
        assert(near(series[0], 0.0) && near(series[1], 0.0));
        assert(near(series[2], -25.0));
        assert(near(series[3], 0.0));
        assert(near(PerformanceStatistics::calculateTotalReturn(curve), 30.0));
        assert(near(PerformanceStatistics::calculateMaxDrawdown({}), 0.0));
        std::cout << "[TEST] Drawdown PASSED\n";
    }

    // Degenerate inputs
    {
        const auto r = PerformanceStatistics::calculate({}, {});
        assert(r.total_trades == 0);
        assert(r.profit_factor == 0.0);
        assert(r.sharpe_ratio == 0.0);
        assert(PerformanceStatistics::calculateSharpeRatio({1000.0, 1010.0}) == 0.0);
        assert(PerformanceStatistics::calculateReturns({0.0, 10.0, 20.0}).size() == 1);
        assert(PerformanceStatistics::calculateTotalReturn({0.0, 10.0}) == 0.0);
        std::cout << "[TEST] Degenerate inputs PASSED\n";
    }

    std::cout << "[TEST] PerformanceStatistics PASSED\n";
    return 0;
}
