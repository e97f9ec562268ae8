#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include "analytics/PerformanceStatistics.h"

namespace tradelab {
namespace backtest {

struct BacktestResult {
    std::vector<ClosedTrade> trades;        // ordered by exit time
    std::vector<double> equity_curve;       // one realised value per bar, [0] == initial capital
    analytics::StatisticsReport metrics;

    // Fewer than two bars (or no data at all): nothing was simulated.
    bool data_unavailable = false;

    size_t bars_processed = 0;
    int unusable_bars = 0;          // execution bars skipped because OHLC was invalid
    int entries_rejected = 0;       // signals the sizing rule could not fill
};

// Drives one backtest: a synchronous fold over an ordered bar sequence.
//
// Bar i supplies the signal and the exit checks, bar i+1 the execution open.
// The engine holds no state between runs, so one instance can be shared by
// several threads as long as each call has its own inputs.
class BacktestEngine {
public:
    explicit BacktestEngine(std::string symbol = "",
                            analytics::StatisticsOptions options = analytics::StatisticsOptions());

    // Throws ConfigurationError before simulating anything if the config is malformed.
    BacktestResult run(const std::vector<Bar>& bars, const strategy::StrategyConfig& config) const;

    // Provider output: nullopt means the fetch failed.
    BacktestResult run(const std::optional<std::vector<Bar>>& bars,
                       const strategy::StrategyConfig& config) const;

    const std::string& symbol() const { return symbol_; }

private:
    BacktestResult emptyResult(const strategy::StrategyConfig& config, size_t bar_count) const;

    std::string symbol_;
    analytics::StatisticsOptions options_;
};

} // namespace backtest
} // namespace tradelab
