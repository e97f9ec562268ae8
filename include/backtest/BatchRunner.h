#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestEngine.h"

namespace tradelab {
namespace backtest {

struct BacktestJob {
    std::string symbol;
    strategy::StrategyConfig config;
    // Shared read-only between jobs on the same symbol; null means the fetch failed.
    std::shared_ptr<const std::vector<Bar>> bars;
};

struct BatchOutcome {
    std::string symbol;
    std::string strategy_name;
    bool ok = false;
    std::string error;          // set when the run threw (e.g. ConfigurationError)
    BacktestResult result;
};

// Runs independent backtests concurrently, one engine per job, at most
// max_parallel at a time. Outcomes come back in job order.
class BatchRunner {
public:
    explicit BatchRunner(int max_parallel = 4,
                         analytics::StatisticsOptions options = analytics::StatisticsOptions());

    std::vector<BatchOutcome> run(const std::vector<BacktestJob>& jobs) const;

    int maxParallel() const { return max_parallel_; }

private:
    static BatchOutcome runJob(const BacktestJob& job, const analytics::StatisticsOptions& options);

    int max_parallel_;
    analytics::StatisticsOptions options_;
};

} // namespace backtest
} // namespace tradelab
