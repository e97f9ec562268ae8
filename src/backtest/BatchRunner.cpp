#include "backtest/BatchRunner.h"
#include "common/Logger.h"

#include <algorithm>
#include <future>

namespace tradelab {
namespace backtest {

BatchRunner::BatchRunner(int max_parallel, analytics::StatisticsOptions options)
    : max_parallel_(std::max(1, max_parallel)), options_(options) {}

BatchOutcome BatchRunner::runJob(const BacktestJob& job, const analytics::StatisticsOptions& options) {
    BatchOutcome outcome;
    outcome.symbol = job.symbol;
    outcome.strategy_name = job.config.name;

    BacktestEngine engine(job.symbol, options);
    try {
        if (job.bars) {
            outcome.result = engine.run(*job.bars, job.config);
        } else {
            outcome.result = engine.run(std::optional<std::vector<Bar>>(), job.config);
        }
        outcome.ok = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
        LOG_ERROR("[{}] Backtest '{}' failed: {}", job.symbol, job.config.name, e.what());
    }
    return outcome;
}

std::vector<BatchOutcome> BatchRunner::run(const std::vector<BacktestJob>& jobs) const {
    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(jobs.size());

    LOG_INFO("Batch of {} backtests, max_parallel={}", jobs.size(), max_parallel_);

    const size_t wave = static_cast<size_t>(max_parallel_);
    for (size_t start = 0; start < jobs.size(); start += wave) {
        const size_t end = std::min(jobs.size(), start + wave);

        std::vector<std::future<BatchOutcome>> futures;
        futures.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async,
                [&job = jobs[i], options = options_]() { return runJob(job, options); }
            ));
        }

        for (auto& future : futures) {
            outcomes.push_back(future.get());
        }
    }

    const auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                      [](const BatchOutcome& o) { return !o.ok; });
    LOG_INFO("Batch completed: {} ok, {} failed", outcomes.size() - static_cast<size_t>(failed), failed);
    return outcomes;
}

} // namespace backtest
} // namespace tradelab
