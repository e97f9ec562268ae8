#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include "risk/PositionTracker.h"
#include "strategy/SignalEvaluator.h"

#include <utility>

namespace tradelab {
namespace backtest {

namespace {
bool isStrictlyAscending(const std::vector<Bar>& bars) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            return false;
        }
    }
    return true;
}

// Price for the forced close: the final close, or the latest usable close
// before it when the final bar is damaged.
double endOfPeriodPrice(const std::vector<Bar>& bars, double fallback) {
    for (auto it = bars.rbegin(); it != bars.rend(); ++it) {
        if (it->isUsable()) {
            return it->close;
        }
    }
    return fallback;
}
}

BacktestEngine::BacktestEngine(std::string symbol, analytics::StatisticsOptions options)
    : symbol_(std::move(symbol)), options_(options) {}

BacktestResult BacktestEngine::run(const std::optional<std::vector<Bar>>& bars,
                                   const strategy::StrategyConfig& config) const {
    if (!bars) {
        config.validate();
        LOG_WARN("[{}] No bar data returned by provider", symbol_);
        return emptyResult(config, 0);
    }
    return run(*bars, config);
}

BacktestResult BacktestEngine::run(const std::vector<Bar>& bars,
                                   const strategy::StrategyConfig& config) const {
    // Configuration errors abort before any simulation.
    risk::PositionTracker tracker(config);

    if (bars.size() < 2) {
        LOG_WARN("[{}] Need at least 2 bars to backtest, got {}", symbol_, bars.size());
        return emptyResult(config, bars.size());
    }
    if (!isStrictlyAscending(bars)) {
        LOG_WARN("[{}] Bar timestamps are not strictly ascending; results follow input order", symbol_);
    }

    LOG_INFO("[{}] Starting backtest '{}' ({}) with {} bars, capital={:.2f}",
             symbol_, config.name, strategy::toString(config.signal_type),
             bars.size(), config.initial_capital);

    BacktestResult result;
    result.bars_processed = bars.size();
    result.equity_curve.reserve(bars.size());
    result.equity_curve.push_back(config.initial_capital);

    const size_t last = bars.size() - 1;
    for (size_t i = 0; i < last; ++i) {
        const Bar& bar = bars[i];
        const Bar& next_bar = bars[i + 1];
        double equity = result.equity_curve.back();

        if (!next_bar.isUsable()) {
            ++result.unusable_bars;
            LOG_DEBUG("[{}] Execution bar {} unusable, carrying equity forward", symbol_, next_bar.timestamp);
            result.equity_curve.push_back(equity);
            continue;
        }

        const Signal signal = strategy::SignalEvaluator::evaluate(bar, config.signal_type);

        if (!tracker.hasPosition()) {
            // An entry on the final bar could not be held across any bar.
            if (signal != Signal::HOLD && (i + 1) < last) {
                if (!tracker.enterPosition(signal, next_bar)) {
                    ++result.entries_rejected;
                    LOG_DEBUG("[{}] {} signal at {} not filled", symbol_, toString(signal), bar.timestamp);
                }
            }
        } else if (bar.isUsable()) {
            const auto decision = tracker.checkExit(bar, next_bar, signal);
            if (decision) {
                ClosedTrade trade = tracker.exitPosition(*decision, next_bar);
                equity += trade.pnl;
                Logger::getInstance().logTrade(symbol_, trade);
                result.trades.push_back(std::move(trade));
            }
        }

        result.equity_curve.push_back(equity);
    }

    if (tracker.hasPosition()) {
        Bar final_bar = bars.back();
        if (!final_bar.isUsable()) {
            final_bar.close = endOfPeriodPrice(bars, tracker.getPosition()->entry_price);
        }
        ClosedTrade trade = tracker.closeAtEndOfPeriod(final_bar);
        result.equity_curve.back() += trade.pnl;
        Logger::getInstance().logTrade(symbol_, trade);
        result.trades.push_back(std::move(trade));
    }

    result.metrics = analytics::PerformanceStatistics::calculate(
        result.trades, result.equity_curve, options_);

    LOG_INFO("[{}] Backtest completed: trades={}, final_equity={:.2f}, return={:.2f}%",
             symbol_, result.metrics.total_trades, result.equity_curve.back(),
             result.metrics.total_return);
    return result;
}

BacktestResult BacktestEngine::emptyResult(const strategy::StrategyConfig& config, size_t bar_count) const {
    BacktestResult result;
    result.data_unavailable = true;
    result.bars_processed = bar_count;
    result.equity_curve.push_back(config.initial_capital);
    result.metrics = analytics::PerformanceStatistics::calculate(
        result.trades, result.equity_curve, options_);
    return result;
}

} // namespace backtest
} // namespace tradelab
