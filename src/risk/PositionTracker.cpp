#include "risk/PositionTracker.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace tradelab {
namespace risk {

namespace {
// 2^63: the first value a long long cannot hold.
constexpr double MAX_SHARES = 9223372036854775808.0;

double signedPriceDiff(TradeSide side, double entry_price, double exit_price) {
    const double diff = exit_price - entry_price;
    return side == TradeSide::LONG ? diff : -diff;
}

bool isOpposite(TradeSide side, Signal signal) {
    return (side == TradeSide::LONG && signal == Signal::SELL) ||
           (side == TradeSide::SHORT && signal == Signal::BUY);
}
}

PositionTracker::PositionTracker(strategy::StrategyConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

long long PositionTracker::calculateShares(double initial_capital,
                                           double max_risk_pct,
                                           double stop_loss_pct,
                                           double entry_price) {
    if (entry_price <= 0.0 || stop_loss_pct <= 0.0) {
        return 0;
    }
    const double risk_amount = initial_capital * (max_risk_pct / 100.0);
    const double position_value = risk_amount / (stop_loss_pct / 100.0);
    const double shares = std::floor(position_value / entry_price);
    if (!std::isfinite(shares) || shares < 0.0) {
        return 0;
    }
    if (shares >= MAX_SHARES) {
        LOG_WARN("Position of {:.0f} shares does not fit a share count, entry skipped", shares);
        return 0;
    }
    return static_cast<long long>(shares);
}

bool PositionTracker::enterPosition(Signal signal, const Bar& execution_bar) {
    if (position_ || signal == Signal::HOLD) {
        return false;
    }

    const double entry_price = execution_bar.open;
    const long long shares = calculateShares(
        config_.initial_capital,
        config_.max_risk_per_trade_pct,
        config_.stop_loss.value_pct,
        entry_price
    );
    if (shares < 1) {
        LOG_WARN("Entry skipped at {}: sizing gives {} shares at price {:.4f}",
                 execution_bar.timestamp, shares, entry_price);
        return false;
    }

    const double stop_fraction = config_.stop_loss.value_pct / 100.0;

    Position position;
    position.side = (signal == Signal::BUY) ? TradeSide::LONG : TradeSide::SHORT;
    position.entry_price = entry_price;
    position.entry_time = execution_bar.timestamp;
    position.shares = shares;
    position.stop_loss_price = (position.side == TradeSide::LONG)
        ? entry_price * (1.0 - stop_fraction)
        : entry_price * (1.0 + stop_fraction);
    position.take_profit_levels_pct = config_.take_profit.levels_pct;
    position_ = std::move(position);

    LOG_DEBUG("Opened {} position: time={}, price={:.4f}, shares={}, stop={:.4f}",
              toString(position_->side), position_->entry_time, entry_price,
              shares, position_->stop_loss_price);
    return true;
}

std::optional<ExitDecision> PositionTracker::checkExit(const Bar& signal_bar,
                                                       const Bar& execution_bar,
                                                       Signal signal) const {
    if (!position_) {
        return std::nullopt;
    }
    const Position& pos = *position_;

    // 1. Stop-loss against the signal bar's range
    const bool stop_touched = (pos.side == TradeSide::LONG)
        ? (signal_bar.low <= pos.stop_loss_price)
        : (signal_bar.high >= pos.stop_loss_price);
    if (stop_touched) {
        return ExitDecision{ExitReason::STOP_LOSS, toString(ExitReason::STOP_LOSS)};
    }

    // 2. Take-profit on the pnl realised at the execution open
    const double pnl_pct =
        signedPriceDiff(pos.side, pos.entry_price, execution_bar.open) / pos.entry_price * 100.0;
    for (double level : pos.take_profit_levels_pct) {
        if (pnl_pct >= level) {
            return ExitDecision{ExitReason::TAKE_PROFIT, takeProfitLabel(level)};
        }
    }

    // 3. Signal reversal
    if (isOpposite(pos.side, signal)) {
        return ExitDecision{ExitReason::SIGNAL_REVERSAL, toString(ExitReason::SIGNAL_REVERSAL)};
    }

    return std::nullopt;
}

ClosedTrade PositionTracker::exitPosition(const ExitDecision& decision, const Bar& execution_bar) {
    return close(execution_bar.open, execution_bar.timestamp, decision.reason, decision.label);
}

ClosedTrade PositionTracker::closeAtEndOfPeriod(const Bar& final_bar) {
    return close(final_bar.close, final_bar.timestamp, ExitReason::END_OF_PERIOD,
                 toString(ExitReason::END_OF_PERIOD));
}

std::string PositionTracker::takeProfitLabel(double level_pct) {
    return fmt::format("take_profit_{:g}%", level_pct);
}

ClosedTrade PositionTracker::close(double exit_price, BarTime exit_time,
                                   ExitReason reason, const std::string& label) {
    if (!position_) {
        throw std::logic_error("PositionTracker::close called while flat");
    }
    const Position& pos = *position_;
    const double price_diff = signedPriceDiff(pos.side, pos.entry_price, exit_price);

    ClosedTrade trade;
    trade.entry_time = pos.entry_time;
    trade.exit_time = exit_time;
    trade.side = pos.side;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.shares = pos.shares;
    trade.pnl = price_diff * static_cast<double>(pos.shares);
    trade.pnl_pct = price_diff / pos.entry_price * 100.0;
    trade.exit_reason = reason;
    trade.exit_label = label;

    LOG_DEBUG("Closed {} position ({}): exit={:.4f}, pnl={:.2f} ({:.2f}%)",
              toString(trade.side), trade.exit_label, exit_price, trade.pnl, trade.pnl_pct);

    position_.reset();
    return trade;
}

} // namespace risk
} // namespace tradelab
