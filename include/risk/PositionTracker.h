#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace tradelab {
namespace risk {

struct Position {
    TradeSide side;
    double entry_price;
    BarTime entry_time;
    long long shares;
    double stop_loss_price;
    std::vector<double> take_profit_levels_pct;  // ascending, checked but never consumed

    Position()
        : side(TradeSide::LONG), entry_price(0), entry_time(0)
        , shares(0), stop_loss_price(0)
    {}
};

struct ExitDecision {
    ExitReason reason;
    std::string label;
};

// Owns the single open position of one run and decides when it closes.
//
// Exit priority is fixed: stop-loss, then take-profit, then signal reversal;
// the first condition that holds decides. Fills happen at the execution bar's
// open, except the forced end-of-period close which uses the final close.
class PositionTracker {
public:
    // Throws ConfigurationError if the config is malformed.
    explicit PositionTracker(strategy::StrategyConfig config);

    bool hasPosition() const { return position_.has_value(); }
    const Position* getPosition() const { return position_ ? &*position_ : nullptr; }

    // floor((capital * risk%) / stop% / entry_price); 0 when that does not fit a long long.
    static long long calculateShares(double initial_capital,
                                     double max_risk_pct,
                                     double stop_loss_pct,
                                     double entry_price);

    // Opens a position at execution_bar.open for a BUY/SELL signal.
    // Returns false (and stays flat) when already in a position, on HOLD,
    // or when the sizing rule yields fewer than one share.
    bool enterPosition(Signal signal, const Bar& execution_bar);

    // Evaluated on the signal bar while in position; execution_bar supplies
    // the open used for the take-profit check. Empty when the position stays.
    std::optional<ExitDecision> checkExit(const Bar& signal_bar,
                                          const Bar& execution_bar,
                                          Signal signal) const;

    // Closes at execution_bar.open. Requires an open position.
    ClosedTrade exitPosition(const ExitDecision& decision, const Bar& execution_bar);

    // Forced close at the last bar's close.
    ClosedTrade closeAtEndOfPeriod(const Bar& final_bar);

    static std::string takeProfitLabel(double level_pct);

private:
    ClosedTrade close(double exit_price, BarTime exit_time, ExitReason reason, const std::string& label);

    strategy::StrategyConfig config_;
    std::optional<Position> position_;
};

} // namespace risk
} // namespace tradelab
