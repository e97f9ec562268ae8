#include "risk/PositionTracker.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace tradelab;

namespace {
strategy::StrategyConfig makeConfig() {
    strategy::StrategyConfig config;
    config.name = "tracker";
    config.signal_type = strategy::SignalType::RSI_REVERSAL;
    config.initial_capital = 50000.0;
    config.max_risk_per_trade_pct = 1.5;
    config.stop_loss.value_pct = 5.0;
    config.take_profit.type = strategy::TakeProfitType::LEVELS;
    config.take_profit.levels_pct = {8.0, 12.0};
    return config;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
}

int main() {
    // floor(50000 * 1.5% / 5% / 150) = floor(15000 / 150) = 100
    if (risk::PositionTracker::calculateShares(50000.0, 1.5, 5.0, 150.0) != 100) {
        std::cerr << "[TEST] calculateShares mismatch\n";
        return 1;
    }
    assert(risk::PositionTracker::calculateShares(10000.0, 2.0, 5.0, 102.0) == 39);
    assert(risk::PositionTracker::calculateShares(1.0, 2.0, 5.0, 100.0) == 0);
    assert(risk::PositionTracker::calculateShares(1000.0, 2.0, 5.0, 0.0) == 0);

    // Sizes beyond a long long are refused rather than wrapped.
    assert(risk::PositionTracker::calculateShares(1e20, 100.0, 0.01, 1.0) == 0);
    assert(risk::PositionTracker::calculateShares(1e16, 100.0, 10.0, 1.0) > 0);
    {
        auto huge = makeConfig();
        huge.initial_capital = 1e20;
        huge.max_risk_per_trade_pct = 100.0;
        huge.stop_loss.value_pct = 0.01;
        risk::PositionTracker oversized(huge);
        assert(!oversized.enterPosition(Signal::BUY, Bar(1, 1.0, 1.1, 0.9, 1.0, 0)));
        assert(!oversized.hasPosition());
    }

    assert(risk::PositionTracker::takeProfitLabel(8.0) == "take_profit_8%");
    assert(risk::PositionTracker::takeProfitLabel(12.5) == "take_profit_12.5%");

    risk::PositionTracker tracker(makeConfig());
    assert(!tracker.hasPosition());
    assert(tracker.getPosition() == nullptr);
    assert(!tracker.enterPosition(Signal::HOLD, Bar(1, 100, 101, 99, 100, 0)));

    // Long entry and stop placement
    assert(tracker.enterPosition(Signal::BUY, Bar(2, 100, 101, 99, 100, 0)));
    assert(tracker.hasPosition());
    const auto* pos = tracker.getPosition();
    assert(pos->side == TradeSide::LONG);
    assert(pos->shares == 150);
    assert(near(pos->stop_loss_price, 95.0));
    assert(!tracker.enterPosition(Signal::BUY, Bar(3, 100, 101, 99, 100, 0)));

    // Stop-loss takes priority over take-profit and reversal
    {
        const Bar signal_bar(3, 100, 101, 94.0, 97, 0);
        const Bar exec_bar(4, 115, 116, 114, 115, 0);
        const auto decision = tracker.checkExit(signal_bar, exec_bar, Signal::SELL);
        assert(decision && decision->reason == ExitReason::STOP_LOSS);
    }
    // Take-profit over reversal, lowest reached level
    {
        const Bar signal_bar(3, 100, 101, 99, 100, 0);
        const Bar exec_bar(4, 113, 114, 112, 113, 0);
        const auto decision = tracker.checkExit(signal_bar, exec_bar, Signal::SELL);
        assert(decision && decision->reason == ExitReason::TAKE_PROFIT);
        assert(decision->label == "take_profit_8%");
    }
    // Reversal
    {
        const Bar signal_bar(3, 100, 101, 99, 100, 0);
        const Bar exec_bar(4, 101, 102, 100, 101, 0);
        const auto decision = tracker.checkExit(signal_bar, exec_bar, Signal::SELL);
        assert(decision && decision->reason == ExitReason::SIGNAL_REVERSAL);
        assert(!tracker.checkExit(signal_bar, exec_bar, Signal::BUY));
        assert(!tracker.checkExit(signal_bar, exec_bar, Signal::HOLD));

        const auto trade = tracker.exitPosition(*decision, exec_bar);
        assert(!tracker.hasPosition());
        assert(trade.entry_time == 2 && trade.exit_time == 4);
        assert(near(trade.pnl, 150.0));
        assert(near(trade.pnl_pct, 1.0));
        assert(trade.exit_label == "signal_reversal");
    }

    // Short side mirrors the long rules
    assert(tracker.enterPosition(Signal::SELL, Bar(5, 200, 201, 199, 200, 0)));
    pos = tracker.getPosition();
    assert(pos->side == TradeSide::SHORT);
    assert(near(pos->stop_loss_price, 210.0));
    {
        const Bar signal_bar(5, 200, 211, 199, 205, 0);
        const Bar exec_bar(6, 205, 206, 204, 205, 0);
        const auto decision = tracker.checkExit(signal_bar, exec_bar, Signal::HOLD);
        assert(decision && decision->reason == ExitReason::STOP_LOSS);
    }
    {
        const Bar signal_bar(5, 200, 201, 180, 182, 0);
        const Bar exec_bar(6, 180, 181, 179, 180, 0);   // short gains 10%
        const auto decision = tracker.checkExit(signal_bar, exec_bar, Signal::HOLD);
        assert(decision && decision->label == "take_profit_8%");
    }
    const auto forced = tracker.closeAtEndOfPeriod(Bar(7, 190, 191, 189, 190, 0));
    assert(forced.exit_reason == ExitReason::END_OF_PERIOD);
    assert(near(forced.exit_price, 190.0));
    assert(near(forced.pnl, 10.0 * static_cast<double>(forced.shares)));

    bool thrown = false;
    try {
        tracker.closeAtEndOfPeriod(Bar(8, 190, 191, 189, 190, 0));
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);

    auto bad = makeConfig();
    bad.take_profit.levels_pct = {12.0, 8.0};
    thrown = false;
    try {
        risk::PositionTracker rejected(bad);
    } catch (const ConfigurationError& e) {
        thrown = (e.field() == "trade.take_profit.values");
    }
    assert(thrown);

    std::cout << "[TEST] PositionTracker PASSED\n";
    return 0;
}
