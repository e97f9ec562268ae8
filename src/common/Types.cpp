#include "common/Types.h"

#include <cmath>

namespace tradelab {

bool Bar::isUsable() const {
    const double ohlc[] = {open, high, low, close};
    for (double v : ohlc) {
        if (!std::isfinite(v) || v <= 0.0) {
            return false;
        }
    }
    return true;
}

std::string toString(TradeSide side) {
    return side == TradeSide::LONG ? "long" : "short";
}

std::string toString(Signal signal) {
    switch (signal) {
        case Signal::BUY: return "buy";
        case Signal::SELL: return "sell";
        case Signal::HOLD: return "hold";
    }
    return "hold";
}

std::string toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::SIGNAL_REVERSAL: return "signal_reversal";
        case ExitReason::END_OF_PERIOD: return "end_of_period";
    }
    return "end_of_period";
}

} // namespace tradelab
