#include "strategy/SignalEvaluator.h"

#include <cmath>

namespace tradelab {
namespace strategy {

namespace {
bool hasFinite(const std::optional<double>& v) {
    return v.has_value() && std::isfinite(*v);
}
}

Signal SignalEvaluator::evaluate(const Bar& bar, SignalType type) {
    if (!bar.isUsable()) {
        return Signal::HOLD;
    }

    switch (type) {
        case SignalType::MACD_MOMENTUM: return macdMomentum(bar);
        case SignalType::RSI_REVERSAL: return rsiReversal(bar);
        case SignalType::BREAKOUT: return breakout(bar);
    }
    return Signal::HOLD;
}

Signal SignalEvaluator::macdMomentum(const Bar& bar) {
    if (!hasFinite(bar.macd) || !hasFinite(bar.macd_signal)) {
        return Signal::HOLD;
    }

    const double macd = *bar.macd;
    const double histogram = macd - *bar.macd_signal;

    if (histogram > 0.0 && macd > 0.0) {
        return Signal::BUY;
    }
    if (histogram < 0.0 && macd < 0.0) {
        return Signal::SELL;
    }
    return Signal::HOLD;
}

Signal SignalEvaluator::rsiReversal(const Bar& bar) {
    if (!hasFinite(bar.rsi)) {
        return Signal::HOLD;
    }

    if (*bar.rsi < RSI_OVERSOLD) {
        return Signal::BUY;
    }
    if (*bar.rsi > RSI_OVERBOUGHT) {
        return Signal::SELL;
    }
    return Signal::HOLD;
}

Signal SignalEvaluator::breakout(const Bar& bar) {
    if (!hasFinite(bar.bb_upper) || !hasFinite(bar.bb_lower)) {
        return Signal::HOLD;
    }

    if (bar.close > *bar.bb_upper) {
        return Signal::BUY;
    }
    if (bar.close < *bar.bb_lower) {
        return Signal::SELL;
    }
    return Signal::HOLD;
}

} // namespace strategy
} // namespace tradelab
