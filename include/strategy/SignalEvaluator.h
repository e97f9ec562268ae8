#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace tradelab {
namespace strategy {

// Maps one annotated bar to buy/sell/hold. Pure: no state, never throws.
// A bar missing the indicator columns a rule needs, or an unusable bar, is HOLD.
class SignalEvaluator {
public:
    static Signal evaluate(const Bar& bar, SignalType type);

    // MACD above zero with a positive histogram is BUY, the mirror image is SELL.
    static Signal macdMomentum(const Bar& bar);

    // Oversold (< 30) is BUY, overbought (> 70) is SELL.
    static Signal rsiReversal(const Bar& bar);

    // Close outside the Bollinger bands.
    static Signal breakout(const Bar& bar);

    static constexpr double RSI_OVERSOLD = 30.0;
    static constexpr double RSI_OVERBOUGHT = 70.0;
};

} // namespace strategy
} // namespace tradelab
