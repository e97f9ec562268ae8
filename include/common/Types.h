#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace tradelab {

using Price = double;
using Amount = double;

// Epoch timestamp as delivered by the bar provider (seconds or milliseconds).
using BarTime = long long;

enum class TradeSide { LONG, SHORT };
enum class Signal { BUY, SELL, HOLD };
enum class ExitReason { STOP_LOSS, TAKE_PROFIT, SIGNAL_REVERSAL, END_OF_PERIOD };

// One OHLCV observation plus the indicator columns supplied upstream.
struct Bar {
    BarTime timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    std::optional<double> rsi;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> bb_upper;
    std::optional<double> bb_lower;
    std::optional<double> atr;
    std::optional<double> volume_sma;
    std::map<int, double> sma;  // period -> value (SMA_20, SMA_50, ...)

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(BarTime t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}

    // OHLC finite and positive.
    bool isUsable() const;
};

struct ClosedTrade {
    BarTime entry_time = 0;
    BarTime exit_time = 0;
    TradeSide side = TradeSide::LONG;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    long long shares = 0;
    Amount pnl = 0.0;
    double pnl_pct = 0.0;
    ExitReason exit_reason = ExitReason::END_OF_PERIOD;
    std::string exit_label;  // e.g. "stop_loss", "take_profit_8%"
};

std::string toString(TradeSide side);
std::string toString(Signal signal);
std::string toString(ExitReason reason);

} // namespace tradelab
