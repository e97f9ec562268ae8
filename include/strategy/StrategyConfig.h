#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradelab {
namespace strategy {

enum class SignalType {
    MACD_MOMENTUM,
    RSI_REVERSAL,
    BREAKOUT
};

enum class TakeProfitType {
    FIXED,      // single target
    LEVELS      // ascending targets, first reached wins
};

struct StopLossRule {
    std::string type = "entry_price";   // entry_price | atr (percent value drives both)
    double value_pct = 0.0;
};

struct TakeProfitRule {
    TakeProfitType type = TakeProfitType::FIXED;
    std::vector<double> levels_pct;     // ascending
};

// Validated, immutable description of one strategy. Passed by value into a run.
struct StrategyConfig {
    std::string name;          // store key
    std::string display_name;  // human-readable "name" field of the document, may be empty
    SignalType signal_type = SignalType::MACD_MOMENTUM;

    double initial_capital = 0.0;
    double max_risk_per_trade_pct = 0.0;
    double max_position_size_pct = 0.0;  // informational, not used by sizing

    StopLossRule stop_loss;
    TakeProfitRule take_profit;

    std::string timeframe;
    std::string market_type;

    // Throws ConfigurationError naming the first offending field.
    void validate() const;
};

std::string toString(SignalType type);
std::string toString(TakeProfitType type);

// Throws ConfigurationError for unknown names.
SignalType parseSignalType(const std::string& value);

// Parses the persisted document shape:
//   { "signal_type": "...", "portfolio": {"size": ...},
//     "position_sizing": {"max_risk_per_trade": ...},
//     "trade": {"stop_loss": {"value": ...},
//               "take_profit": {"type": "levels", "values": [...]} } }
// When signal_type is absent it is inferred from a "validation" block holding
// "macd" or "rsi" rules. Levels are sorted ascending. The result is validated.
StrategyConfig strategyConfigFromJson(const std::string& name, const nlohmann::json& j);

nlohmann::json strategyConfigToJson(const StrategyConfig& config);

} // namespace strategy
} // namespace tradelab
