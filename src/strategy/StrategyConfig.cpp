#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tradelab {
namespace strategy {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const nlohmann::json& requireObject(const nlohmann::json& parent,
                                    const std::string& key,
                                    const std::string& path) {
    if (!parent.contains(key)) {
        throw ConfigurationError(path, "missing");
    }
    const auto& node = parent.at(key);
    if (!node.is_object()) {
        throw ConfigurationError(path, "expected an object");
    }
    return node;
}

double requireNumber(const nlohmann::json& parent,
                     const std::string& key,
                     const std::string& path) {
    if (!parent.contains(key)) {
        throw ConfigurationError(path, "missing");
    }
    const auto& node = parent.at(key);
    if (!node.is_number()) {
        throw ConfigurationError(path, "expected a number");
    }
    return node.get<double>();
}

std::vector<double> readLevels(const nlohmann::json& tp) {
    std::vector<double> levels;
    if (tp.contains("values")) {
        const auto& values = tp.at("values");
        if (!values.is_array()) {
            throw ConfigurationError("trade.take_profit.values", "expected an array");
        }
        for (const auto& v : values) {
            if (!v.is_number()) {
                throw ConfigurationError("trade.take_profit.values", "expected numbers");
            }
            levels.push_back(v.get<double>());
        }
    } else if (tp.contains("value")) {
        levels.push_back(requireNumber(tp, "value", "trade.take_profit.value"));
    } else {
        throw ConfigurationError("trade.take_profit", "needs 'value' or 'values'");
    }
    return levels;
}

SignalType inferSignalType(const nlohmann::json& j) {
    if (j.contains("validation") && j["validation"].is_object()) {
        const auto& v = j["validation"];
        if (v.contains("macd")) {
            return SignalType::MACD_MOMENTUM;
        }
        if (v.contains("rsi")) {
            return SignalType::RSI_REVERSAL;
        }
    }
    throw ConfigurationError("signal_type", "missing and cannot be inferred from 'validation'");
}
}

std::string toString(SignalType type) {
    switch (type) {
        case SignalType::MACD_MOMENTUM: return "macd_momentum";
        case SignalType::RSI_REVERSAL: return "rsi_reversal";
        case SignalType::BREAKOUT: return "breakout";
    }
    return "macd_momentum";
}

std::string toString(TakeProfitType type) {
    return type == TakeProfitType::LEVELS ? "levels" : "fixed";
}

SignalType parseSignalType(const std::string& value) {
    const std::string name = toLowerCopy(value);
    if (name == "macd_momentum") return SignalType::MACD_MOMENTUM;
    if (name == "rsi_reversal") return SignalType::RSI_REVERSAL;
    if (name == "breakout") return SignalType::BREAKOUT;
    throw ConfigurationError("signal_type", "unknown signal type '" + value + "'");
}

void StrategyConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigurationError("portfolio.size", "must be > 0");
    }
    if (!std::isfinite(max_risk_per_trade_pct) ||
        max_risk_per_trade_pct <= 0.0 || max_risk_per_trade_pct > 100.0) {
        throw ConfigurationError("position_sizing.max_risk_per_trade", "must be in (0, 100]");
    }
    if (!std::isfinite(stop_loss.value_pct) || stop_loss.value_pct <= 0.0) {
        throw ConfigurationError("trade.stop_loss.value", "must be > 0");
    }
    if (stop_loss.value_pct >= 100.0) {
        throw ConfigurationError("trade.stop_loss.value", "must be < 100");
    }

    const auto& levels = take_profit.levels_pct;
    if (levels.empty()) {
        throw ConfigurationError("trade.take_profit", "no take-profit level configured");
    }
    if (take_profit.type == TakeProfitType::FIXED && levels.size() != 1) {
        throw ConfigurationError("trade.take_profit.value", "fixed take-profit takes exactly one value");
    }
    for (size_t i = 0; i < levels.size(); ++i) {
        if (!std::isfinite(levels[i]) || levels[i] <= 0.0) {
            throw ConfigurationError("trade.take_profit.values", "every level must be > 0");
        }
        if (i > 0 && levels[i] <= levels[i - 1]) {
            throw ConfigurationError("trade.take_profit.values", "levels must be strictly ascending");
        }
    }
}

StrategyConfig strategyConfigFromJson(const std::string& name, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError(name, "strategy entry must be an object");
    }

    StrategyConfig config;
    config.name = name;
    if (j.contains("name") && j["name"].is_string()) {
        config.display_name = j["name"].get<std::string>();
    }

    if (j.contains("signal_type")) {
        if (!j["signal_type"].is_string()) {
            throw ConfigurationError("signal_type", "expected a string");
        }
        config.signal_type = parseSignalType(j["signal_type"].get<std::string>());
    } else {
        config.signal_type = inferSignalType(j);
    }

    const auto& portfolio = requireObject(j, "portfolio", "portfolio");
    config.initial_capital = requireNumber(portfolio, "size", "portfolio.size");

    const auto& sizing = requireObject(j, "position_sizing", "position_sizing");
    config.max_risk_per_trade_pct =
        requireNumber(sizing, "max_risk_per_trade", "position_sizing.max_risk_per_trade");
    if (sizing.contains("max_position_size") && sizing["max_position_size"].is_number()) {
        config.max_position_size_pct = sizing["max_position_size"].get<double>();
    }

    const auto& trade = requireObject(j, "trade", "trade");
    const auto& sl = requireObject(trade, "stop_loss", "trade.stop_loss");
    config.stop_loss.value_pct = requireNumber(sl, "value", "trade.stop_loss.value");
    if (sl.contains("type") && sl["type"].is_string()) {
        config.stop_loss.type = sl["type"].get<std::string>();
    }

    const auto& tp = requireObject(trade, "take_profit", "trade.take_profit");
    const std::string tp_type = (tp.contains("type") && tp["type"].is_string())
        ? toLowerCopy(tp["type"].get<std::string>())
        : std::string("fixed");
    if (tp_type == "levels") {
        config.take_profit.type = TakeProfitType::LEVELS;
    } else if (tp_type == "fixed") {
        config.take_profit.type = TakeProfitType::FIXED;
    } else {
        throw ConfigurationError("trade.take_profit.type", "unknown type '" + tp_type + "'");
    }
    config.take_profit.levels_pct = readLevels(tp);
    std::sort(config.take_profit.levels_pct.begin(), config.take_profit.levels_pct.end());

    if (j.contains("timeframe") && j["timeframe"].is_string()) {
        config.timeframe = j["timeframe"].get<std::string>();
    }
    if (j.contains("market_type") && j["market_type"].is_string()) {
        config.market_type = j["market_type"].get<std::string>();
    }

    config.validate();
    return config;
}

nlohmann::json strategyConfigToJson(const StrategyConfig& config) {
    nlohmann::json j;
    if (!config.display_name.empty()) {
        j["name"] = config.display_name;
    }
    j["signal_type"] = toString(config.signal_type);
    if (!config.timeframe.empty()) {
        j["timeframe"] = config.timeframe;
    }
    if (!config.market_type.empty()) {
        j["market_type"] = config.market_type;
    }
    j["portfolio"]["size"] = config.initial_capital;
    j["position_sizing"]["type"] = "risk_based";
    j["position_sizing"]["max_risk_per_trade"] = config.max_risk_per_trade_pct;
    if (config.max_position_size_pct > 0.0) {
        j["position_sizing"]["max_position_size"] = config.max_position_size_pct;
    }
    j["trade"]["stop_loss"]["type"] = config.stop_loss.type;
    j["trade"]["stop_loss"]["value"] = config.stop_loss.value_pct;

    auto& tp = j["trade"]["take_profit"];
    tp["type"] = toString(config.take_profit.type);
    if (config.take_profit.type == TakeProfitType::LEVELS) {
        tp["values"] = config.take_profit.levels_pct;
    } else if (!config.take_profit.levels_pct.empty()) {
        tp["value"] = config.take_profit.levels_pct.front();
    }
    return j;
}

} // namespace strategy
} // namespace tradelab
