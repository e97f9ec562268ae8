#include "strategy/StrategyTemplates.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace tradelab {
namespace strategy {

namespace {
nlohmann::json macdMomentumDocument() {
    return {
        {"name", "MACD Momentum Strategy"},
        {"signal_type", "macd_momentum"},
        {"timeframe", "4H"},
        {"market_type", "Uptrend"},
        {"portfolio", {{"size", 50000}}},
        {"position_sizing", {
            {"type", "risk_based"},
            {"max_risk_per_trade", 1.5},
            {"max_position_size", 15}
        }},
        {"validation", {
            {"macd", "5%_max_portfolio"},
            {"histogram", "Positive"}
        }},
        {"trade", {
            {"take_profit", {{"type", "levels"}, {"values", {8, 12}}}},
            {"stop_loss", {{"type", "entry_price"}, {"value", 5}}}
        }}
    };
}

nlohmann::json rsiReversalDocument() {
    return {
        {"name", "RSI Reversal Strategy"},
        {"signal_type", "rsi_reversal"},
        {"timeframe", "1h"},
        {"market_type", "Any"},
        {"portfolio", {{"size", 100000}}},
        {"position_sizing", {
            {"type", "risk_based"},
            {"max_risk_per_trade", 2},
            {"max_position_size", 10}
        }},
        {"validation", {
            {"rsi", {{"oversold", 30}, {"overbought", 70}}},
            {"volume", "1.5x_average"}
        }},
        {"trade", {
            {"take_profit", {{"type", "fixed"}, {"value", 10}}},
            {"stop_loss", {{"type", "atr"}, {"value", 2}}}
        }}
    };
}
}

std::map<std::string, nlohmann::json> StrategyTemplates::documents() {
    return {
        {"macd_momentum", macdMomentumDocument()},
        {"rsi_reversal", rsiReversalDocument()}
    };
}

StrategyConfig StrategyTemplates::get(const std::string& name) {
    const auto docs = documents();
    const auto it = docs.find(name);
    if (it == docs.end()) {
        throw StrategyNotFoundError(name);
    }
    return strategyConfigFromJson(name, it->second);
}

int StrategyTemplates::install(core::IStrategyStore& store, bool overwrite) {
    int written = 0;
    for (const auto& [name, doc] : documents()) {
        if (!overwrite && store.contains(name)) {
            LOG_INFO("Template '{}' already present, skipped", name);
            continue;
        }
        if (store.save(name, strategyConfigFromJson(name, doc))) {
            ++written;
        } else {
            LOG_WARN("Template '{}' could not be saved", name);
        }
    }
    return written;
}

} // namespace strategy
} // namespace tradelab
