#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "strategy/StrategyConfig.h"
#include "core/contracts/IStrategyStore.h"

namespace tradelab {
namespace strategy {

// Ready-made strategies shipped with the tool.
class StrategyTemplates {
public:
    // Template name -> persisted document (same shape the store writes).
    static std::map<std::string, nlohmann::json> documents();

    // Throws StrategyNotFoundError for an unknown template name.
    static StrategyConfig get(const std::string& name);

    // Saves every template into the store. Existing entries are left alone
    // unless overwrite is set. Returns the number written.
    static int install(core::IStrategyStore& store, bool overwrite = false);
};

} // namespace strategy
} // namespace tradelab
