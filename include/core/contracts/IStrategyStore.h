#pragma once

#include <string>
#include <vector>

#include "strategy/StrategyConfig.h"

namespace tradelab {
namespace core {

// Named mapping strategy name -> StrategyConfig.
class IStrategyStore {
public:
    virtual ~IStrategyStore() = default;

    // Throws StrategyNotFoundError for unknown names, ConfigurationError for a malformed entry.
    virtual strategy::StrategyConfig load(const std::string& name) = 0;
    virtual bool save(const std::string& name, const strategy::StrategyConfig& config) = 0;
    virtual bool contains(const std::string& name) = 0;
    virtual std::vector<std::string> list() = 0;
};

} // namespace core
} // namespace tradelab
