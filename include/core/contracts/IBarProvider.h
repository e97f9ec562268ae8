#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace tradelab {
namespace core {

// Upstream source of indicator-annotated bars.
class IBarProvider {
public:
    virtual ~IBarProvider() = default;

    // nullopt when the fetch itself failed; an empty vector when the source had no rows.
    virtual std::optional<std::vector<Bar>> fetch(const std::string& symbol,
                                                  const std::string& period,
                                                  const std::string& interval) = 0;
};

} // namespace core
} // namespace tradelab
